// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef S3XFER_BASE_THREADPOOL_H_
#define S3XFER_BASE_THREADPOOL_H_

#include <stddef.h>

#include <list>
#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace S3Xfer {

namespace Threading {

class TaskHandle;

typedef boost::function<void()> Task;

//
// ThreadPool
//
// A fixed number of worker threads draining one shared task queue.
// Worker threads are started on construction; tasks still queued when the
// pool is destroyed are dropped, so owners wait for their own work first.
// Tasks must not throw.
//
class ThreadPool : private boost::noncopyable {
 public:
  // @param  : number of worker threads, 0 is taken as 1
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  size_t GetPoolSize() const { return m_poolSize; }

  // Queue a task behind the ones already queued
  void SubmitToThread(const Task &task);

 private:
  Task *PopTask();
  bool HasTasks();

  // After this has been called once, queued tasks are never handled
  void StopProcessing();

 private:
  size_t m_poolSize;
  std::list<Task *> m_tasks;
  boost::mutex m_queueLock;
  std::vector<TaskHandle *> m_taskHandles;
  boost::mutex m_syncLock;
  boost::condition_variable m_syncConditionVar;

  friend class TaskHandle;
  friend class ThreadPoolTest;
};

}  // namespace Threading
}  // namespace S3Xfer

#endif  // S3XFER_BASE_THREADPOOL_H_
