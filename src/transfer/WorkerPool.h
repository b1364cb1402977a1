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

#ifndef S3XFER_TRANSFER_WORKERPOOL_H_
#define S3XFER_TRANSFER_WORKERPOOL_H_

#include <stddef.h>  // for size_t

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"

#include "transfer/Part.h"

namespace S3Xfer {
namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Transfer {

typedef boost::function<PartOutcome(const Part &)> PartTransport;
typedef boost::function<bool()> ContinuePredicate;
typedef boost::function<void(const PartOutcome &)> PartCompletedCallback;

//
// WorkerPool
//
// Runs a part transport over a list of parts with at most
// concurrencyLimit parts executing at once.
//
class WorkerPool : private boost::noncopyable {
 public:
  explicit WorkerPool(size_t concurrencyLimit);
  ~WorkerPool();

 public:
  // Run transport for each part
  //
  // @param  : parts in index order, transport, predicate checked before
  //           each submission, callback invoked on a worker thread after
  //           each part
  // @return : one outcome per part in index order
  //
  // Parts are submitted in index order. After the first failed part, or
  // once shouldContinue returns false, no more parts are submitted; parts
  // in flight are waited for before returning. Parts never submitted are
  // reported as failed and not attempted.
  PartOutcomeList Run(
      const PartList &parts, const PartTransport &transport,
      const ContinuePredicate &shouldContinue = ContinuePredicate(),
      const PartCompletedCallback &onCompleted = PartCompletedCallback());

  size_t GetConcurrencyLimit() const { return m_concurrencyLimit; }

 private:
  size_t m_concurrencyLimit;
  boost::scoped_ptr<S3Xfer::Threading::ThreadPool> m_executor;
};

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_WORKERPOOL_H_
