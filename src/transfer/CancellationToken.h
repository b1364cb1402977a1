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

#ifndef S3XFER_TRANSFER_CANCELLATIONTOKEN_H_
#define S3XFER_TRANSFER_CANCELLATIONTOKEN_H_

#include <stdint.h>  // for uint32_t

#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace S3Xfer {
namespace Transfer {

//
// CancellationToken
//
// Shared by a job and everything it runs. Once cancelled it stays
// cancelled; sleepers waiting on it are woken up.
//
class CancellationToken : private boost::noncopyable {
 public:
  CancellationToken() : m_cancel(false) {}

 public:
  void Cancel();
  bool IsCancelled() const;

  // Sleep for the given time unless cancelled first
  //
  // @param  : time in milliseconds
  // @return : true if the token is cancelled
  bool SleepFor(uint32_t milliseconds) const;

 private:
  bool m_cancel;
  mutable boost::mutex m_cancelLock;
  mutable boost::condition_variable m_cancelSignal;
};

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_CANCELLATIONTOKEN_H_
