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

#include "transfer/CancellationToken.h"

#include "boost/date_time/posix_time/posix_time_types.hpp"
#include "boost/thread/thread_time.hpp"
#include "boost/thread/locks.hpp"

namespace S3Xfer {
namespace Transfer {

// --------------------------------------------------------------------------
void CancellationToken::Cancel() {
  {
    boost::lock_guard<boost::mutex> locker(m_cancelLock);
    m_cancel = true;
  }
  m_cancelSignal.notify_all();
}

// --------------------------------------------------------------------------
bool CancellationToken::IsCancelled() const {
  boost::lock_guard<boost::mutex> locker(m_cancelLock);
  return m_cancel;
}

// --------------------------------------------------------------------------
bool CancellationToken::SleepFor(uint32_t milliseconds) const {
  boost::system_time deadline = boost::get_system_time() +
                                boost::posix_time::milliseconds(milliseconds);
  boost::unique_lock<boost::mutex> lock(m_cancelLock);
  while (!m_cancel) {
    if (!m_cancelSignal.timed_wait(lock, deadline)) {
      break;
    }
  }
  return m_cancel;
}

}  // namespace Transfer
}  // namespace S3Xfer
