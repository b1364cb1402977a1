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

#ifndef S3XFER_CLIENT_RETRYSTRATEGY_H_
#define S3XFER_CLIENT_RETRYSTRATEGY_H_

#include <stdint.h>

#include "client/TransferError.h"

namespace S3Xfer {

namespace Client {

namespace Retry {
static const uint16_t DefaultScaleFactor = 25;  // in milliseconds
}  // namespace Retry

//
// RetryStrategy
//
// Exponential backoff: the n-th retry waits (2^n * scaleFactor) ms.
//
class RetryStrategy {
 public:
  RetryStrategy(uint16_t maxRetryTimes, uint32_t scaleFactor)
      : m_maxRetryTimes(maxRetryTimes), m_scaleFactor(scaleFactor) {}

  // Return true if the error is retryable and the retry budget is not
  // used up.
  //
  // @param  : error, retries already made for this request
  // @return : bool
  bool ShouldRetry(const TransferClientError &error,
                   uint16_t attemptedRetryTimes) const;

  // @param  : retry ordinal, starting from 1
  // @return : delay in milliseconds, 0 for ordinal 0
  uint32_t CalculateDelayBeforeNextRetry(uint16_t attemptedRetryTimes) const;

  uint16_t GetMaxRetryTimes() const { return m_maxRetryTimes; }
  uint32_t GetScaleFactor() const { return m_scaleFactor; }

 private:
  uint16_t m_maxRetryTimes;
  uint32_t m_scaleFactor;
};

RetryStrategy GetDefaultRetryStrategy();

// Retry strategy with the retries configured on the command line
RetryStrategy GetCustomRetryStrategy();

}  // namespace Client
}  // namespace S3Xfer

#endif  // S3XFER_CLIENT_RETRYSTRATEGY_H_
