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

#ifndef S3XFER_TRANSFER_BYTERANGEPLANNER_H_
#define S3XFER_TRANSFER_BYTERANGEPLANNER_H_

#include <stdint.h>  // for int64_t uint64_t

#include <string>

#include "client/Outcome.hpp"
#include "client/TransferError.h"
#include "transfer/Part.h"
#include "transfer/TransferTypes.h"

namespace S3Xfer {
namespace Transfer {

struct TransferPlan {
  TransferStrategy::Value strategy;
  uint64_t objectSize;
  uint64_t chunkSize;
  PartList parts;  // ordered by index, gapless, covering the whole object

  TransferPlan()
      : strategy(TransferStrategy::SingleShot), objectSize(0), chunkSize(0) {}

  bool IsSingleShot() const { return strategy == TransferStrategy::SingleShot; }
  std::string ToString() const;
};

typedef S3Xfer::Client::Outcome<TransferPlan,
                                S3Xfer::Client::TransferClientError>
    PlanOutcome;

namespace ByteRangePlanner {

// Decide the strategy and the parts of a transfer
//
// @param  : direction, object size, chunk size, worker count, override
// @return : plan, or INVALID_CONFIGURATION
//
// Auto plans one part when the object fits in a chunk, otherwise
// ceil(objectSize / chunkSize) parts, all but the last of chunkSize.
// An empty object is always one empty single shot part.
PlanOutcome Plan(TransferDirection::Value direction, uint64_t objectSize,
                 int64_t chunkSize, int workerCount,
                 StrategyOverride::Value strategyOverride);

// Return true if parts are ordered by index and byte range with no gap and
// no overlap, and together cover exactly objectSize bytes
bool IsContiguous(const PartList &parts, uint64_t objectSize);

}  // namespace ByteRangePlanner

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_BYTERANGEPLANNER_H_
