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

#include "transfer/ByteRangePlanner.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "configure/Default.h"

namespace S3Xfer {
namespace Transfer {

using boost::to_string;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::TransferError;
using S3Xfer::Configure::Default::GetMaxMultipartPartCount;
using S3Xfer::Configure::Default::GetSingleDownloadMaxSize;
using S3Xfer::Configure::Default::GetSingleUploadMaxSize;
using S3Xfer::Configure::Default::GetUploadMultipartMinPartSize;
using S3Xfer::StringUtils::FormatByteSize;
using std::string;

// --------------------------------------------------------------------------
string TransferPlan::ToString() const {
  return "[strategy:" + GetTransferStrategyName(strategy) +
         ", size:" + to_string(objectSize) +
         ", chunk:" + to_string(chunkSize) +
         ", parts:" + to_string(parts.size()) + "]";
}

namespace ByteRangePlanner {

namespace {

// --------------------------------------------------------------------------
PlanOutcome InvalidPlan(const string &message) {
  return PlanOutcome(MakeTransferError(TransferError::INVALID_CONFIGURATION,
                                       "InvalidTransferPlan", message));
}

// --------------------------------------------------------------------------
bool IsOverrideCompatible(TransferDirection::Value direction,
                          StrategyOverride::Value strategyOverride) {
  if (direction == TransferDirection::Upload) {
    return strategyOverride != StrategyOverride::ForceChunked;
  }
  return strategyOverride != StrategyOverride::ForceMultipart;
}

}  // namespace

// --------------------------------------------------------------------------
PlanOutcome Plan(TransferDirection::Value direction, uint64_t objectSize,
                 int64_t chunkSize, int workerCount,
                 StrategyOverride::Value strategyOverride) {
  if (chunkSize <= 0) {
    return InvalidPlan("Chunk size must be positive, got " +
                       to_string(chunkSize));
  }
  if (workerCount <= 0) {
    return InvalidPlan("Worker count must be positive, got " +
                       to_string(workerCount));
  }
  if (!IsOverrideCompatible(direction, strategyOverride)) {
    return InvalidPlan(GetStrategyOverrideName(strategyOverride) +
                       " is not supported for " +
                       GetTransferDirectionName(direction));
  }

  TransferPlan plan;
  plan.objectSize = objectSize;
  plan.chunkSize = static_cast<uint64_t>(chunkSize);
  bool isUpload = direction == TransferDirection::Upload;

  if (objectSize == 0) {
    plan.strategy = TransferStrategy::SingleShot;
    plan.parts.push_back(Part(0, 0, 0));
    return PlanOutcome(plan);
  }

  bool split = false;
  switch (strategyOverride) {
    case StrategyOverride::ForceSingle:
      split = false;
      break;
    case StrategyOverride::ForceMultipart:
    case StrategyOverride::ForceChunked:
      split = true;
      break;
    default:
      split = objectSize > plan.chunkSize;
      break;
  }

  if (!split) {
    uint64_t limit =
        isUpload ? GetSingleUploadMaxSize() : GetSingleDownloadMaxSize();
    if (objectSize > limit) {
      return InvalidPlan("Single " + GetTransferDirectionName(direction) +
                         " of " + FormatByteSize(objectSize) +
                         " exceeds limit " + FormatByteSize(limit));
    }
    plan.strategy = TransferStrategy::SingleShot;
    plan.parts.push_back(Part(0, 0, objectSize));
    DebugInfo("Planned " + plan.ToString());
    return PlanOutcome(plan);
  }

  uint64_t count = (objectSize + plan.chunkSize - 1) / plan.chunkSize;
  if (isUpload) {
    if (count > GetMaxMultipartPartCount()) {
      return InvalidPlan(
          "Multipart upload of " + FormatByteSize(objectSize) + " with chunk " +
          FormatByteSize(plan.chunkSize) + " needs " + to_string(count) +
          " parts, store allows " + to_string(GetMaxMultipartPartCount()));
    }
    if (plan.chunkSize > GetSingleUploadMaxSize()) {
      return InvalidPlan("Chunk " + FormatByteSize(plan.chunkSize) +
                         " exceeds part size limit " +
                         FormatByteSize(GetSingleUploadMaxSize()));
    }
    WarningIf(count > 1 && plan.chunkSize < GetUploadMultipartMinPartSize(),
              "Chunk " + FormatByteSize(plan.chunkSize) +
                  " is below the store minimum part size " +
                  FormatByteSize(GetUploadMultipartMinPartSize()) +
                  ", the store may reject completion");
  } else if (plan.chunkSize > GetSingleDownloadMaxSize()) {
    return InvalidPlan("Chunk " + FormatByteSize(plan.chunkSize) +
                       " exceeds download buffer limit " +
                       FormatByteSize(GetSingleDownloadMaxSize()));
  }

  plan.strategy =
      isUpload ? TransferStrategy::Multipart : TransferStrategy::Chunked;
  plan.parts.reserve(static_cast<size_t>(count));
  uint64_t begin = 0;
  for (uint64_t i = 0; i < count; ++i) {
    uint64_t size = objectSize - begin;
    if (size > plan.chunkSize) {
      size = plan.chunkSize;
    }
    plan.parts.push_back(Part(static_cast<size_t>(i), begin, size));
    begin += size;
  }
  DebugInfo("Planned " + plan.ToString());
  return PlanOutcome(plan);
}

// --------------------------------------------------------------------------
bool IsContiguous(const PartList &parts, uint64_t objectSize) {
  if (parts.empty()) {
    return false;
  }
  uint64_t expectedBegin = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    const Part &part = parts[i];
    if (part.GetIndex() != i || part.GetRangeBegin() != expectedBegin) {
      return false;
    }
    if (part.IsEmpty() && parts.size() > 1) {
      return false;
    }
    expectedBegin += part.GetSize();
  }
  return expectedBegin == objectSize;
}

}  // namespace ByteRangePlanner

}  // namespace Transfer
}  // namespace S3Xfer
