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

#include "transfer/TransferTypes.h"

#include <string>

namespace S3Xfer {
namespace Transfer {

using std::string;

// --------------------------------------------------------------------------
string GetTransferDirectionName(TransferDirection::Value direction) {
  return direction == TransferDirection::Upload ? "Upload" : "Download";
}

// --------------------------------------------------------------------------
string GetTransferStrategyName(TransferStrategy::Value strategy) {
  switch (strategy) {
    case TransferStrategy::SingleShot:
      return "SingleShot";
    case TransferStrategy::Multipart:
      return "Multipart";
    case TransferStrategy::Chunked:
      return "Chunked";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
string GetStrategyOverrideName(StrategyOverride::Value strategyOverride) {
  switch (strategyOverride) {
    case StrategyOverride::Auto:
      return "Auto";
    case StrategyOverride::ForceSingle:
      return "ForceSingle";
    case StrategyOverride::ForceMultipart:
      return "ForceMultipart";
    case StrategyOverride::ForceChunked:
      return "ForceChunked";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
string GetTransferStatusName(TransferStatus::Value status) {
  switch (status) {
    case TransferStatus::NotStarted:
      return "NotStarted";
    case TransferStatus::InProgress:
      return "InProgress";
    case TransferStatus::Succeeded:
      return "Succeeded";
    case TransferStatus::Failed:
      return "Failed";
    case TransferStatus::Aborted:
      return "Aborted";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
bool IsTerminalTransferStatus(TransferStatus::Value status) {
  return status == TransferStatus::Succeeded ||
         status == TransferStatus::Failed || status == TransferStatus::Aborted;
}

}  // namespace Transfer
}  // namespace S3Xfer
