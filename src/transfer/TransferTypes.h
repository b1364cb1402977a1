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

#ifndef S3XFER_TRANSFER_TRANSFERTYPES_H_
#define S3XFER_TRANSFER_TRANSFERTYPES_H_

#include <string>

namespace S3Xfer {
namespace Transfer {

struct TransferDirection {
  enum Value { Upload, Download };
};

struct TransferStrategy {
  enum Value {
    SingleShot,  // one put or one get covers the whole object
    Multipart,   // multipart upload protocol
    Chunked      // concurrent ranged gets
  };
};

struct StrategyOverride {
  enum Value { Auto, ForceSingle, ForceMultipart, ForceChunked };
};

struct TransferStatus {
  enum Value {
    NotStarted,  // job is created but not run yet
    InProgress,  // job is running
    Succeeded,   // object is transferred completely
    Failed,      // job failed, store side resources are released
    Aborted      // job was cancelled by the caller
  };
};

std::string GetTransferDirectionName(TransferDirection::Value direction);
std::string GetTransferStrategyName(TransferStrategy::Value strategy);
std::string GetStrategyOverrideName(StrategyOverride::Value strategyOverride);
std::string GetTransferStatusName(TransferStatus::Value status);

bool IsTerminalTransferStatus(TransferStatus::Value status);

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_TRANSFERTYPES_H_
