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

#ifndef S3XFER_TRANSFER_TRANSFERREQUEST_H_
#define S3XFER_TRANSFER_TRANSFERREQUEST_H_

#include <stdint.h>  // for int64_t

#include <string>

#include "client/EncryptionContext.h"
#include "client/TransferError.h"
#include "transfer/TransferTypes.h"

namespace S3Xfer {
namespace Transfer {

// Everything a TransferJob needs, fixed once the job starts.
// For uploads localPath is the source, for downloads the destination.
struct TransferRequest {
  TransferDirection::Value direction;
  std::string localPath;
  std::string objectKey;
  std::string versionId;    // download only, empty for the latest version
  std::string contentType;  // upload only, empty to look it up by extension
  int64_t chunkSize;        // in bytes
  int workerCount;
  StrategyOverride::Value strategyOverride;
  S3Xfer::Client::EncryptionContext encryption;

  TransferRequest();

  std::string ToString() const;
};

// Check the fields the planner does not look at
//
// @param  : request
// @return : GOOD or INVALID_CONFIGURATION
S3Xfer::Client::TransferClientError ValidateTransferRequest(
    const TransferRequest &request);

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_TRANSFERREQUEST_H_
