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

#include "transfer/TransferRequest.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace S3Xfer {
namespace Transfer {

using boost::to_string;
using S3Xfer::Client::MakeGoodTransferError;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::TransferClientError;
using S3Xfer::Client::TransferError;
using std::string;

// --------------------------------------------------------------------------
TransferRequest::TransferRequest()
    : direction(TransferDirection::Upload),
      chunkSize(static_cast<int64_t>(
          S3Xfer::Configure::Default::GetDefaultChunkSize())),
      workerCount(S3Xfer::Configure::Default::GetDefaultWorkerCount()),
      strategyOverride(StrategyOverride::Auto) {}

// --------------------------------------------------------------------------
string TransferRequest::ToString() const {
  string str = "[" + GetTransferDirectionName(direction) +
               " local:" + localPath + ", key:" + objectKey;
  if (!versionId.empty()) {
    str += ", version:" + versionId;
  }
  return str + ", chunk:" + to_string(chunkSize) +
         ", workers:" + to_string(workerCount) +
         ", strategy:" + GetStrategyOverrideName(strategyOverride) +
         ", encryption:" + encryption.ToString() + "]";
}

// --------------------------------------------------------------------------
TransferClientError ValidateTransferRequest(const TransferRequest &request) {
  string exceptionName = "InvalidTransferRequest";
  if (request.objectKey.empty()) {
    return MakeTransferError(TransferError::INVALID_CONFIGURATION,
                             exceptionName, "Empty object key");
  }
  if (request.localPath.empty()) {
    return MakeTransferError(TransferError::INVALID_CONFIGURATION,
                             exceptionName, "Empty local path");
  }
  if (request.direction == TransferDirection::Upload &&
      !request.versionId.empty()) {
    return MakeTransferError(TransferError::INVALID_CONFIGURATION,
                             exceptionName,
                             "Version id only applies to downloads");
  }
  return MakeGoodTransferError();
}

}  // namespace Transfer
}  // namespace S3Xfer
