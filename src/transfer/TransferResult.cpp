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

#include "transfer/TransferResult.h"

#include <string>

#include "boost/exception/to_string.hpp"

namespace S3Xfer {
namespace Transfer {

using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
string TransferResult::ToString() const {
  string str = "[status:" + GetTransferStatusName(status) +
               ", bytes:" + to_string(bytesTransferred) +
               ", strategy:" + GetTransferStrategyName(strategy) +
               ", parts:" + to_string(partCount);
  if (!eTag.empty()) {
    str += ", etag:" + eTag;
  }
  if (!IsSuccess() && status != TransferStatus::NotStarted) {
    str += ", error:" + S3Xfer::Client::GetMessageForTransferError(error);
  }
  return str + "]";
}

}  // namespace Transfer
}  // namespace S3Xfer
