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

#ifndef S3XFER_TRANSFER_TRANSFERRESULT_H_
#define S3XFER_TRANSFER_TRANSFERRESULT_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

#include <string>

#include "client/TransferError.h"
#include "transfer/TransferTypes.h"

namespace S3Xfer {
namespace Transfer {

struct TransferResult {
  TransferStatus::Value status;
  uint64_t bytesTransferred;
  S3Xfer::Client::TransferClientError error;  // GOOD unless failed or aborted
  TransferStrategy::Value strategy;
  size_t partCount;
  std::string eTag;  // tag of the uploaded object

  TransferResult()
      : status(TransferStatus::NotStarted),
        bytesTransferred(0),
        strategy(TransferStrategy::SingleShot),
        partCount(0) {}

  bool IsSuccess() const { return status == TransferStatus::Succeeded; }
  std::string ToString() const;
};

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_TRANSFERRESULT_H_
