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

#ifndef S3XFER_CLIENT_TRANSFERERROR_H_
#define S3XFER_CLIENT_TRANSFERERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace S3Xfer {

namespace Client {

struct TransferError {
  enum Value {
    UNKNOWN,
    GOOD,

    // rejected before any request is sent
    INVALID_CONFIGURATION,

    // request failures, classified by the store client
    TRANSIENT,        // network error, throttling or 5xx
    REQUEST_TIMEOUT,  // request exceeded its timeout
    PERMANENT,        // auth, permission or other 4xx
    NOT_FOUND,        // Not Found (404)

    // transfer level failures
    INCONSISTENT_SOURCE,  // object changed during download
    INCOMPLETE_TRANSFER,  // byte count or part list mismatch
    ABORT_FAILED,         // multipart abort could not release the upload
    CANCELLED,            // caller cancelled the transfer
    LOCAL_IO              // local file could not be read or written
  };
};

typedef ClientError<TransferError::Value> TransferClientError;

std::string TransferErrorToString(TransferError::Value err);

// Only TRANSIENT and REQUEST_TIMEOUT are retryable
bool IsRetryableTransferError(TransferError::Value err);

// Classify a store HTTP status code
//
// @param  : http status code
// @return : GOOD for 2xx, 3xx, TRANSIENT for 429 and 5xx,
//           REQUEST_TIMEOUT for 408, NOT_FOUND for 404,
//           INCONSISTENT_SOURCE for 412, PERMANENT for other codes
TransferError::Value HttpStatusToTransferError(int httpStatus);

// Build an error whose retryable flag follows the error value
TransferClientError MakeTransferError(TransferError::Value err,
                                      const std::string &exceptionName,
                                      const std::string &message);

// Build a success value
TransferClientError MakeGoodTransferError();

std::string GetMessageForTransferError(const TransferClientError &error);
bool IsGoodTransferError(const TransferClientError &error);

}  // namespace Client
}  // namespace S3Xfer

#endif  // S3XFER_CLIENT_TRANSFERERROR_H_
