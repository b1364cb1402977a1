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

#include "client/TransferError.h"

#include <string>
#include <utility>

namespace S3Xfer {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  pair<TransferError::Value, const char *> errToNames[] = {
      // keep in sorted order
      make_pair(TransferError::UNKNOWN, "Unknown"),
      make_pair(TransferError::GOOD, "Good"),
      make_pair(TransferError::INVALID_CONFIGURATION, "InvalidConfiguration"),
      make_pair(TransferError::TRANSIENT, "Transient"),
      make_pair(TransferError::REQUEST_TIMEOUT, "RequestTimeout"),
      make_pair(TransferError::PERMANENT, "Permanent"),
      make_pair(TransferError::NOT_FOUND, "NotFound"),
      make_pair(TransferError::INCONSISTENT_SOURCE, "InconsistentSource"),
      make_pair(TransferError::INCOMPLETE_TRANSFER, "IncompleteTransfer"),
      make_pair(TransferError::ABORT_FAILED, "AbortFailed"),
      make_pair(TransferError::CANCELLED, "Cancelled"),
      make_pair(TransferError::LOCAL_IO, "LocalIO"),
  };

  int n = sizeof(errToNames) / sizeof(errToNames[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (err == errToNames[mid].first) {
      return errToNames[mid].second;
    }
    if (static_cast<int>(err) < static_cast<int>(errToNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
bool IsRetryableTransferError(TransferError::Value err) {
  return err == TransferError::TRANSIENT ||
         err == TransferError::REQUEST_TIMEOUT;
}

// --------------------------------------------------------------------------
TransferError::Value HttpStatusToTransferError(int httpStatus) {
  pair<int, TransferError::Value> specialCodes[] = {
      // keep in sorted order
      make_pair(404, TransferError::NOT_FOUND),
      make_pair(408, TransferError::REQUEST_TIMEOUT),
      make_pair(412, TransferError::INCONSISTENT_SOURCE),
      make_pair(429, TransferError::TRANSIENT),
  };

  int n = sizeof(specialCodes) / sizeof(specialCodes[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (httpStatus == specialCodes[mid].first) {
      return specialCodes[mid].second;
    }
    if (httpStatus < specialCodes[mid].first) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }

  if (httpStatus >= 200 && httpStatus < 400) {
    return TransferError::GOOD;
  } else if (httpStatus >= 500 && httpStatus < 600) {
    return TransferError::TRANSIENT;
  }
  return TransferError::PERMANENT;
}

// --------------------------------------------------------------------------
TransferClientError MakeTransferError(TransferError::Value err,
                                      const string &exceptionName,
                                      const string &message) {
  return TransferClientError(err, exceptionName, message,
                             IsRetryableTransferError(err));
}

// --------------------------------------------------------------------------
TransferClientError MakeGoodTransferError() {
  return TransferClientError(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(const TransferClientError &error) {
  return TransferErrorToString(error.GetError()) + ", " +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const TransferClientError &error) {
  return error.GetError() == TransferError::GOOD;
}

}  // namespace Client
}  // namespace S3Xfer
