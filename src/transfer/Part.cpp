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

#include "transfer/Part.h"

#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"

#include "base/StringUtils.h"

namespace S3Xfer {
namespace Transfer {

using boost::to_string;
using S3Xfer::Client::GetMessageForTransferError;
using S3Xfer::Client::TransferClientError;
using std::string;

// --------------------------------------------------------------------------
string Part::ToString() const {
  string range = m_size == 0 ? string("[empty]")
                             : S3Xfer::StringUtils::FormatByteRange(
                                   m_rangeBegin, GetRangeEnd());
  return "[part:" + to_string(GetPartNumber()) + ", range:" + range +
         ", size:" + to_string(m_size) + "]";
}

// --------------------------------------------------------------------------
string PartOutcome::ToString() const {
  string str = "[part:" + to_string(index + 1) +
               ", success:" + (success ? "true" : "false") +
               ", bytes:" + to_string(bytesTransferred);
  if (!eTag.empty()) {
    str += ", etag:" + eTag;
  }
  if (!success) {
    str += attempted ? ", error:" + GetMessageForTransferError(error)
                     : string(", not attempted");
  }
  return str + "]";
}

// --------------------------------------------------------------------------
PartOutcome MakeSucceededPartOutcome(const Part &part, uint64_t bytes,
                                     const string &eTag) {
  PartOutcome outcome;
  outcome.index = part.GetIndex();
  outcome.success = true;
  outcome.attempted = true;
  outcome.eTag = eTag;
  outcome.bytesTransferred = bytes;
  outcome.error = S3Xfer::Client::MakeGoodTransferError();
  return outcome;
}

// --------------------------------------------------------------------------
PartOutcome MakeFailedPartOutcome(const Part &part,
                                  const TransferClientError &error) {
  PartOutcome outcome;
  outcome.index = part.GetIndex();
  outcome.success = false;
  outcome.attempted = true;
  outcome.error = error;
  return outcome;
}

// --------------------------------------------------------------------------
uint64_t GetBytesTransferred(const PartOutcomeList &outcomes) {
  uint64_t total = 0;
  BOOST_FOREACH (const PartOutcome &outcome, outcomes) {
    if (outcome.success) {
      total += outcome.bytesTransferred;
    }
  }
  return total;
}

// --------------------------------------------------------------------------
const PartOutcome *FindFirstFailure(const PartOutcomeList &outcomes) {
  const PartOutcome *notAttempted = NULL;
  BOOST_FOREACH (const PartOutcome &outcome, outcomes) {
    if (outcome.success) {
      continue;
    }
    if (outcome.attempted) {
      return &outcome;
    }
    if (notAttempted == NULL) {
      notAttempted = &outcome;
    }
  }
  return notAttempted;
}

}  // namespace Transfer
}  // namespace S3Xfer
