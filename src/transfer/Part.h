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

#ifndef S3XFER_TRANSFER_PART_H_
#define S3XFER_TRANSFER_PART_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

#include <string>
#include <vector>

#include "client/TransferError.h"

namespace S3Xfer {
namespace Transfer {

//
// Part
//
// One byte range of a transfer. Index is 0-based, the store's part number
// is index + 1. A part of size 0 only appears in the plan of an empty
// object.
//
class Part {
 public:
  Part(size_t index = 0, uint64_t rangeBegin = 0, uint64_t size = 0)
      : m_index(index), m_rangeBegin(rangeBegin), m_size(size) {}

 public:
  size_t GetIndex() const { return m_index; }
  int GetPartNumber() const { return static_cast<int>(m_index) + 1; }
  uint64_t GetRangeBegin() const { return m_rangeBegin; }
  uint64_t GetSize() const { return m_size; }
  bool IsEmpty() const { return m_size == 0; }

  // Inclusive end of the range, only meaningful for a non empty part
  uint64_t GetRangeEnd() const { return m_rangeBegin + m_size - 1; }

  std::string ToString() const;

  bool operator==(const Part &other) const {
    return m_index == other.m_index && m_rangeBegin == other.m_rangeBegin &&
           m_size == other.m_size;
  }

 private:
  size_t m_index;
  uint64_t m_rangeBegin;
  uint64_t m_size;  // in bytes
};

typedef std::vector<Part> PartList;

struct PartOutcome {
  size_t index;
  bool success;
  bool attempted;             // false if the part was never handed to a worker
  std::string eTag;           // upload only
  uint64_t bytesTransferred;  // in bytes
  S3Xfer::Client::TransferClientError error;

  PartOutcome()
      : index(0), success(false), attempted(false), bytesTransferred(0) {}

  std::string ToString() const;
};

typedef std::vector<PartOutcome> PartOutcomeList;

PartOutcome MakeSucceededPartOutcome(const Part &part, uint64_t bytes,
                                     const std::string &eTag = std::string());

PartOutcome MakeFailedPartOutcome(
    const Part &part, const S3Xfer::Client::TransferClientError &error);

// Sum of the bytes moved by the successful outcomes
uint64_t GetBytesTransferred(const PartOutcomeList &outcomes);

// First failed outcome in index order, preferring parts that were attempted
//
// @param  : outcomes
// @return : pointer into outcomes, NULL if all succeeded
const PartOutcome *FindFirstFailure(const PartOutcomeList &outcomes);

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_PART_H_
