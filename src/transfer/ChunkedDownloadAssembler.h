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

#ifndef S3XFER_TRANSFER_CHUNKEDDOWNLOADASSEMBLER_H_
#define S3XFER_TRANSFER_CHUNKEDDOWNLOADASSEMBLER_H_

#include <stdint.h>  // for uint64_t

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ObjectStoreClient.h"
#include "client/TransferError.h"
#include "data/LocalFile.h"
#include "transfer/Part.h"
#include "transfer/WorkerPool.h"

namespace S3Xfer {
namespace Transfer {

class PartTransporter;

//
// ChunkedDownloadAssembler
//
// Concurrent ranged reads of one pinned object version, each written at
// its own offset of a staging file pre-sized to the object length. The
// destination appears under its final name only after Finalize succeeds;
// otherwise the staging file is removed.
//
class ChunkedDownloadAssembler : private boost::noncopyable {
 public:
  ChunkedDownloadAssembler(
      const boost::shared_ptr<PartTransporter> &transporter,
      const S3Xfer::Client::ObjectVersion &version,
      const std::string &destination);

  ~ChunkedDownloadAssembler() {}

 public:
  // Create the staging file
  //
  // @param  : object size
  // @return : INCONSISTENT_SOURCE if the version can not be pinned,
  //           LOCAL_IO if the staging file can not be created
  S3Xfer::Client::TransferClientError Prepare(uint64_t objectSize);

  PartOutcomeList DownloadParts(
      WorkerPool *pool, const PartList &parts,
      const ContinuePredicate &shouldContinue = ContinuePredicate(),
      const PartCompletedCallback &onCompleted = PartCompletedCallback());

  // Transport handed to the worker pool
  PartOutcome DownloadPart(const Part &part);

  // Verify every part succeeded and the byte count matches, then move the
  // staging file to the destination
  //
  // @param  : outcomes in index order
  // @return : INCOMPLETE_TRANSFER on a failed part or byte mismatch
  S3Xfer::Client::TransferClientError Finalize(
      const PartOutcomeList &outcomes);

  void Discard();

 public:
  uint64_t GetBytesWritten() const;
  uint64_t GetObjectSize() const { return m_objectSize; }
  const S3Xfer::Client::ObjectVersion &GetVersion() const { return m_version; }
  const S3Xfer::Data::StagedFile &GetStagedFile() const {
    return m_stagedFile;
  }

 private:
  boost::shared_ptr<PartTransporter> m_transporter;
  S3Xfer::Client::ObjectVersion m_version;
  S3Xfer::Data::StagedFile m_stagedFile;
  uint64_t m_objectSize;
  uint64_t m_bytesWritten;
  mutable boost::mutex m_bytesWrittenLock;
};

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_CHUNKEDDOWNLOADASSEMBLER_H_
