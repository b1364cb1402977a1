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

#include "transfer/ChunkedDownloadAssembler.h"

#include <string>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "transfer/PartTransporter.h"

namespace S3Xfer {
namespace Transfer {

using boost::shared_ptr;
using boost::to_string;
using S3Xfer::Client::GetMessageForTransferError;
using S3Xfer::Client::IsGoodTransferError;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::ObjectVersion;
using S3Xfer::Client::TransferClientError;
using S3Xfer::Client::TransferError;
using S3Xfer::StringUtils::FormatKey;
using S3Xfer::StringUtils::FormatPath;
using std::string;

// --------------------------------------------------------------------------
ChunkedDownloadAssembler::ChunkedDownloadAssembler(
    const shared_ptr<PartTransporter> &transporter,
    const ObjectVersion &version, const string &destination)
    : m_transporter(transporter),
      m_version(version),
      m_stagedFile(destination),
      m_objectSize(0),
      m_bytesWritten(0) {}

// --------------------------------------------------------------------------
TransferClientError ChunkedDownloadAssembler::Prepare(uint64_t objectSize) {
  if (!m_version.IsStable()) {
    return MakeTransferError(
        TransferError::INCONSISTENT_SOURCE, "UnpinnedVersion",
        "Store exposes neither version id nor etag " +
            FormatKey(m_transporter->GetObjectKey()));
  }
  m_objectSize = objectSize;
  TransferClientError err = m_stagedFile.Create(objectSize);
  if (IsGoodTransferError(err)) {
    DebugInfo("Staging download " +
              FormatPath(m_stagedFile.GetStagingPath()) + " pinned to " +
              m_version.ToString());
  }
  return err;
}

// --------------------------------------------------------------------------
PartOutcomeList ChunkedDownloadAssembler::DownloadParts(
    WorkerPool *pool, const PartList &parts,
    const ContinuePredicate &shouldContinue,
    const PartCompletedCallback &onCompleted) {
  return pool->Run(parts,
                   boost::bind(&ChunkedDownloadAssembler::DownloadPart, this,
                               _1),
                   shouldContinue, onCompleted);
}

// --------------------------------------------------------------------------
PartOutcome ChunkedDownloadAssembler::DownloadPart(const Part &part) {
  PartOutcome outcome =
      m_transporter->DownloadPart(m_version, part, &m_stagedFile);
  if (outcome.success) {
    boost::lock_guard<boost::mutex> locker(m_bytesWrittenLock);
    m_bytesWritten += outcome.bytesTransferred;
  }
  return outcome;
}

// --------------------------------------------------------------------------
TransferClientError ChunkedDownloadAssembler::Finalize(
    const PartOutcomeList &outcomes) {
  const PartOutcome *failure = FindFirstFailure(outcomes);
  if (failure != NULL) {
    Discard();
    return MakeTransferError(TransferError::INCOMPLETE_TRANSFER,
                             "PartFailed",
                             "Cannot finalize with failed part " +
                                 failure->ToString());
  }
  uint64_t written = GetBytesWritten();
  if (written != m_objectSize || GetBytesTransferred(outcomes) != written) {
    Discard();
    return MakeTransferError(
        TransferError::INCOMPLETE_TRANSFER, "ByteCountMismatch",
        "Wrote " + to_string(written) + " bytes of " +
            to_string(m_objectSize) + " " +
            FormatKey(m_transporter->GetObjectKey()));
  }
  TransferClientError err = m_stagedFile.Commit();
  if (!IsGoodTransferError(err)) {
    Error("Fail to commit download: " + GetMessageForTransferError(err));
    Discard();
  }
  return err;
}

// --------------------------------------------------------------------------
void ChunkedDownloadAssembler::Discard() {
  if (!m_stagedFile.IsCommitted()) {
    m_stagedFile.Discard();
  }
}

// --------------------------------------------------------------------------
uint64_t ChunkedDownloadAssembler::GetBytesWritten() const {
  boost::lock_guard<boost::mutex> locker(m_bytesWrittenLock);
  return m_bytesWritten;
}

}  // namespace Transfer
}  // namespace S3Xfer
