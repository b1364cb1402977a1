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

#include "transfer/MultipartCoordinator.h"

#include <string>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/ref.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "data/LocalFile.h"
#include "transfer/PartTransporter.h"

namespace S3Xfer {
namespace Transfer {

using boost::shared_ptr;
using boost::to_string;
using S3Xfer::Client::CompletedPart;
using S3Xfer::Client::CompletedPartList;
using S3Xfer::Client::GetMessageForTransferError;
using S3Xfer::Client::IsGoodTransferError;
using S3Xfer::Client::MakeGoodTransferError;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::TransferClientError;
using S3Xfer::Client::TransferError;
using S3Xfer::Data::LocalFile;
using S3Xfer::StringUtils::FormatKey;
using std::string;

// --------------------------------------------------------------------------
string GetMultipartStateName(MultipartState::Value state) {
  switch (state) {
    case MultipartState::NotStarted:
      return "NotStarted";
    case MultipartState::Initiated:
      return "Initiated";
    case MultipartState::PartsInFlight:
      return "PartsInFlight";
    case MultipartState::Completing:
      return "Completing";
    case MultipartState::Completed:
      return "Completed";
    case MultipartState::Aborting:
      return "Aborting";
    case MultipartState::Aborted:
      return "Aborted";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
void MultipartSession::RecordPart(int partNumber, const string &eTag) {
  boost::lock_guard<boost::mutex> locker(m_partETagsLock);
  m_partETags[partNumber] = eTag;
}

// --------------------------------------------------------------------------
size_t MultipartSession::GetRecordedPartCount() const {
  boost::lock_guard<boost::mutex> locker(m_partETagsLock);
  return m_partETags.size();
}

// --------------------------------------------------------------------------
CompletedPartList MultipartSession::GetCompletedParts() const {
  boost::lock_guard<boost::mutex> locker(m_partETagsLock);
  CompletedPartList parts;
  parts.reserve(m_partETags.size());
  typedef std::map<int, string>::value_type PartETag;
  BOOST_FOREACH (const PartETag &p, m_partETags) {
    parts.push_back(CompletedPart(p.first, p.second));
  }
  return parts;
}

// --------------------------------------------------------------------------
TransferClientError ValidateCompletedParts(const CompletedPartList &parts,
                                           size_t expectedCount) {
  string exceptionName = "InvalidCompletionList";
  if (parts.size() != expectedCount) {
    return MakeTransferError(
        TransferError::INCOMPLETE_TRANSFER, exceptionName,
        "Expect " + to_string(expectedCount) + " parts, got " +
            to_string(parts.size()));
  }
  for (size_t i = 0; i < parts.size(); ++i) {
    int expectedNumber = static_cast<int>(i) + 1;
    if (parts[i].partNumber != expectedNumber) {
      return MakeTransferError(
          TransferError::INCOMPLETE_TRANSFER, exceptionName,
          "Expect part " + to_string(expectedNumber) + " at position " +
              to_string(i) + ", got part " + to_string(parts[i].partNumber));
    }
    if (parts[i].eTag.empty()) {
      return MakeTransferError(
          TransferError::INCOMPLETE_TRANSFER, exceptionName,
          "Missing completion tag of part " + to_string(expectedNumber));
    }
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
MultipartCoordinator::MultipartCoordinator(
    const shared_ptr<PartTransporter> &transporter)
    : m_transporter(transporter), m_state(MultipartState::NotStarted) {}

// --------------------------------------------------------------------------
MultipartCoordinator::~MultipartCoordinator() {
  MultipartState::Value state = GetState();
  if (state == MultipartState::Initiated ||
      state == MultipartState::PartsInFlight ||
      state == MultipartState::Completing) {
    Warning("Aborting unfinished multipart upload " +
            m_session->GetUploadId() + " " +
            FormatKey(m_transporter->GetObjectKey()));
    Abort();
  }
}

// --------------------------------------------------------------------------
TransferClientError MultipartCoordinator::Initiate(const string &contentType) {
  if (GetState() != MultipartState::NotStarted) {
    return MakeTransferError(
        TransferError::UNKNOWN, "InvalidMultipartState",
        "Cannot initiate in state " + GetMultipartStateName(GetState()));
  }
  string uploadId;
  TransferClientError err =
      m_transporter->InitiateMultipartUpload(contentType, &uploadId);
  if (!IsGoodTransferError(err)) {
    SetState(MultipartState::Aborted);
    return err;
  }
  m_session = boost::make_shared<MultipartSession>(uploadId);
  SetState(MultipartState::Initiated);
  Info("Initiated multipart upload " + uploadId + " " +
       FormatKey(m_transporter->GetObjectKey()));
  return err;
}

// --------------------------------------------------------------------------
PartOutcomeList MultipartCoordinator::UploadParts(
    WorkerPool *pool, const PartList &parts, const LocalFile &source,
    const ContinuePredicate &shouldContinue,
    const PartCompletedCallback &onCompleted) {
  SetState(MultipartState::PartsInFlight);
  return pool->Run(parts,
                   boost::bind(&MultipartCoordinator::UploadPart, this, _1,
                               boost::cref(source)),
                   shouldContinue, onCompleted);
}

// --------------------------------------------------------------------------
PartOutcome MultipartCoordinator::UploadPart(const Part &part,
                                             const LocalFile &source) {
  PartOutcome outcome =
      m_transporter->UploadPart(m_session->GetUploadId(), part, source);
  if (outcome.success) {
    m_session->RecordPart(part.GetPartNumber(), outcome.eTag);
  }
  return outcome;
}

// --------------------------------------------------------------------------
TransferClientError MultipartCoordinator::Complete(size_t expectedPartCount,
                                                   string *eTag) {
  if (GetState() != MultipartState::PartsInFlight) {
    return MakeTransferError(
        TransferError::UNKNOWN, "InvalidMultipartState",
        "Cannot complete in state " + GetMultipartStateName(GetState()));
  }
  SetState(MultipartState::Completing);

  CompletedPartList parts = m_session->GetCompletedParts();
  TransferClientError err = ValidateCompletedParts(parts, expectedPartCount);
  if (!IsGoodTransferError(err)) {
    Error("Refuse to complete multipart upload " + m_session->GetUploadId() +
          ": " + GetMessageForTransferError(err));
    Abort();
    return err;
  }

  err = m_transporter->CompleteMultipartUpload(m_session->GetUploadId(),
                                               parts, eTag);
  if (!IsGoodTransferError(err)) {
    Error("Fail to complete multipart upload " + m_session->GetUploadId() +
          ": " + GetMessageForTransferError(err));
    Abort();
    return err;
  }
  SetState(MultipartState::Completed);
  Info("Completed multipart upload " + m_session->GetUploadId() + " with " +
       to_string(parts.size()) + " parts " +
       FormatKey(m_transporter->GetObjectKey()));
  return err;
}

// --------------------------------------------------------------------------
TransferClientError MultipartCoordinator::Abort() {
  {
    boost::lock_guard<boost::mutex> locker(m_stateLock);
    if (m_state == MultipartState::NotStarted) {
      m_state = MultipartState::Aborted;
      return MakeGoodTransferError();
    }
    if (m_state == MultipartState::Completed ||
        m_state == MultipartState::Aborting ||
        m_state == MultipartState::Aborted) {
      return MakeGoodTransferError();
    }
    m_state = MultipartState::Aborting;
  }

  TransferClientError err =
      m_transporter->AbortMultipartUpload(m_session->GetUploadId());
  SetState(MultipartState::Aborted);
  if (!IsGoodTransferError(err)) {
    Warning("Fail to abort multipart upload " + m_session->GetUploadId() +
            ", it may need cleaning up on the store: " +
            GetMessageForTransferError(err));
    return MakeTransferError(TransferError::ABORT_FAILED,
                             err.GetExceptionName(), err.GetMessage());
  }
  Info("Aborted multipart upload " + m_session->GetUploadId() + " " +
       FormatKey(m_transporter->GetObjectKey()));
  return err;
}

// --------------------------------------------------------------------------
MultipartState::Value MultipartCoordinator::GetState() const {
  boost::lock_guard<boost::mutex> locker(m_stateLock);
  return m_state;
}

// --------------------------------------------------------------------------
void MultipartCoordinator::SetState(MultipartState::Value state) {
  boost::lock_guard<boost::mutex> locker(m_stateLock);
  m_state = state;
}

}  // namespace Transfer
}  // namespace S3Xfer
