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

#include "transfer/TransferJob.h"

#include <exception>
#include <string>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "data/LocalFile.h"
#include "data/MimeTypes.h"
#include "transfer/CancellationToken.h"
#include "transfer/ChunkedDownloadAssembler.h"
#include "transfer/MultipartCoordinator.h"
#include "transfer/PartTransporter.h"
#include "transfer/WorkerPool.h"

namespace S3Xfer {
namespace Transfer {

using boost::shared_ptr;
using boost::to_string;
using S3Xfer::Client::GetMessageForTransferError;
using S3Xfer::Client::IsGoodTransferError;
using S3Xfer::Client::MakeGoodTransferError;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::ObjectMeta;
using S3Xfer::Client::ObjectStoreClient;
using S3Xfer::Client::ObjectVersion;
using S3Xfer::Client::RetryStrategy;
using S3Xfer::Client::TransferClientError;
using S3Xfer::Client::TransferError;
using S3Xfer::Data::LocalFile;
using S3Xfer::Data::StagedFile;
using S3Xfer::StringUtils::FormatByteSize;
using S3Xfer::StringUtils::FormatKey;
using S3Xfer::StringUtils::FormatPath;
using std::string;

namespace {

TransferClientError CancelledError() {
  return MakeTransferError(TransferError::CANCELLED, "TransferCancelled",
                           "Transfer cancelled by caller");
}

}  // namespace

// --------------------------------------------------------------------------
TransferJob::TransferJob(const shared_ptr<ObjectStoreClient> &client,
                         const TransferRequest &request,
                         const RetryStrategy &retryStrategy)
    : m_client(client),
      m_request(request),
      m_cancellation(boost::make_shared<CancellationToken>()),
      m_status(TransferStatus::NotStarted),
      m_bytesTransferred(0),
      m_bytesTotalSize(0) {
  m_transporter = boost::make_shared<PartTransporter>(
      m_client, m_request.objectKey, m_request.encryption, retryStrategy,
      m_cancellation);
}

// --------------------------------------------------------------------------
TransferJob::~TransferJob() {
  // do nothing
}

// --------------------------------------------------------------------------
TransferResult TransferJob::Run() {
  {
    boost::unique_lock<boost::mutex> lock(m_statusLock);
    if (m_status != TransferStatus::NotStarted) {
      while (!IsTerminalTransferStatus(m_status)) {
        m_statusConditionVar.wait(lock);
      }
      return m_result;
    }
    m_status = TransferStatus::InProgress;
  }
  m_statusConditionVar.notify_all();

  TransferResult result;
  try {
    result = DoRun();
  } catch (const std::exception &err) {
    result.status = TransferStatus::Failed;
    result.bytesTransferred = GetBytesTransferred();
    result.error = MakeTransferError(TransferError::UNKNOWN,
                                     "UnexpectedException", err.what());
  }

  if (result.status == TransferStatus::Succeeded) {
    Info(GetTransferDirectionName(m_request.direction) + " succeeded " +
         FormatKey(m_request.objectKey) + " " + result.ToString());
  } else if (result.status == TransferStatus::Aborted) {
    Warning(GetTransferDirectionName(m_request.direction) + " aborted " +
            FormatKey(m_request.objectKey) + " " + result.ToString());
  } else {
    Error(GetTransferDirectionName(m_request.direction) + " failed " +
          FormatKey(m_request.objectKey) + " " + result.ToString());
  }

  {
    boost::lock_guard<boost::mutex> locker(m_statusLock);
    m_result = result;
    m_status = result.status;
  }
  m_statusConditionVar.notify_all();
  return result;
}

// --------------------------------------------------------------------------
void TransferJob::Cancel() {
  if (!m_cancellation->IsCancelled()) {
    Info("Cancelling transfer " + FormatKey(m_request.objectKey));
  }
  m_cancellation->Cancel();
}

// --------------------------------------------------------------------------
bool TransferJob::ShouldContinue() const {
  return !m_cancellation->IsCancelled();
}

// --------------------------------------------------------------------------
void TransferJob::WaitUntilFinished() const {
  boost::unique_lock<boost::mutex> lock(m_statusLock);
  while (!IsTerminalTransferStatus(m_status)) {
    m_statusConditionVar.wait(lock);
  }
}

// --------------------------------------------------------------------------
TransferStatus::Value TransferJob::GetStatus() const {
  boost::lock_guard<boost::mutex> locker(m_statusLock);
  return m_status;
}

// --------------------------------------------------------------------------
TransferResult TransferJob::GetResult() const {
  boost::lock_guard<boost::mutex> locker(m_statusLock);
  return m_result;
}

// --------------------------------------------------------------------------
uint64_t TransferJob::GetBytesTransferred() const {
  boost::lock_guard<boost::mutex> locker(m_bytesLock);
  return m_bytesTransferred;
}

// --------------------------------------------------------------------------
uint64_t TransferJob::GetBytesTotalSize() const {
  boost::lock_guard<boost::mutex> locker(m_bytesLock);
  return m_bytesTotalSize;
}

// --------------------------------------------------------------------------
TransferResult TransferJob::DoRun() {
  DebugInfo("Start transfer " + m_request.ToString());
  TransferClientError err = ValidateTransferRequest(m_request);
  if (!IsGoodTransferError(err)) {
    return Finish(TransferPlan(), err);
  }
  if (!ShouldContinue()) {
    return Finish(TransferPlan(), CancelledError());
  }
  return m_request.direction == TransferDirection::Upload ? RunUpload()
                                                          : RunDownload();
}

// --------------------------------------------------------------------------
TransferResult TransferJob::RunUpload() {
  uint64_t objectSize = 0;
  TransferClientError err =
      S3Xfer::Data::GetLocalFileSize(m_request.localPath, &objectSize);
  if (!IsGoodTransferError(err)) {
    return Finish(TransferPlan(), err);
  }
  SetBytesTotalSize(objectSize);

  PlanOutcome outcome = ByteRangePlanner::Plan(
      TransferDirection::Upload, objectSize, m_request.chunkSize,
      m_request.workerCount, m_request.strategyOverride);
  if (!outcome.IsSuccess()) {
    return Finish(TransferPlan(), outcome.GetError());
  }
  const TransferPlan &plan = outcome.GetResult();

  LocalFile source;
  err = source.OpenForRead(m_request.localPath);
  if (!IsGoodTransferError(err)) {
    return Finish(plan, err);
  }

  string contentType = ResolveContentType();
  Info("Uploading " + FormatPath(m_request.localPath) + " to " +
       FormatKey(m_request.objectKey) + " " + FormatByteSize(objectSize) +
       " " + plan.ToString());
  return plan.IsSingleShot() ? RunSingleUpload(plan, source, contentType)
                             : RunMultipartUpload(plan, source, contentType);
}

// --------------------------------------------------------------------------
TransferResult TransferJob::RunSingleUpload(const TransferPlan &plan,
                                            const LocalFile &source,
                                            const string &contentType) {
  PartOutcome outcome =
      m_transporter->PutObject(plan.parts.front(), source, contentType);
  OnPartCompleted(outcome);
  return Finish(plan, outcome.success ? MakeGoodTransferError() : outcome.error,
                outcome.eTag);
}

// --------------------------------------------------------------------------
TransferResult TransferJob::RunMultipartUpload(const TransferPlan &plan,
                                               const LocalFile &source,
                                               const string &contentType) {
  MultipartCoordinator coordinator(m_transporter);
  TransferClientError err = coordinator.Initiate(contentType);
  if (!IsGoodTransferError(err)) {
    return Finish(plan, err);
  }
  if (!ShouldContinue()) {
    AbortUpload(&coordinator);
    return Finish(plan, CancelledError());
  }

  WorkerPool pool(GetWorkerPoolSize(plan));
  PartOutcomeList outcomes = coordinator.UploadParts(
      &pool, plan.parts, source,
      boost::bind(&TransferJob::ShouldContinue, this),
      boost::bind(&TransferJob::OnPartCompleted, this, _1));

  const PartOutcome *failure = FindFirstFailure(outcomes);
  if (failure != NULL || !ShouldContinue()) {
    AbortUpload(&coordinator);
    return Finish(plan, failure != NULL ? failure->error : CancelledError());
  }
  uint64_t uploaded = S3Xfer::Transfer::GetBytesTransferred(outcomes);
  if (uploaded != plan.objectSize) {
    AbortUpload(&coordinator);
    return Finish(plan, MakeTransferError(TransferError::INCOMPLETE_TRANSFER,
                                          "ByteCountMismatch",
                                          "Uploaded " + to_string(uploaded) +
                                              " bytes of " +
                                              to_string(plan.objectSize)));
  }

  string eTag;
  err = coordinator.Complete(plan.parts.size(), &eTag);
  return Finish(plan, err, eTag);
}

// --------------------------------------------------------------------------
TransferResult TransferJob::RunDownload() {
  ObjectMeta meta;
  TransferClientError err =
      m_transporter->HeadObject(m_request.versionId, &meta);
  if (!IsGoodTransferError(err)) {
    return Finish(TransferPlan(), err);
  }
  SetBytesTotalSize(meta.size);

  PlanOutcome outcome = ByteRangePlanner::Plan(
      TransferDirection::Download, meta.size, m_request.chunkSize,
      m_request.workerCount, m_request.strategyOverride);
  if (!outcome.IsSuccess()) {
    return Finish(TransferPlan(), outcome.GetError());
  }
  const TransferPlan &plan = outcome.GetResult();

  ObjectVersion version = meta.version;
  if (version.versionId.empty()) {
    version.versionId = m_request.versionId;
  }
  if (!ShouldContinue()) {
    return Finish(plan, CancelledError());
  }

  Info("Downloading " + FormatKey(m_request.objectKey) + " " +
       version.ToString() + " to " + FormatPath(m_request.localPath) + " " +
       FormatByteSize(meta.size) + " " + plan.ToString());
  return plan.IsSingleShot() ? RunSingleDownload(plan, version)
                             : RunChunkedDownload(plan, version);
}

// --------------------------------------------------------------------------
TransferResult TransferJob::RunSingleDownload(const TransferPlan &plan,
                                              const ObjectVersion &version) {
  StagedFile staged(m_request.localPath);
  TransferClientError err = staged.Create(plan.objectSize);
  if (!IsGoodTransferError(err)) {
    return Finish(plan, err);
  }

  // an empty part writes nothing and sends no request
  PartOutcome outcome =
      m_transporter->DownloadPart(version, plan.parts.front(), &staged);
  OnPartCompleted(outcome);
  if (!outcome.success) {
    staged.Discard();
    return Finish(plan, outcome.error);
  }
  if (!ShouldContinue()) {
    staged.Discard();
    return Finish(plan, CancelledError());
  }
  err = staged.Commit();
  return Finish(plan, err);
}

// --------------------------------------------------------------------------
TransferResult TransferJob::RunChunkedDownload(const TransferPlan &plan,
                                               const ObjectVersion &version) {
  ChunkedDownloadAssembler assembler(m_transporter, version,
                                     m_request.localPath);
  TransferClientError err = assembler.Prepare(plan.objectSize);
  if (!IsGoodTransferError(err)) {
    return Finish(plan, err);
  }

  WorkerPool pool(GetWorkerPoolSize(plan));
  PartOutcomeList outcomes = assembler.DownloadParts(
      &pool, plan.parts, boost::bind(&TransferJob::ShouldContinue, this),
      boost::bind(&TransferJob::OnPartCompleted, this, _1));

  const PartOutcome *failure = FindFirstFailure(outcomes);
  if (failure != NULL || !ShouldContinue()) {
    assembler.Discard();
    return Finish(plan, failure != NULL ? failure->error : CancelledError());
  }
  err = assembler.Finalize(outcomes);
  return Finish(plan, err);
}

// --------------------------------------------------------------------------
TransferResult TransferJob::Finish(const TransferPlan &plan,
                                   const TransferClientError &err,
                                   const string &eTag) const {
  TransferResult result;
  result.strategy = plan.strategy;
  result.partCount = plan.parts.size();
  result.bytesTransferred = GetBytesTransferred();
  if (IsGoodTransferError(err)) {
    result.status = TransferStatus::Succeeded;
    result.error = err;
    result.eTag = eTag;
  } else if (!ShouldContinue()) {
    result.status = TransferStatus::Aborted;
    result.error = err.GetError() == TransferError::CANCELLED
                       ? err
                       : MakeTransferError(TransferError::CANCELLED,
                                           "TransferCancelled",
                                           GetMessageForTransferError(err));
  } else {
    result.status = TransferStatus::Failed;
    result.error = err;
  }
  return result;
}

// --------------------------------------------------------------------------
void TransferJob::AbortUpload(MultipartCoordinator *coordinator) const {
  TransferClientError err = coordinator->Abort();
  DebugWarningIf(!IsGoodTransferError(err),
                 "Keeping the original failure over abort failure " +
                     GetMessageForTransferError(err));
}

// --------------------------------------------------------------------------
string TransferJob::ResolveContentType() const {
  if (!m_request.contentType.empty()) {
    return m_request.contentType;
  }
  S3Xfer::Data::InitializeMimeTypes(
      S3Xfer::Configure::Default::GetMimeFiles().front());
  return S3Xfer::Data::LookupMimeType(m_request.localPath);
}

// --------------------------------------------------------------------------
size_t TransferJob::GetWorkerPoolSize(const TransferPlan &plan) const {
  size_t workers = static_cast<size_t>(m_request.workerCount);
  return workers < plan.parts.size() ? workers : plan.parts.size();
}

// --------------------------------------------------------------------------
void TransferJob::OnPartCompleted(const PartOutcome &outcome) {
  if (!outcome.success) {
    DebugWarning("Part failed " + outcome.ToString());
    return;
  }
  uint64_t transferred = 0;
  uint64_t total = 0;
  {
    boost::lock_guard<boost::mutex> locker(m_bytesLock);
    m_bytesTransferred += outcome.bytesTransferred;
    transferred = m_bytesTransferred;
    total = m_bytesTotalSize;
  }
  DebugInfo("Progress " + to_string(transferred) + "/" + to_string(total) +
            " " + FormatKey(m_request.objectKey));
  if (m_progressCallback) {
    boost::lock_guard<boost::mutex> locker(m_progressLock);
    m_progressCallback(transferred, total);
  }
}

// --------------------------------------------------------------------------
void TransferJob::SetBytesTotalSize(uint64_t size) {
  boost::lock_guard<boost::mutex> locker(m_bytesLock);
  m_bytesTotalSize = size;
}

}  // namespace Transfer
}  // namespace S3Xfer
