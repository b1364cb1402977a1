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

#include "transfer/PartTransporter.h"

#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/chrono/duration.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/ref.hpp"
#include "boost/thread/thread.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "data/LocalFile.h"
#include "transfer/CancellationToken.h"

namespace S3Xfer {
namespace Transfer {

using boost::shared_ptr;
using boost::to_string;
using S3Xfer::Client::CompletedPartList;
using S3Xfer::Client::EncryptionContext;
using S3Xfer::Client::GetMessageForTransferError;
using S3Xfer::Client::IsGoodTransferError;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::ObjectMeta;
using S3Xfer::Client::ObjectStoreClient;
using S3Xfer::Client::ObjectVersion;
using S3Xfer::Client::RetryStrategy;
using S3Xfer::Client::TransferClientError;
using S3Xfer::Client::TransferError;
using S3Xfer::Data::LocalFile;
using S3Xfer::Data::StagedFile;
using S3Xfer::StringUtils::FormatKey;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
PartTransporter::PartTransporter(
    const shared_ptr<ObjectStoreClient> &client, const string &objectKey,
    const EncryptionContext &encryption, const RetryStrategy &retryStrategy,
    const shared_ptr<CancellationToken> &cancellation)
    : m_client(client),
      m_objectKey(objectKey),
      m_encryption(encryption),
      m_retryStrategy(retryStrategy),
      m_cancellation(cancellation) {}

// --------------------------------------------------------------------------
PartOutcome PartTransporter::UploadPart(const string &uploadId,
                                        const Part &part,
                                        const LocalFile &source) {
  vector<char> body;
  TransferClientError err = ReadPart(source, part, &body);
  if (!IsGoodTransferError(err)) {
    return MakeFailedPartOutcome(part, err);
  }

  string eTag;
  err = DoWithRetry(
      "UploadPart " + part.ToString(),
      boost::bind(&ObjectStoreClient::UploadPart, m_client.get(),
                  boost::cref(m_objectKey), boost::cref(uploadId),
                  part.GetPartNumber(), boost::cref(body),
                  boost::cref(m_encryption), &eTag));
  if (!IsGoodTransferError(err)) {
    return MakeFailedPartOutcome(part, err);
  }
  DebugInfo("Uploaded " + part.ToString() + " " + FormatKey(m_objectKey));
  return MakeSucceededPartOutcome(part, part.GetSize(), eTag);
}

// --------------------------------------------------------------------------
PartOutcome PartTransporter::PutObject(const Part &part,
                                       const LocalFile &source,
                                       const string &contentType) {
  vector<char> body;
  TransferClientError err = ReadPart(source, part, &body);
  if (!IsGoodTransferError(err)) {
    return MakeFailedPartOutcome(part, err);
  }

  string eTag;
  err = DoWithRetry(
      "PutObject",
      boost::bind(&ObjectStoreClient::PutObject, m_client.get(),
                  boost::cref(m_objectKey), boost::cref(body),
                  boost::cref(contentType), boost::cref(m_encryption), &eTag));
  if (!IsGoodTransferError(err)) {
    return MakeFailedPartOutcome(part, err);
  }
  return MakeSucceededPartOutcome(part, part.GetSize(), eTag);
}

// --------------------------------------------------------------------------
PartOutcome PartTransporter::DownloadPart(const ObjectVersion &version,
                                          const Part &part,
                                          StagedFile *destination) {
  if (part.IsEmpty()) {
    return MakeSucceededPartOutcome(part, 0);
  }

  vector<char> data;
  string servedETag;
  TransferClientError err = DoWithRetry(
      "GetRange " + part.ToString(),
      boost::bind(&ObjectStoreClient::GetRange, m_client.get(),
                  boost::cref(m_objectKey), boost::cref(version),
                  part.GetRangeBegin(), part.GetRangeEnd(),
                  boost::cref(m_encryption), &data, &servedETag));
  if (!IsGoodTransferError(err)) {
    return MakeFailedPartOutcome(part, err);
  }

  // a store ignoring the pin must not get its bytes stitched in
  if (!version.eTag.empty() && !servedETag.empty() &&
      servedETag != version.eTag) {
    return MakeFailedPartOutcome(
        part, MakeTransferError(TransferError::INCONSISTENT_SOURCE,
                                "ETagMismatch",
                                "Served " + servedETag + " instead of " +
                                    version.ToString() + " for " +
                                    part.ToString()));
  }
  if (data.size() != part.GetSize()) {
    return MakeFailedPartOutcome(
        part, MakeTransferError(TransferError::INCOMPLETE_TRANSFER,
                                "ShortRange",
                                "Received " + to_string(data.size()) +
                                    " bytes for " + part.ToString()));
  }

  err = destination->WriteAt(part.GetRangeBegin(), &data[0], data.size());
  if (!IsGoodTransferError(err)) {
    return MakeFailedPartOutcome(part, err);
  }
  DebugInfo("Downloaded " + part.ToString() + " " + FormatKey(m_objectKey));
  return MakeSucceededPartOutcome(part, data.size());
}

// --------------------------------------------------------------------------
TransferClientError PartTransporter::HeadObject(const string &versionId,
                                                ObjectMeta *meta) {
  return DoWithRetry(
      "HeadObject",
      boost::bind(&ObjectStoreClient::HeadObject, m_client.get(),
                  boost::cref(m_objectKey), boost::cref(versionId),
                  boost::cref(m_encryption), meta));
}

// --------------------------------------------------------------------------
TransferClientError PartTransporter::InitiateMultipartUpload(
    const string &contentType, string *uploadId) {
  return DoWithRetry(
      "InitiateMultipartUpload",
      boost::bind(&ObjectStoreClient::InitiateMultipartUpload, m_client.get(),
                  boost::cref(m_objectKey), boost::cref(contentType),
                  boost::cref(m_encryption), uploadId));
}

// --------------------------------------------------------------------------
TransferClientError PartTransporter::CompleteMultipartUpload(
    const string &uploadId, const CompletedPartList &sortedParts,
    string *eTag) {
  // sent once, a completion whose response got lost is not repeatable
  return m_client->CompleteMultipartUpload(m_objectKey, uploadId, sortedParts,
                                           m_encryption, eTag);
}

// --------------------------------------------------------------------------
TransferClientError PartTransporter::AbortMultipartUpload(
    const string &uploadId) {
  return DoWithRetry(
      "AbortMultipartUpload",
      boost::bind(&ObjectStoreClient::AbortMultipartUpload, m_client.get(),
                  boost::cref(m_objectKey), boost::cref(uploadId)));
}

// --------------------------------------------------------------------------
TransferClientError PartTransporter::DoWithRetry(const string &name,
                                                 const Request &request) {
  TransferClientError err = request();
  uint16_t attempted = 0;
  while (!IsGoodTransferError(err) &&
         m_retryStrategy.ShouldRetry(err, attempted)) {
    ++attempted;
    uint32_t delay = m_retryStrategy.CalculateDelayBeforeNextRetry(attempted);
    Warning(name + " failed, retry " + to_string(attempted) + "/" +
            to_string(m_retryStrategy.GetMaxRetryTimes()) + " in " +
            to_string(delay) + "ms: " + GetMessageForTransferError(err) +
            " " + FormatKey(m_objectKey));
    if (RetryRequestSleep(delay)) {
      DebugWarning(name + " retry stopped by cancellation");
      break;
    }
    err = request();
  }
  return err;
}

// --------------------------------------------------------------------------
bool PartTransporter::RetryRequestSleep(uint32_t milliseconds) const {
  if (m_cancellation) {
    return m_cancellation->SleepFor(milliseconds);
  }
  boost::this_thread::sleep_for(boost::chrono::milliseconds(milliseconds));
  return false;
}

// --------------------------------------------------------------------------
TransferClientError PartTransporter::ReadPart(const LocalFile &source,
                                              const Part &part,
                                              vector<char> *body) const {
  if (part.IsEmpty()) {
    body->clear();
    return S3Xfer::Client::MakeGoodTransferError();
  }
  return source.ReadAt(part.GetRangeBegin(),
                       static_cast<size_t>(part.GetSize()), body);
}

}  // namespace Transfer
}  // namespace S3Xfer
