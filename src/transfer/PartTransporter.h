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

#ifndef S3XFER_TRANSFER_PARTTRANSPORTER_H_
#define S3XFER_TRANSFER_PARTTRANSPORTER_H_

#include <stdint.h>  // for uint64_t

#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/EncryptionContext.h"
#include "client/ObjectStoreClient.h"
#include "client/RetryStrategy.h"
#include "client/TransferError.h"
#include "transfer/Part.h"

namespace S3Xfer {
namespace Data {
class LocalFile;
class StagedFile;
}  // namespace Data

namespace Transfer {

class CancellationToken;

//
// PartTransporter
//
// Issues the store requests of one transfer for one object key. Every
// request carries the transfer's EncryptionContext and is retried in place
// while the error is retryable and the retry budget lasts. Safe to share
// between workers.
//
class PartTransporter : private boost::noncopyable {
 public:
  PartTransporter(
      const boost::shared_ptr<S3Xfer::Client::ObjectStoreClient> &client,
      const std::string &objectKey,
      const S3Xfer::Client::EncryptionContext &encryption,
      const S3Xfer::Client::RetryStrategy &retryStrategy,
      const boost::shared_ptr<CancellationToken> &cancellation);

  ~PartTransporter() {}

 public:
  // Move one part from the local file into a multipart upload
  //
  // @param  : upload id, part, source file
  // @return : outcome with the part's completion tag
  PartOutcome UploadPart(const std::string &uploadId, const Part &part,
                         const S3Xfer::Data::LocalFile &source);

  // Upload the whole object with a single put
  //
  // @param  : the only part of the plan, source file, content type
  // @return : outcome with the object's tag
  PartOutcome PutObject(const Part &part,
                        const S3Xfer::Data::LocalFile &source,
                        const std::string &contentType);

  // Read one part of the pinned version into the destination at the part's
  // offset. An empty part issues no request.
  //
  // @param  : version, part, destination
  // @return : outcome with the bytes written
  PartOutcome DownloadPart(const S3Xfer::Client::ObjectVersion &version,
                           const Part &part,
                           S3Xfer::Data::StagedFile *destination);

 public:
  S3Xfer::Client::TransferClientError HeadObject(
      const std::string &versionId, S3Xfer::Client::ObjectMeta *meta);

  S3Xfer::Client::TransferClientError InitiateMultipartUpload(
      const std::string &contentType, std::string *uploadId);

  // Never retried, any failure is final
  S3Xfer::Client::TransferClientError CompleteMultipartUpload(
      const std::string &uploadId,
      const S3Xfer::Client::CompletedPartList &sortedParts,
      std::string *eTag);

  S3Xfer::Client::TransferClientError AbortMultipartUpload(
      const std::string &uploadId);

 public:
  const std::string &GetObjectKey() const { return m_objectKey; }
  const S3Xfer::Client::EncryptionContext &GetEncryption() const {
    return m_encryption;
  }
  const S3Xfer::Client::RetryStrategy &GetRetryStrategy() const {
    return m_retryStrategy;
  }

 private:
  typedef boost::function<S3Xfer::Client::TransferClientError()> Request;

  // Run the request, retrying while allowed
  //
  // @param  : request name for logging, request
  // @return : error of the last attempt
  S3Xfer::Client::TransferClientError DoWithRetry(const std::string &name,
                                                  const Request &request);

  // Sleep before the next retry
  //
  // @param  : time in milliseconds
  // @return : true if the transfer is cancelled during the sleep
  bool RetryRequestSleep(uint32_t milliseconds) const;

  S3Xfer::Client::TransferClientError ReadPart(
      const S3Xfer::Data::LocalFile &source, const Part &part,
      std::vector<char> *body) const;

 private:
  boost::shared_ptr<S3Xfer::Client::ObjectStoreClient> m_client;
  std::string m_objectKey;
  S3Xfer::Client::EncryptionContext m_encryption;
  S3Xfer::Client::RetryStrategy m_retryStrategy;
  boost::shared_ptr<CancellationToken> m_cancellation;
};

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_PARTTRANSPORTER_H_
