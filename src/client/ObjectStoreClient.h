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

#ifndef S3XFER_CLIENT_OBJECTSTORECLIENT_H_
#define S3XFER_CLIENT_OBJECTSTORECLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"

#include "client/EncryptionContext.h"
#include "client/TransferError.h"

namespace S3Xfer {

namespace Client {

// Stable handle of one write of an object.
// A store exposes a version id, an entity tag, or both.
struct ObjectVersion {
  std::string versionId;
  std::string eTag;

  ObjectVersion() {}
  ObjectVersion(const std::string &version, const std::string &tag)
      : versionId(version), eTag(tag) {}

  bool IsStable() const { return !versionId.empty() || !eTag.empty(); }
  std::string ToString() const;
};

struct ObjectMeta {
  uint64_t size;
  ObjectVersion version;
  std::string contentType;

  ObjectMeta() : size(0) {}
};

// (part number, completion tag) as sent to CompleteMultipartUpload
struct CompletedPart {
  int partNumber;
  std::string eTag;

  CompletedPart() : partNumber(0) {}
  CompletedPart(int number, const std::string &tag)
      : partNumber(number), eTag(tag) {}
};

typedef std::vector<CompletedPart> CompletedPartList;

//
// ObjectStoreClient
//
// Request level access to one bucket of an S3 compatible store.
// Every request returns a classified error, retries are up to the caller.
// Implementations must be safe to call from several threads at once.
//
class ObjectStoreClient : private boost::noncopyable {
 public:
  // @param  : request timeout in milliseconds
  explicit ObjectStoreClient(uint32_t requestTimeOut);
  virtual ~ObjectStoreClient();

 public:
  // Head object
  //
  // @param  : object key, version id (empty for latest), encryption,
  //           meta (output)
  // @return : ClientError
  virtual TransferClientError HeadObject(const std::string &key,
                                         const std::string &versionId,
                                         const EncryptionContext &encryption,
                                         ObjectMeta *meta) = 0;

  // Read an inclusive byte range of one version of an object
  //
  // @param  : object key, version pin, first byte, last byte, encryption,
  //           data (output), served etag (output, can be null)
  // @return : ClientError, INCONSISTENT_SOURCE if the pinned version is gone
  virtual TransferClientError GetRange(const std::string &key,
                                       const ObjectVersion &version,
                                       uint64_t first, uint64_t last,
                                       const EncryptionContext &encryption,
                                       std::vector<char> *data,
                                       std::string *eTag) = 0;

  // Put object in a single request
  //
  // @param  : object key, body, content type, encryption, etag (output)
  // @return : ClientError
  virtual TransferClientError PutObject(const std::string &key,
                                        const std::vector<char> &body,
                                        const std::string &contentType,
                                        const EncryptionContext &encryption,
                                        std::string *eTag) = 0;

  // Initiate multipart upload
  //
  // @param  : object key, content type, encryption, upload id (output)
  // @return : ClientError
  virtual TransferClientError InitiateMultipartUpload(
      const std::string &key, const std::string &contentType,
      const EncryptionContext &encryption, std::string *uploadId) = 0;

  // Upload one part
  //
  // @param  : object key, upload id, 1-based part number, body, encryption,
  //           etag (output)
  // @return : ClientError
  virtual TransferClientError UploadPart(const std::string &key,
                                         const std::string &uploadId,
                                         int partNumber,
                                         const std::vector<char> &body,
                                         const EncryptionContext &encryption,
                                         std::string *eTag) = 0;

  // Complete multipart upload
  //
  // @param  : object key, upload id, parts sorted by part number,
  //           encryption, etag of the assembled object (output)
  // @return : ClientError
  virtual TransferClientError CompleteMultipartUpload(
      const std::string &key, const std::string &uploadId,
      const CompletedPartList &sortedParts,
      const EncryptionContext &encryption, std::string *eTag) = 0;

  // Abort multipart upload
  //
  // @param  : object key, upload id
  // @return : ClientError
  virtual TransferClientError AbortMultipartUpload(
      const std::string &key, const std::string &uploadId) = 0;

 public:
  uint32_t GetRequestTimeOut() const { return m_requestTimeOut; }

 private:
  uint32_t m_requestTimeOut;  // in milliseconds
};

}  // namespace Client
}  // namespace S3Xfer

#endif  // S3XFER_CLIENT_OBJECTSTORECLIENT_H_
