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

#ifndef S3XFER_CLIENT_LOCALSTORECLIENT_H_
#define S3XFER_CLIENT_LOCALSTORECLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/thread/mutex.hpp"

#include "client/EncryptionContext.h"
#include "client/ObjectStoreClient.h"
#include "client/TransferError.h"

namespace S3Xfer {

namespace Client {

//
// LocalStoreClient
//
// An object store kept in a local directory. Objects are regular files
// named by their key under the root directory. Object metadata and
// multipart uploads in progress live under a reserved ".s3xfer" directory.
//
// The store keeps no versions: HeadObject reports an empty version id and
// the etag identifies one write of an object by its inode, size and
// modification time. Objects written with a customer key can only be read
// with the same key. Data requests running past the request timeout fail
// with REQUEST_TIMEOUT.
//
class LocalStoreClient : public ObjectStoreClient {
 public:
  // @param  : root directory, request timeout in milliseconds
  explicit LocalStoreClient(const std::string &rootDirectory,
                            uint32_t requestTimeOut = 0);
  ~LocalStoreClient() {}

 public:
  TransferClientError HeadObject(const std::string &key,
                                 const std::string &versionId,
                                 const EncryptionContext &encryption,
                                 ObjectMeta *meta);

  TransferClientError GetRange(const std::string &key,
                               const ObjectVersion &version, uint64_t first,
                               uint64_t last,
                               const EncryptionContext &encryption,
                               std::vector<char> *data, std::string *eTag);

  TransferClientError PutObject(const std::string &key,
                                const std::vector<char> &body,
                                const std::string &contentType,
                                const EncryptionContext &encryption,
                                std::string *eTag);

  TransferClientError InitiateMultipartUpload(
      const std::string &key, const std::string &contentType,
      const EncryptionContext &encryption, std::string *uploadId);

  TransferClientError UploadPart(const std::string &key,
                                 const std::string &uploadId, int partNumber,
                                 const std::vector<char> &body,
                                 const EncryptionContext &encryption,
                                 std::string *eTag);

  TransferClientError CompleteMultipartUpload(
      const std::string &key, const std::string &uploadId,
      const CompletedPartList &sortedParts,
      const EncryptionContext &encryption, std::string *eTag);

  TransferClientError AbortMultipartUpload(const std::string &key,
                                           const std::string &uploadId);

 public:
  const std::string &GetRootDirectory() const { return m_rootDirectory; }

  // Path of the upload staging directory, exists while the upload is open
  std::string GetUploadDirectory(const std::string &uploadId) const;

 private:
  std::string GetObjectPath(const std::string &key) const;
  std::string GetMetaPath(const std::string &key) const;
  std::string GetPartPath(const std::string &uploadId, int partNumber) const;
  std::string NewUploadId(const std::string &key);

 private:
  std::string m_rootDirectory;  // ending with '/'
  uint64_t m_uploadCounter;
  boost::mutex m_uploadCounterLock;
};

}  // namespace Client
}  // namespace S3Xfer

#endif  // S3XFER_CLIENT_LOCALSTORECLIENT_H_
