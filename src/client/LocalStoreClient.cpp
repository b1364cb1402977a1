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

#include "client/LocalStoreClient.h"

#include <stdio.h>   // for snprintf, rename
#include <string.h>  // for strlen
#include <time.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <string>
#include <vector>

#include "boost/chrono.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"

#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"
#include "data/LocalFile.h"

namespace S3Xfer {

namespace Client {

using boost::to_string;
using S3Xfer::Data::LocalFile;
using S3Xfer::Data::StagedFile;
using S3Xfer::StringUtils::FormatKey;
using S3Xfer::StringUtils::FormatPath;
using std::string;
using std::vector;

namespace {

const char *const RESERVED_DIR = ".s3xfer";
const char *const META_SUFFIX = ".meta";
const char *const UPLOAD_META = "upload.meta";

struct StoredMeta {
  string key;
  string contentType;
  EncryptionMode::Value mode;
  string keyMD5;

  StoredMeta() : mode(EncryptionMode::None) {}
  StoredMeta(const string &objKey, const string &type,
             const EncryptionContext &encryption)
      : key(objKey),
        contentType(type),
        mode(encryption.GetMode()),
        keyMD5(encryption.GetCustomerKeyMD5()) {}
};

// ---------------------------------------------------------------------------
TransferClientError StoreError(TransferError::Value err,
                               const string &exceptionName,
                               const string &message) {
  return MakeTransferError(err, exceptionName, message);
}

// ---------------------------------------------------------------------------
TransferClientError InternalError(const TransferClientError &err) {
  return StoreError(TransferError::PERMANENT, "InternalError",
                    err.GetMessage());
}

// Fails a request that ran past the client timeout, 0 disables the check
class RequestTimer {
 public:
  explicit RequestTimer(uint32_t timeOut)
      : m_timeOut(timeOut), m_start(boost::chrono::steady_clock::now()) {}

  TransferClientError Check(const string &request, const string &key) const {
    if (m_timeOut == 0) {
      return MakeGoodTransferError();
    }
    int64_t elapsed = static_cast<int64_t>(
        boost::chrono::duration_cast<boost::chrono::milliseconds>(
            boost::chrono::steady_clock::now() - m_start)
            .count());
    if (elapsed <= static_cast<int64_t>(m_timeOut)) {
      return MakeGoodTransferError();
    }
    return StoreError(TransferError::REQUEST_TIMEOUT, "RequestTimeout",
                      request + " took " + to_string(elapsed) +
                          "ms, timeout " + to_string(m_timeOut) + "ms " +
                          FormatKey(key));
  }

 private:
  uint32_t m_timeOut;  // in milliseconds
  boost::chrono::steady_clock::time_point m_start;
};

// ---------------------------------------------------------------------------
TransferClientError CheckKey(const string &key) {
  bool invalid = key.empty() || key[0] == '/' ||
                 key[key.size() - 1] == '/' ||
                 key.compare(0, strlen(RESERVED_DIR), RESERVED_DIR) == 0 ||
                 key == ".." || key.compare(0, 3, "../") == 0 ||
                 key.find("/../") != string::npos ||
                 (key.size() >= 3 && key.compare(key.size() - 3, 3, "/..") == 0);
  if (invalid) {
    return StoreError(TransferError::PERMANENT, "InvalidKey",
                      "Invalid object key " + FormatKey(key));
  }
  return MakeGoodTransferError();
}

// ---------------------------------------------------------------------------
string MakeObjectETag(const struct stat &st) {
  char buf[64];
  unsigned long long mtimeNs =
      static_cast<unsigned long long>(st.st_mtim.tv_sec) * 1000000000ULL +
      static_cast<unsigned long long>(st.st_mtim.tv_nsec);
  snprintf(buf, sizeof(buf), "%llx-%llx-%llx",
           static_cast<unsigned long long>(st.st_ino),
           static_cast<unsigned long long>(st.st_size), mtimeNs);
  return buf;
}

// ---------------------------------------------------------------------------
bool StatObject(const string &path, struct stat *st) {
  return stat(path.c_str(), st) == 0 && S_ISREG(st->st_mode);
}

// ---------------------------------------------------------------------------
bool ReadStoredMeta(const string &path, StoredMeta *meta) {
  std::ifstream file(path.c_str());
  if (!file) {
    return false;
  }
  string line;
  while (getline(file, line)) {
    string::size_type pos = line.find('=');
    if (pos == string::npos) {
      continue;
    }
    string name = line.substr(0, pos);
    string value = line.substr(pos + 1);
    if (name == "key") {
      meta->key = value;
    } else if (name == "content-type") {
      meta->contentType = value;
    } else if (name == "encryption") {
      meta->mode = GetEncryptionModeByName(value);
    } else if (name == "key-md5") {
      meta->keyMD5 = value;
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
TransferClientError WriteStoredMeta(const string &path,
                                    const StoredMeta &meta) {
  if (!S3Xfer::Utils::CreateDirectoryIfNotExists(
          S3Xfer::Utils::GetDirName(path))) {
    return StoreError(TransferError::PERMANENT, "InternalError",
                      "Unable to create meta directory " + FormatPath(path));
  }
  string tmpPath = path + ".tmp";
  {
    std::ofstream file(tmpPath.c_str(), std::ios::out | std::ios::trunc);
    file << "key=" << meta.key << "\n"
         << "content-type=" << meta.contentType << "\n"
         << "encryption=" << GetEncryptionModeName(meta.mode) << "\n"
         << "key-md5=" << meta.keyMD5 << "\n";
    file.flush();
    if (!file) {
      return StoreError(TransferError::PERMANENT, "InternalError",
                        "Unable to write meta " + FormatPath(tmpPath));
    }
  }
  if (rename(tmpPath.c_str(), path.c_str()) != 0) {
    return StoreError(TransferError::PERMANENT, "InternalError",
                      "Unable to write meta " + FormatPath(tmpPath, path));
  }
  return MakeGoodTransferError();
}

// ---------------------------------------------------------------------------
string ReadFirstLine(const string &path) {
  std::ifstream file(path.c_str());
  string line;
  if (file) {
    getline(file, line);
  }
  return line;
}

// ---------------------------------------------------------------------------
// An object written with a customer key needs the same key on every read
TransferClientError CheckCustomerKey(const StoredMeta &meta,
                                     const EncryptionContext &encryption,
                                     const string &key) {
  if (meta.mode == EncryptionMode::SSE_C) {
    if (!encryption.IsCustomerKey()) {
      return StoreError(TransferError::PERMANENT, "InvalidRequest",
                        "Object is encrypted with a customer key, "
                        "but request has none " + FormatKey(key));
    }
    if (encryption.GetCustomerKeyMD5() != meta.keyMD5) {
      return StoreError(TransferError::PERMANENT, "AccessDenied",
                        "Customer key does not match " + FormatKey(key));
    }
  } else if (encryption.IsCustomerKey()) {
    return StoreError(TransferError::PERMANENT, "InvalidRequest",
                      "Object is not encrypted with a customer key " +
                          FormatKey(key));
  }
  return MakeGoodTransferError();
}

}  // namespace

// --------------------------------------------------------------------------
LocalStoreClient::LocalStoreClient(const string &rootDirectory,
                                   uint32_t requestTimeOut)
    : ObjectStoreClient(requestTimeOut),
      m_rootDirectory(S3Xfer::Utils::AppendPathDelim(rootDirectory)),
      m_uploadCounter(0) {}

// --------------------------------------------------------------------------
string LocalStoreClient::GetObjectPath(const string &key) const {
  return m_rootDirectory + key;
}

// --------------------------------------------------------------------------
string LocalStoreClient::GetMetaPath(const string &key) const {
  return m_rootDirectory + RESERVED_DIR + "/meta/" + key + META_SUFFIX;
}

// --------------------------------------------------------------------------
string LocalStoreClient::GetUploadDirectory(const string &uploadId) const {
  return m_rootDirectory + RESERVED_DIR + "/uploads/" + uploadId;
}

// --------------------------------------------------------------------------
string LocalStoreClient::GetPartPath(const string &uploadId,
                                     int partNumber) const {
  return GetUploadDirectory(uploadId) + "/part-" + to_string(partNumber);
}

// --------------------------------------------------------------------------
string LocalStoreClient::NewUploadId(const string &key) {
  uint64_t counter = 0;
  {
    boost::lock_guard<boost::mutex> lock(m_uploadCounterLock);
    counter = ++m_uploadCounter;
  }
  string seed = key + ":" + to_string(getpid()) + ":" + to_string(counter) +
                ":" + to_string(time(NULL));
  return S3Xfer::HashUtils::HexEncode(S3Xfer::HashUtils::MD5(seed));
}

// --------------------------------------------------------------------------
TransferClientError LocalStoreClient::HeadObject(
    const string &key, const string &versionId,
    const EncryptionContext &encryption, ObjectMeta *meta) {
  TransferClientError err = CheckKey(key);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  struct stat st;
  if (!StatObject(GetObjectPath(key), &st) || !versionId.empty()) {
    return StoreError(TransferError::NOT_FOUND, "NoSuchKey",
                      "No such object " + FormatKey(key) +
                          (versionId.empty() ? "" : " version " + versionId));
  }

  StoredMeta stored;
  ReadStoredMeta(GetMetaPath(key), &stored);
  err = CheckCustomerKey(stored, encryption, key);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  if (meta != NULL) {
    meta->size = static_cast<uint64_t>(st.st_size);
    meta->version = ObjectVersion(string(), MakeObjectETag(st));
    meta->contentType =
        stored.contentType.empty()
            ? S3Xfer::Configure::Default::GetDefaultContentType()
            : stored.contentType;
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalStoreClient::GetRange(
    const string &key, const ObjectVersion &version, uint64_t first,
    uint64_t last, const EncryptionContext &encryption, vector<char> *data,
    string *eTag) {
  RequestTimer timer(GetRequestTimeOut());
  TransferClientError err = CheckKey(key);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  string path = GetObjectPath(key);
  struct stat st;
  if (!StatObject(path, &st) || !version.versionId.empty()) {
    return StoreError(TransferError::NOT_FOUND, "NoSuchKey",
                      "No such object " + FormatKey(key));
  }
  string currentETag = MakeObjectETag(st);
  if (!version.eTag.empty() && version.eTag != currentETag) {
    return StoreError(TransferError::INCONSISTENT_SOURCE,
                      "PreconditionFailed",
                      "Object changed since " + version.ToString() + " " +
                          FormatKey(key));
  }

  StoredMeta stored;
  ReadStoredMeta(GetMetaPath(key), &stored);
  err = CheckCustomerKey(stored, encryption, key);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  uint64_t size = static_cast<uint64_t>(st.st_size);
  if (first > last || last >= size) {
    return StoreError(TransferError::PERMANENT, "InvalidRange",
                      S3Xfer::StringUtils::FormatByteRange(first, last) +
                          " is not satisfiable for object of size " +
                          to_string(size) + " " + FormatKey(key));
  }

  LocalFile file;
  err = file.OpenForRead(path);
  if (IsGoodTransferError(err)) {
    err = file.ReadAt(first, static_cast<size_t>(last - first + 1), data);
  }
  if (!IsGoodTransferError(err)) {
    return InternalError(err);
  }

  // the object can be replaced between stat and read
  struct stat after;
  if (!StatObject(path, &after) || MakeObjectETag(after) != currentETag) {
    return StoreError(TransferError::INCONSISTENT_SOURCE,
                      "PreconditionFailed",
                      "Object changed while reading " + FormatKey(key));
  }
  err = timer.Check("GetObject", key);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  if (eTag != NULL) {
    *eTag = currentETag;
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalStoreClient::PutObject(
    const string &key, const vector<char> &body, const string &contentType,
    const EncryptionContext &encryption, string *eTag) {
  RequestTimer timer(GetRequestTimeOut());
  TransferClientError err = CheckKey(key);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  string path = GetObjectPath(key);
  StagedFile staged(path);
  err = staged.Create(body.size());
  if (IsGoodTransferError(err) && !body.empty()) {
    err = staged.WriteAt(0, &body[0], body.size());
  }
  if (!IsGoodTransferError(err)) {
    return InternalError(err);
  }
  // a timed out put leaves the previous object in place
  err = timer.Check("PutObject", key);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  err = staged.Commit();
  if (!IsGoodTransferError(err)) {
    return InternalError(err);
  }

  err = WriteStoredMeta(GetMetaPath(key),
                        StoredMeta(key, contentType, encryption));
  if (!IsGoodTransferError(err)) {
    return err;
  }

  struct stat st;
  if (!StatObject(path, &st)) {
    return StoreError(TransferError::PERMANENT, "InternalError",
                      "Object vanished after write " + FormatKey(key));
  }
  if (eTag != NULL) {
    *eTag = MakeObjectETag(st);
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalStoreClient::InitiateMultipartUpload(
    const string &key, const string &contentType,
    const EncryptionContext &encryption, string *uploadId) {
  TransferClientError err = CheckKey(key);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  string id = NewUploadId(key);
  string dir = GetUploadDirectory(id);
  if (!S3Xfer::Utils::CreateDirectoryIfNotExists(dir)) {
    return StoreError(TransferError::PERMANENT, "InternalError",
                      "Unable to create upload directory " + FormatPath(dir));
  }
  err = WriteStoredMeta(dir + "/" + UPLOAD_META,
                        StoredMeta(key, contentType, encryption));
  if (!IsGoodTransferError(err)) {
    return err;
  }
  DebugInfo("Initiated local multipart upload " + id + " " + FormatKey(key));
  *uploadId = id;
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalStoreClient::UploadPart(
    const string &key, const string &uploadId, int partNumber,
    const vector<char> &body, const EncryptionContext &encryption,
    string *eTag) {
  RequestTimer timer(GetRequestTimeOut());
  StoredMeta upload;
  if (!ReadStoredMeta(GetUploadDirectory(uploadId) + "/" + UPLOAD_META,
                      &upload) ||
      upload.key != key) {
    return StoreError(TransferError::NOT_FOUND, "NoSuchUpload",
                      "No such upload " + uploadId + " " + FormatKey(key));
  }
  if (partNumber < 1 ||
      static_cast<size_t>(partNumber) >
          S3Xfer::Configure::Default::GetMaxMultipartPartCount()) {
    return StoreError(TransferError::PERMANENT, "InvalidArgument",
                      "Part number out of range " + to_string(partNumber));
  }
  TransferClientError err = CheckCustomerKey(upload, encryption, key);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  string partPath = GetPartPath(uploadId, partNumber);
  LocalFile file;
  err = file.OpenForWrite(partPath);
  if (IsGoodTransferError(err) && !body.empty()) {
    err = file.WriteAt(0, &body[0], body.size());
  }
  if (IsGoodTransferError(err)) {
    err = file.Close();
  }
  if (!IsGoodTransferError(err)) {
    return InternalError(err);
  }

  string tag = S3Xfer::HashUtils::HexEncode(
      body.empty() ? S3Xfer::HashUtils::MD5(string())
                   : S3Xfer::HashUtils::MD5(&body[0], body.size()));
  std::ofstream tagFile((partPath + ".etag").c_str(),
                        std::ios::out | std::ios::trunc);
  tagFile << tag << "\n";
  tagFile.flush();
  if (!tagFile) {
    return StoreError(TransferError::PERMANENT, "InternalError",
                      "Unable to record part etag " + FormatPath(partPath));
  }
  err = timer.Check("UploadPart", key);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  *eTag = tag;
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalStoreClient::CompleteMultipartUpload(
    const string &key, const string &uploadId,
    const CompletedPartList &sortedParts,
    const EncryptionContext &encryption, string *eTag) {
  string uploadDir = GetUploadDirectory(uploadId);
  StoredMeta upload;
  if (!ReadStoredMeta(uploadDir + "/" + UPLOAD_META, &upload) ||
      upload.key != key) {
    return StoreError(TransferError::NOT_FOUND, "NoSuchUpload",
                      "No such upload " + uploadId + " " + FormatKey(key));
  }
  TransferClientError err = CheckCustomerKey(upload, encryption, key);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  if (sortedParts.empty()) {
    return StoreError(TransferError::PERMANENT, "MalformedXML",
                      "No parts to complete upload " + uploadId);
  }

  // validate the list against the staged parts before touching the object
  uint64_t totalSize = 0;
  vector<uint64_t> partSizes;
  int previous = 0;
  BOOST_FOREACH (const CompletedPart &part, sortedParts) {
    if (part.partNumber <= previous) {
      return StoreError(TransferError::PERMANENT, "InvalidPartOrder",
                        "Part " + to_string(part.partNumber) +
                            " is out of order in upload " + uploadId);
    }
    previous = part.partNumber;
    string partPath = GetPartPath(uploadId, part.partNumber);
    uint64_t size = 0;
    if (!IsGoodTransferError(
            S3Xfer::Data::GetLocalFileSize(partPath, &size)) ||
        ReadFirstLine(partPath + ".etag") != part.eTag) {
      return StoreError(TransferError::PERMANENT, "InvalidPart",
                        "Part " + to_string(part.partNumber) +
                            " not found or etag mismatch in upload " +
                            uploadId);
    }
    partSizes.push_back(size);
    totalSize += size;
  }

  StagedFile staged(GetObjectPath(key));
  err = staged.Create(totalSize);
  uint64_t offset = 0;
  vector<char> buffer;
  for (size_t i = 0; i < sortedParts.size() && IsGoodTransferError(err);
       ++i) {
    LocalFile part;
    err = part.OpenForRead(GetPartPath(uploadId, sortedParts[i].partNumber));
    uint64_t partOffset = 0;
    while (IsGoodTransferError(err) && partOffset < partSizes[i]) {
      uint64_t len = partSizes[i] - partOffset;
      if (len > S3Xfer::Size::MB8) {
        len = S3Xfer::Size::MB8;
      }
      err = part.ReadAt(partOffset, static_cast<size_t>(len), &buffer);
      if (IsGoodTransferError(err)) {
        err = staged.WriteAt(offset, &buffer[0], buffer.size());
      }
      partOffset += len;
      offset += len;
    }
  }
  if (IsGoodTransferError(err)) {
    err = staged.Commit();
  }
  if (!IsGoodTransferError(err)) {
    return InternalError(err);
  }

  err = WriteStoredMeta(GetMetaPath(key), upload);
  if (!IsGoodTransferError(err)) {
    return err;
  }
  std::pair<bool, string> outcome =
      S3Xfer::Utils::DeleteFilesInDirectory(uploadDir, true);
  WarningIf(!outcome.first, "Unable to clean up upload " + uploadId + ": " +
                                outcome.second);

  struct stat st;
  if (!StatObject(GetObjectPath(key), &st)) {
    return StoreError(TransferError::PERMANENT, "InternalError",
                      "Object vanished after complete " + FormatKey(key));
  }
  if (eTag != NULL) {
    *eTag = MakeObjectETag(st);
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalStoreClient::AbortMultipartUpload(
    const string &key, const string &uploadId) {
  string uploadDir = GetUploadDirectory(uploadId);
  StoredMeta upload;
  if (!ReadStoredMeta(uploadDir + "/" + UPLOAD_META, &upload) ||
      upload.key != key) {
    return StoreError(TransferError::NOT_FOUND, "NoSuchUpload",
                      "No such upload " + uploadId + " " + FormatKey(key));
  }
  std::pair<bool, string> outcome =
      S3Xfer::Utils::DeleteFilesInDirectory(uploadDir, true);
  if (!outcome.first) {
    return StoreError(TransferError::PERMANENT, "InternalError",
                      "Unable to abort upload " + uploadId + ": " +
                          outcome.second);
  }
  return MakeGoodTransferError();
}

}  // namespace Client
}  // namespace S3Xfer
