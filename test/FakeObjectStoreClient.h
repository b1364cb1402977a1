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

#ifndef S3XFER_TEST_FAKEOBJECTSTORECLIENT_H_
#define S3XFER_TEST_FAKEOBJECTSTORECLIENT_H_

#include <stdint.h>

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/lexical_cast.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/HashUtils.h"
#include "client/EncryptionContext.h"
#include "client/ObjectStoreClient.h"
#include "client/TransferError.h"

namespace S3Xfer {
namespace Client {

//
// FakeObjectStoreClient
//
// In memory store for tests, version ids are the etags. Counts every
// request, records the highest number of concurrent data requests and
// replays scripted errors.
//
class FakeObjectStoreClient : public ObjectStoreClient {
 public:
  typedef std::map<int, std::vector<char> > UploadParts;
  typedef boost::function<void(StoreRequest::Value, int)> RequestHook;

  FakeObjectStoreClient()
      : ObjectStoreClient(0),
        m_uploadCounter(0),
        m_versionCounter(0),
        m_dataRequestDelayMs(0),
        m_inFlight(0),
        m_maxInFlight(0) {}

 public:
  TransferClientError HeadObject(const std::string &key,
                                 const std::string &versionId,
                                 const EncryptionContext &encryption,
                                 ObjectMeta *meta) {
    TransferClientError err = BeginRequest(StoreRequest::HeadObject, 0);
    if (!IsGoodTransferError(err)) return err;
    boost::lock_guard<boost::mutex> locker(m_lock);
    std::map<std::string, std::vector<char> >::const_iterator it =
        m_objects.find(key);
    if (it == m_objects.end() ||
        (!versionId.empty() && versionId != m_eTags[key])) {
      return MakeTransferError(TransferError::NOT_FOUND, "NoSuchKey", key);
    }
    meta->size = it->second.size();
    meta->version = ObjectVersion(versionId, m_eTags[key]);
    meta->contentType = m_contentTypes[key];
    return MakeGoodTransferError();
  }

  TransferClientError GetRange(const std::string &key,
                               const ObjectVersion &version, uint64_t first,
                               uint64_t last,
                               const EncryptionContext &encryption,
                               std::vector<char> *data, std::string *eTag) {
    TransferClientError err = BeginDataRequest(StoreRequest::GetObject, 0);
    if (!IsGoodTransferError(err)) return err;
    boost::lock_guard<boost::mutex> locker(m_lock);
    std::map<std::string, std::vector<char> >::const_iterator it =
        m_objects.find(key);
    if (it == m_objects.end()) {
      return MakeTransferError(TransferError::NOT_FOUND, "NoSuchKey", key);
    }
    if (!version.eTag.empty() && version.eTag != m_eTags[key]) {
      return MakeTransferError(TransferError::INCONSISTENT_SOURCE,
                               "PreconditionFailed", key);
    }
    if (first > last || last >= it->second.size()) {
      return MakeTransferError(TransferError::PERMANENT, "InvalidRange", key);
    }
    data->assign(it->second.begin() + first, it->second.begin() + last + 1);
    if (!m_servedETagOverride.empty()) {
      *eTag = m_servedETagOverride;
    } else {
      *eTag = m_eTags[key];
    }
    return MakeGoodTransferError();
  }

  TransferClientError PutObject(const std::string &key,
                                const std::vector<char> &body,
                                const std::string &contentType,
                                const EncryptionContext &encryption,
                                std::string *eTag) {
    TransferClientError err = BeginDataRequest(StoreRequest::PutObject, 0);
    if (!IsGoodTransferError(err)) return err;
    boost::lock_guard<boost::mutex> locker(m_lock);
    *eTag = StoreObject(key, body, contentType);
    m_lastEncryption = encryption;
    return MakeGoodTransferError();
  }

  TransferClientError InitiateMultipartUpload(
      const std::string &key, const std::string &contentType,
      const EncryptionContext &encryption, std::string *uploadId) {
    TransferClientError err =
        BeginRequest(StoreRequest::InitiateMultipartUpload, 0);
    if (!IsGoodTransferError(err)) return err;
    boost::lock_guard<boost::mutex> locker(m_lock);
    *uploadId = "upload-" + boost::lexical_cast<std::string>(++m_uploadCounter);
    m_uploads[*uploadId] = UploadParts();
    m_uploadContentTypes[*uploadId] = contentType;
    m_lastEncryption = encryption;
    return MakeGoodTransferError();
  }

  TransferClientError UploadPart(const std::string &key,
                                 const std::string &uploadId, int partNumber,
                                 const std::vector<char> &body,
                                 const EncryptionContext &encryption,
                                 std::string *eTag) {
    TransferClientError err =
        BeginDataRequest(StoreRequest::UploadPart, partNumber);
    if (!IsGoodTransferError(err)) return err;
    boost::lock_guard<boost::mutex> locker(m_lock);
    std::map<std::string, UploadParts>::iterator it = m_uploads.find(uploadId);
    if (it == m_uploads.end()) {
      return MakeTransferError(TransferError::NOT_FOUND, "NoSuchUpload",
                               uploadId);
    }
    it->second[partNumber] = body;
    *eTag = PartETag(body);
    return MakeGoodTransferError();
  }

  TransferClientError CompleteMultipartUpload(
      const std::string &key, const std::string &uploadId,
      const CompletedPartList &sortedParts,
      const EncryptionContext &encryption, std::string *eTag) {
    TransferClientError err =
        BeginRequest(StoreRequest::CompleteMultipartUpload, 0);
    if (!IsGoodTransferError(err)) return err;
    boost::lock_guard<boost::mutex> locker(m_lock);
    std::map<std::string, UploadParts>::iterator it = m_uploads.find(uploadId);
    if (it == m_uploads.end()) {
      return MakeTransferError(TransferError::NOT_FOUND, "NoSuchUpload",
                               uploadId);
    }
    m_completedParts = sortedParts;
    std::vector<char> object;
    for (size_t i = 0; i < sortedParts.size(); ++i) {
      UploadParts::const_iterator part =
          it->second.find(sortedParts[i].partNumber);
      if (part == it->second.end() ||
          PartETag(part->second) != sortedParts[i].eTag) {
        return MakeTransferError(TransferError::PERMANENT, "InvalidPart",
                                 uploadId);
      }
      object.insert(object.end(), part->second.begin(), part->second.end());
    }
    *eTag = StoreObject(key, object, m_uploadContentTypes[uploadId]);
    m_uploads.erase(it);
    return MakeGoodTransferError();
  }

  TransferClientError AbortMultipartUpload(const std::string &key,
                                           const std::string &uploadId) {
    TransferClientError err =
        BeginRequest(StoreRequest::AbortMultipartUpload, 0);
    if (!IsGoodTransferError(err)) return err;
    boost::lock_guard<boost::mutex> locker(m_lock);
    if (m_uploads.erase(uploadId) == 0) {
      return MakeTransferError(TransferError::NOT_FOUND, "NoSuchUpload",
                               uploadId);
    }
    return MakeGoodTransferError();
  }

 public:
  // Queue an error for the next requests of the given kind.
  // A part number other than 0 only matches UploadPart of that part.
  void ScriptError(StoreRequest::Value request, TransferError::Value error,
                   int partNumber = 0) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    m_scriptedErrors[Slot(request, partNumber)].push_back(error);
  }

  void PutTestObject(const std::string &key, const std::vector<char> &body) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    StoreObject(key, body, "application/octet-stream");
  }

  // Replace the object between requests, as a concurrent writer would
  void OverwriteObject(const std::string &key, const std::vector<char> &body) {
    PutTestObject(key, body);
  }

  void SetServedETagOverride(const std::string &eTag) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    m_servedETagOverride = eTag;
  }

  void SetDataRequestDelay(int milliseconds) {
    m_dataRequestDelayMs = milliseconds;
  }

  void SetRequestHook(const RequestHook &hook) { m_hook = hook; }

  int GetRequestCount(StoreRequest::Value request) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_requestCounts[request];
  }

  int GetTotalRequestCount() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    int total = 0;
    for (std::map<StoreRequest::Value, int>::const_iterator it =
             m_requestCounts.begin();
         it != m_requestCounts.end(); ++it) {
      total += it->second;
    }
    return total;
  }

  size_t GetMaxInFlight() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_maxInFlight;
  }

  size_t GetOpenUploadCount() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_uploads.size();
  }

  bool HasObject(const std::string &key) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_objects.find(key) != m_objects.end();
  }

  std::vector<char> GetObject(const std::string &key) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_objects[key];
  }

  std::string GetObjectETag(const std::string &key) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_eTags[key];
  }

  std::string GetObjectContentType(const std::string &key) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_contentTypes[key];
  }

  CompletedPartList GetCompletedParts() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_completedParts;
  }

  EncryptionContext GetLastEncryption() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_lastEncryption;
  }

  static std::string PartETag(const std::vector<char> &body) {
    if (body.empty()) {
      return S3Xfer::HashUtils::HexEncode(S3Xfer::HashUtils::MD5(""));
    }
    return S3Xfer::HashUtils::HexEncode(
        S3Xfer::HashUtils::MD5(&body[0], body.size()));
  }

 private:
  static int Slot(StoreRequest::Value request, int partNumber) {
    return static_cast<int>(request) * 100000 + partNumber;
  }

  TransferClientError BeginRequest(StoreRequest::Value request,
                                   int partNumber) {
    if (m_hook) {
      m_hook(request, partNumber);
    }
    boost::lock_guard<boost::mutex> locker(m_lock);
    ++m_requestCounts[request];
    TransferClientError err = PopScriptedError(Slot(request, partNumber));
    if (IsGoodTransferError(err) && partNumber != 0) {
      err = PopScriptedError(Slot(request, 0));
    }
    return err;
  }

  TransferClientError BeginDataRequest(StoreRequest::Value request,
                                       int partNumber) {
    {
      boost::lock_guard<boost::mutex> locker(m_lock);
      ++m_inFlight;
      if (m_inFlight > m_maxInFlight) {
        m_maxInFlight = m_inFlight;
      }
    }
    if (m_dataRequestDelayMs > 0) {
      boost::this_thread::sleep(
          boost::posix_time::milliseconds(m_dataRequestDelayMs));
    }
    TransferClientError err = BeginRequest(request, partNumber);
    {
      boost::lock_guard<boost::mutex> locker(m_lock);
      --m_inFlight;
    }
    return err;
  }

  // called with m_lock held
  TransferClientError PopScriptedError(int slot) {
    std::map<int, std::deque<TransferError::Value> >::iterator it =
        m_scriptedErrors.find(slot);
    if (it == m_scriptedErrors.end() || it->second.empty()) {
      return MakeGoodTransferError();
    }
    TransferError::Value error = it->second.front();
    it->second.pop_front();
    return MakeTransferError(error, "Scripted" + TransferErrorToString(error),
                             "scripted failure");
  }

  // called with m_lock held
  std::string StoreObject(const std::string &key,
                          const std::vector<char> &body,
                          const std::string &contentType) {
    m_objects[key] = body;
    m_contentTypes[key] = contentType;
    m_eTags[key] =
        "etag-" + boost::lexical_cast<std::string>(++m_versionCounter);
    return m_eTags[key];
  }

 private:
  boost::mutex m_lock;
  std::map<std::string, std::vector<char> > m_objects;
  std::map<std::string, std::string> m_eTags;
  std::map<std::string, std::string> m_contentTypes;
  std::map<std::string, UploadParts> m_uploads;
  std::map<std::string, std::string> m_uploadContentTypes;
  std::map<int, std::deque<TransferError::Value> > m_scriptedErrors;
  std::map<StoreRequest::Value, int> m_requestCounts;
  CompletedPartList m_completedParts;
  EncryptionContext m_lastEncryption;
  std::string m_servedETagOverride;
  RequestHook m_hook;
  uint64_t m_uploadCounter;
  uint64_t m_versionCounter;
  int m_dataRequestDelayMs;
  size_t m_inFlight;
  size_t m_maxInFlight;
};

}  // namespace Client
}  // namespace S3Xfer

#endif  // S3XFER_TEST_FAKEOBJECTSTORECLIENT_H_
