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

#ifndef S3XFER_TRANSFER_MULTIPARTCOORDINATOR_H_
#define S3XFER_TRANSFER_MULTIPARTCOORDINATOR_H_

#include <stddef.h>  // for size_t

#include <map>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ObjectStoreClient.h"
#include "client/TransferError.h"
#include "transfer/Part.h"
#include "transfer/WorkerPool.h"

namespace S3Xfer {
namespace Data {
class LocalFile;
}  // namespace Data

namespace Transfer {

class PartTransporter;

struct MultipartState {
  enum Value {
    NotStarted,
    Initiated,      // upload id obtained
    PartsInFlight,  // parts are being uploaded
    Completing,     // completion request is being sent
    Completed,
    Aborting,
    Aborted
  };
};

std::string GetMultipartStateName(MultipartState::Value state);

//
// MultipartSession
//
// Upload id and the completion tags of the parts uploaded so far.
// Workers record their own part number only.
//
class MultipartSession : private boost::noncopyable {
 public:
  explicit MultipartSession(const std::string &uploadId)
      : m_uploadId(uploadId) {}

 public:
  const std::string &GetUploadId() const { return m_uploadId; }

  void RecordPart(int partNumber, const std::string &eTag);
  size_t GetRecordedPartCount() const;

  // @return : recorded parts sorted by part number
  S3Xfer::Client::CompletedPartList GetCompletedParts() const;

 private:
  std::string m_uploadId;
  std::map<int, std::string> m_partETags;
  mutable boost::mutex m_partETagsLock;
};

// Check a completion list before it is sent
//
// @param  : parts, expected part count
// @return : GOOD if part numbers are exactly 1..expectedCount in order and
//           every tag is non empty, INCOMPLETE_TRANSFER otherwise
S3Xfer::Client::TransferClientError ValidateCompletedParts(
    const S3Xfer::Client::CompletedPartList &parts, size_t expectedCount);

//
// MultipartCoordinator
//
// Drives one multipart upload:
// NotStarted -> Initiated -> PartsInFlight -> Completing -> Completed,
// with Aborting -> Aborted reachable from every non terminal state.
// An upload that is neither completed nor aborted when the coordinator is
// destroyed gets aborted.
//
class MultipartCoordinator : private boost::noncopyable {
 public:
  explicit MultipartCoordinator(
      const boost::shared_ptr<PartTransporter> &transporter);
  ~MultipartCoordinator();

 public:
  // Obtain an upload id
  //
  // @param  : content type of the object
  // @return : ClientError
  S3Xfer::Client::TransferClientError Initiate(const std::string &contentType);

  // Upload parts through the pool, recording the tags of successful parts
  //
  // @param  : pool, parts, source file, continue predicate, callback
  // @return : outcomes in index order
  PartOutcomeList UploadParts(
      WorkerPool *pool, const PartList &parts,
      const S3Xfer::Data::LocalFile &source,
      const ContinuePredicate &shouldContinue = ContinuePredicate(),
      const PartCompletedCallback &onCompleted = PartCompletedCallback());

  // Upload one part, the transport handed to the worker pool
  PartOutcome UploadPart(const Part &part,
                         const S3Xfer::Data::LocalFile &source);

  // Send the completion list once; aborts the upload if the list is invalid
  // or the request fails
  //
  // @param  : expected part count, etag of the object (output)
  // @return : ClientError
  S3Xfer::Client::TransferClientError Complete(size_t expectedPartCount,
                                               std::string *eTag);

  // Release the upload on the store, at most once
  //
  // @return : GOOD, or ABORT_FAILED if the store refused; never retried by
  //           the caller
  S3Xfer::Client::TransferClientError Abort();

 public:
  MultipartState::Value GetState() const;
  const boost::shared_ptr<MultipartSession> &GetSession() const {
    return m_session;
  }

 private:
  void SetState(MultipartState::Value state);

 private:
  boost::shared_ptr<PartTransporter> m_transporter;
  boost::shared_ptr<MultipartSession> m_session;
  MultipartState::Value m_state;
  mutable boost::mutex m_stateLock;
};

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_MULTIPARTCOORDINATOR_H_
