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

#ifndef S3XFER_TRANSFER_TRANSFERJOB_H_
#define S3XFER_TRANSFER_TRANSFERJOB_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

#include <string>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ObjectStoreClient.h"
#include "client/RetryStrategy.h"
#include "client/TransferError.h"
#include "transfer/ByteRangePlanner.h"
#include "transfer/Part.h"
#include "transfer/TransferRequest.h"
#include "transfer/TransferResult.h"
#include "transfer/TransferTypes.h"

namespace S3Xfer {
namespace Data {
class LocalFile;
}  // namespace Data

namespace Transfer {

class CancellationToken;
class MultipartCoordinator;
class PartTransporter;

// @param  : bytes transferred so far, total bytes
typedef boost::function<void(uint64_t, uint64_t)> ProgressCallback;

//
// TransferJob
//
// Moves one object between a local file and the store. Plans the parts,
// runs them on a worker pool and finalizes or cleans up, returning a single
// result. Cancel and the getters are safe to call from any thread while
// Run is executing on another one.
//
class TransferJob : private boost::noncopyable {
 public:
  TransferJob(
      const boost::shared_ptr<S3Xfer::Client::ObjectStoreClient> &client,
      const TransferRequest &request,
      const S3Xfer::Client::RetryStrategy &retryStrategy =
          S3Xfer::Client::GetDefaultRetryStrategy());

  ~TransferJob();

 public:
  // Run the transfer on the calling thread
  //
  // @param  : void
  // @return : result; a second call waits for and returns the first result
  TransferResult Run();

  // Stop submitting parts; in flight parts finish, then the upload is
  // aborted or the partial download is discarded
  void Cancel();

  bool ShouldContinue() const;

  // Block until the job reaches a terminal status
  void WaitUntilFinished() const;

  // Set before Run. Invoked on worker threads, one call at a time.
  void SetProgressCallback(const ProgressCallback &callback) {
    m_progressCallback = callback;
  }

 public:
  TransferStatus::Value GetStatus() const;
  TransferResult GetResult() const;
  uint64_t GetBytesTransferred() const;
  uint64_t GetBytesTotalSize() const;
  const TransferRequest &GetRequest() const { return m_request; }

 private:
  TransferResult DoRun();
  TransferResult RunUpload();
  TransferResult RunDownload();

  TransferResult RunSingleUpload(const TransferPlan &plan,
                                 const S3Xfer::Data::LocalFile &source,
                                 const std::string &contentType);
  TransferResult RunMultipartUpload(const TransferPlan &plan,
                                    const S3Xfer::Data::LocalFile &source,
                                    const std::string &contentType);
  TransferResult RunSingleDownload(
      const TransferPlan &plan, const S3Xfer::Client::ObjectVersion &version);
  TransferResult RunChunkedDownload(
      const TransferPlan &plan, const S3Xfer::Client::ObjectVersion &version);

  // Build the terminal result from the first error of the job
  TransferResult Finish(
      const TransferPlan &plan, const S3Xfer::Client::TransferClientError &err,
      const std::string &eTag = std::string()) const;

  // Release the upload, keeping the error that caused it
  void AbortUpload(MultipartCoordinator *coordinator) const;

  std::string ResolveContentType() const;
  size_t GetWorkerPoolSize(const TransferPlan &plan) const;

  void OnPartCompleted(const PartOutcome &outcome);
  void SetBytesTotalSize(uint64_t size);

 private:
  boost::shared_ptr<S3Xfer::Client::ObjectStoreClient> m_client;
  TransferRequest m_request;
  boost::shared_ptr<CancellationToken> m_cancellation;
  boost::shared_ptr<PartTransporter> m_transporter;
  ProgressCallback m_progressCallback;
  boost::mutex m_progressLock;

  TransferStatus::Value m_status;
  TransferResult m_result;
  mutable boost::mutex m_statusLock;
  mutable boost::condition_variable m_statusConditionVar;

  uint64_t m_bytesTransferred;
  uint64_t m_bytesTotalSize;
  mutable boost::mutex m_bytesLock;
};

}  // namespace Transfer
}  // namespace S3Xfer

#endif  // S3XFER_TRANSFER_TRANSFERJOB_H_
