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

#include <signal.h>
#include <time.h>

#include <exception>
#include <iostream>
#include <sstream>
#include <string>

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/future.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "cli/HelpText.h"
#include "cli/Parser.h"
#include "client/EncryptionContext.h"
#include "client/LocalStoreClient.h"
#include "client/RetryStrategy.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "transfer/TransferJob.h"
#include "transfer/TransferRequest.h"
#include "transfer/TransferResult.h"

using boost::shared_ptr;
using S3Xfer::Cli::HelpText::ShowS3XferHelp;
using S3Xfer::Cli::HelpText::ShowS3XferUsage;
using S3Xfer::Cli::HelpText::ShowS3XferVersion;
using S3Xfer::Client::EncryptionOutcome;
using S3Xfer::Client::GetMessageForTransferError;
using S3Xfer::Client::LocalStoreClient;
using S3Xfer::Client::ObjectStoreClient;
using S3Xfer::Configure::Command;
using S3Xfer::Configure::GetCommandName;
using S3Xfer::Configure::Default::GetProgramName;
using S3Xfer::Configure::Options;
using S3Xfer::Exception::S3XferException;
using S3Xfer::Transfer::StrategyOverride;
using S3Xfer::Transfer::TransferDirection;
using S3Xfer::Transfer::TransferJob;
using S3Xfer::Transfer::TransferRequest;
using S3Xfer::Transfer::TransferResult;
using std::string;

namespace {

struct ErrorHandle {
  int *ret;
  explicit ErrorHandle(int *ret_) : ret(ret_) {}

  void operator()(const char *err) {
    if (ret) {
      *ret = 1;
    }
    if (err) {
      std::cerr << "[" << GetProgramName() << " ERROR] " << err << "\n";
    }
  }
};

void PrintProgress(uint64_t transferred, uint64_t total) {
  std::cout << "\r[" << GetProgramName() << "] "
            << S3Xfer::StringUtils::FormatByteSize(transferred) << " / "
            << S3Xfer::StringUtils::FormatByteSize(total) << std::flush;
}

TransferResult RunJob(const shared_ptr<TransferJob> &job) { return job->Run(); }

typedef boost::packaged_task<TransferResult> JobTask;

struct RunJobTask {
  shared_ptr<JobTask> task;
  explicit RunJobTask(const shared_ptr<JobTask> &task_) : task(task_) {}
  void operator()() { (*task)(); }
};

TransferRequest BuildTransferRequest(const Options &options);
TransferResult RunUntilFinished(const shared_ptr<TransferJob> &job,
                                const sigset_t &signals);

}  // namespace

int main(int argc, char **argv) {
  int ret = 0;
  ErrorHandle errorHandle(&ret);

  // Parse command line arguments.
  try {
    S3Xfer::Cli::Parser::Parse(argc, argv);
  } catch (const S3XferException &err) {
    ShowS3XferUsage();
    errorHandle(err.what());
    return ret;
  }

  const Options &options = Options::Instance();
  try {
    if (options.IsNoTransfer()) {
      if (options.IsShowVersion()) {
        ShowS3XferVersion();
      }
      if (options.IsShowHelp()) {
        ShowS3XferHelp();
      }
      return ret;
    }

    // Interrupts are taken by sigtimedwait below, so block them before any
    // thread is started; threads inherit the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, NULL);

    S3Xfer::Logging::Log::Instance().Initialize(
        options.GetLogDirectory(), options.GetLogLevel(), options.IsDebug());
    std::stringstream ss;
    ss << options;
    DebugInfo(ss.str());

    TransferRequest request = BuildTransferRequest(options);
    shared_ptr<ObjectStoreClient> client = boost::make_shared<LocalStoreClient>(
        options.GetStoreRoot(), options.GetRequestTimeOut());
    shared_ptr<TransferJob> job = boost::make_shared<TransferJob>(
        client, request, S3Xfer::Client::GetCustomRetryStrategy());
    job->SetProgressCallback(PrintProgress);

    TransferResult result = RunUntilFinished(job, signals);
    std::cout << std::endl;
    if (result.IsSuccess()) {
      std::cout << GetCommandName(options.GetCommand()) << " completed, "
                << S3Xfer::StringUtils::FormatByteSize(
                       result.bytesTransferred)
                << " in " << result.partCount << " part(s)" << std::endl;
    } else {
      errorHandle(GetMessageForTransferError(result.error).c_str());
    }
  } catch (const S3XferException &err) {
    errorHandle(err.what());
  } catch (const std::exception &err) {
    errorHandle(err.what());
  }
  return ret;
}

namespace {

// Throw S3XferException if the encryption options are invalid
TransferRequest BuildTransferRequest(const Options &options) {
  EncryptionOutcome encryption = S3Xfer::Client::MakeEncryptionContext(
      options.GetEncryption(), options.GetKMSKeyId(),
      options.GetCustomerKey());
  if (!encryption.IsSuccess()) {
    throw S3XferException(GetMessageForTransferError(encryption.GetError()));
  }

  TransferRequest request;
  request.direction = options.GetCommand() == Command::Upload
                          ? TransferDirection::Upload
                          : TransferDirection::Download;
  request.localPath = options.GetLocalPath();
  request.objectKey = options.GetObjectKey();
  request.versionId = options.GetVersionId();
  request.contentType = options.GetContentType();
  request.chunkSize =
      options.GetChunkSizeInMB() * static_cast<int64_t>(S3Xfer::Size::MB1);
  request.workerCount = options.GetWorkers();
  if (options.IsForceSingle()) {
    request.strategyOverride = StrategyOverride::ForceSingle;
  } else if (options.IsForceMultipart()) {
    request.strategyOverride = StrategyOverride::ForceMultipart;
  } else if (options.IsForceChunked()) {
    request.strategyOverride = StrategyOverride::ForceChunked;
  }
  request.encryption = encryption.GetResult();
  return request;
}

// Run the job on a worker thread, cancelling it on SIGINT or SIGTERM
TransferResult RunUntilFinished(const shared_ptr<TransferJob> &job,
                                const sigset_t &signals) {
  S3Xfer::Threading::ThreadPool executor(1);
  shared_ptr<JobTask> task =
      boost::make_shared<JobTask>(boost::bind(RunJob, job));
  boost::unique_future<TransferResult> future = task->get_future();
  executor.SubmitToThread(RunJobTask(task));

  struct timespec timeout;
  timeout.tv_sec = 0;
  timeout.tv_nsec = 100 * 1000 * 1000;
  while (!future.is_ready()) {
    int sig = sigtimedwait(&signals, NULL, &timeout);
    if (sig == SIGINT || sig == SIGTERM) {
      std::cerr << "\n[" << GetProgramName()
                << "] interrupted, waiting for parts in flight" << std::endl;
      job->Cancel();
    }
  }
  return future.get();
}

}  // namespace
