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

#include "transfer/WorkerPool.h"

#include <exception>
#include <map>

#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/ThreadPool.h"

namespace S3Xfer {
namespace Transfer {

using boost::shared_ptr;
using boost::to_string;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::TransferError;
using S3Xfer::Threading::ThreadPool;

namespace {

struct RunState {
  boost::mutex lock;
  boost::condition_variable cond;
  size_t inFlight;
  bool failed;
  std::map<size_t, PartOutcome> outcomes;

  RunState() : inFlight(0), failed(false) {}
};

struct RunPart {
  shared_ptr<RunState> state;
  PartTransport transport;
  PartCompletedCallback onCompleted;
  Part part;

  RunPart(const shared_ptr<RunState> &state_, const PartTransport &transport_,
          const PartCompletedCallback &onCompleted_, const Part &part_)
      : state(state_),
        transport(transport_),
        onCompleted(onCompleted_),
        part(part_) {}

  void operator()() {
    PartOutcome outcome;
    try {
      outcome = transport(part);
    } catch (const std::exception &err) {
      Error("Exception while transferring " + part.ToString() + ": " +
            err.what());
      outcome = MakeFailedPartOutcome(
          part, MakeTransferError(TransferError::UNKNOWN,
                                  "UnexpectedException", err.what()));
    }
    outcome.index = part.GetIndex();
    outcome.attempted = true;

    if (onCompleted) {
      onCompleted(outcome);
    }

    {
      boost::lock_guard<boost::mutex> locker(state->lock);
      if (!outcome.success) {
        state->failed = true;
      }
      state->outcomes[outcome.index] = outcome;
      --state->inFlight;
    }
    state->cond.notify_all();
  }
};

}  // namespace

// --------------------------------------------------------------------------
WorkerPool::WorkerPool(size_t concurrencyLimit)
    : m_concurrencyLimit(concurrencyLimit > 0 ? concurrencyLimit : 1),
      m_executor(new ThreadPool(m_concurrencyLimit)) {}

// --------------------------------------------------------------------------
WorkerPool::~WorkerPool() {
  // Run never returns with work in flight
}

// --------------------------------------------------------------------------
PartOutcomeList WorkerPool::Run(const PartList &parts,
                                const PartTransport &transport,
                                const ContinuePredicate &shouldContinue,
                                const PartCompletedCallback &onCompleted) {
  shared_ptr<RunState> state = boost::make_shared<RunState>();
  bool cancelled = false;
  {
    boost::unique_lock<boost::mutex> lock(state->lock);
    for (size_t next = 0; next < parts.size(); ++next) {
      while (state->inFlight >= m_concurrencyLimit && !state->failed) {
        state->cond.wait(lock);
      }
      if (state->failed) {
        break;
      }
      if (shouldContinue && !shouldContinue()) {
        cancelled = true;
        break;
      }
      ++state->inFlight;
      lock.unlock();
      m_executor->SubmitToThread(
          RunPart(state, transport, onCompleted, parts[next]));
      lock.lock();
    }

    // drain
    while (state->inFlight > 0) {
      state->cond.wait(lock);
    }
  }

  PartOutcomeList outcomes;
  outcomes.reserve(parts.size());
  size_t notAttempted = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    std::map<size_t, PartOutcome>::const_iterator it =
        state->outcomes.find(parts[i].GetIndex());
    if (it != state->outcomes.end()) {
      outcomes.push_back(it->second);
      continue;
    }
    PartOutcome outcome;
    outcome.index = parts[i].GetIndex();
    outcome.error = MakeTransferError(
        cancelled ? TransferError::CANCELLED
                  : TransferError::INCOMPLETE_TRANSFER,
        "PartNotAttempted",
        cancelled ? "Transfer cancelled before " + parts[i].ToString()
                  : "Earlier part failed before " + parts[i].ToString());
    outcomes.push_back(outcome);
    ++notAttempted;
  }
  DebugInfoIf(notAttempted > 0,
              to_string(notAttempted) + " of " + to_string(parts.size()) +
                  " parts not attempted");
  return outcomes;
}

}  // namespace Transfer
}  // namespace S3Xfer
