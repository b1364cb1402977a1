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

#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "client/TransferError.h"
#include "transfer/Part.h"
#include "transfer/WorkerPool.h"

namespace S3Xfer {
namespace Transfer {

using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::TransferError;
using std::vector;

namespace {

PartList MakeParts(size_t count, uint64_t size) {
  PartList parts;
  for (size_t i = 0; i < count; ++i) {
    parts.push_back(Part(i, i * size, size));
  }
  return parts;
}

// Records how many transports run at the same time
class ConcurrencyProbe {
 public:
  ConcurrencyProbe() : m_inFlight(0), m_maxInFlight(0), m_calls(0) {}

  PartOutcome Transport(const Part &part, int sleepMs, size_t failIndex) {
    {
      boost::lock_guard<boost::mutex> locker(m_lock);
      ++m_inFlight;
      ++m_calls;
      if (m_inFlight > m_maxInFlight) {
        m_maxInFlight = m_inFlight;
      }
    }
    boost::this_thread::sleep(boost::posix_time::milliseconds(sleepMs));
    {
      boost::lock_guard<boost::mutex> locker(m_lock);
      --m_inFlight;
    }
    if (part.GetIndex() == failIndex) {
      return MakeFailedPartOutcome(
          part, MakeTransferError(TransferError::PERMANENT, "AccessDenied",
                                  "denied"));
    }
    return MakeSucceededPartOutcome(part, part.GetSize());
  }

  void OnCompleted(const PartOutcome &outcome) {
    boost::lock_guard<boost::mutex> locker(m_lock);
    m_completed.push_back(outcome.index);
  }

  size_t GetMaxInFlight() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_maxInFlight;
  }

  size_t GetCalls() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_calls;
  }

  size_t GetCompletedCount() {
    boost::lock_guard<boost::mutex> locker(m_lock);
    return m_completed.size();
  }

 private:
  boost::mutex m_lock;
  size_t m_inFlight;
  size_t m_maxInFlight;
  size_t m_calls;
  vector<size_t> m_completed;
};

const size_t NO_FAILURE = static_cast<size_t>(-1);

PartOutcome ThrowingTransport(const Part &part) {
  if (part.GetIndex() == 1) {
    throw std::runtime_error("broken transport");
  }
  return MakeSucceededPartOutcome(part, part.GetSize());
}

class CountDown {
 public:
  explicit CountDown(int count) : m_count(count) {}
  bool operator()() { return m_count-- > 0; }

 private:
  int m_count;
};

}  // namespace

TEST(WorkerPoolTest, ConcurrencyNeverExceedsLimit) {
  ConcurrencyProbe probe;
  WorkerPool pool(3);
  EXPECT_EQ(3u, pool.GetConcurrencyLimit());

  PartList parts = MakeParts(20, 100);
  PartOutcomeList outcomes = pool.Run(
      parts,
      boost::bind(&ConcurrencyProbe::Transport, &probe, _1, 10, NO_FAILURE),
      ContinuePredicate(),
      boost::bind(&ConcurrencyProbe::OnCompleted, &probe, _1));

  EXPECT_LE(probe.GetMaxInFlight(), 3u);
  EXPECT_GE(probe.GetMaxInFlight(), 1u);
  EXPECT_EQ(20u, probe.GetCalls());
  EXPECT_EQ(20u, probe.GetCompletedCount());
  ASSERT_EQ(20u, outcomes.size());
  for (size_t i = 0; i < outcomes.size(); ++i) {
    EXPECT_EQ(i, outcomes[i].index);
    EXPECT_TRUE(outcomes[i].success);
    EXPECT_TRUE(outcomes[i].attempted);
  }
  EXPECT_EQ(2000u, GetBytesTransferred(outcomes));
  EXPECT_TRUE(FindFirstFailure(outcomes) == NULL);
}

TEST(WorkerPoolTest, ZeroLimitRunsOneAtATime) {
  ConcurrencyProbe probe;
  WorkerPool pool(0);
  EXPECT_EQ(1u, pool.GetConcurrencyLimit());
  pool.Run(MakeParts(5, 1), boost::bind(&ConcurrencyProbe::Transport, &probe,
                                        _1, 5, NO_FAILURE));
  EXPECT_EQ(1u, probe.GetMaxInFlight());
}

TEST(WorkerPoolTest, StopDispatchAfterFailure) {
  ConcurrencyProbe probe;
  WorkerPool pool(1);
  PartList parts = MakeParts(6, 10);
  PartOutcomeList outcomes = pool.Run(
      parts, boost::bind(&ConcurrencyProbe::Transport, &probe, _1, 1, 2));

  ASSERT_EQ(6u, outcomes.size());
  EXPECT_EQ(3u, probe.GetCalls());
  EXPECT_TRUE(outcomes[0].success);
  EXPECT_TRUE(outcomes[1].success);
  EXPECT_FALSE(outcomes[2].success);
  EXPECT_TRUE(outcomes[2].attempted);
  EXPECT_EQ(TransferError::PERMANENT, outcomes[2].error.GetError());
  for (size_t i = 3; i < outcomes.size(); ++i) {
    EXPECT_FALSE(outcomes[i].success);
    EXPECT_FALSE(outcomes[i].attempted);
    EXPECT_EQ(TransferError::INCOMPLETE_TRANSFER,
              outcomes[i].error.GetError());
  }

  const PartOutcome *failure = FindFirstFailure(outcomes);
  ASSERT_TRUE(failure != NULL);
  EXPECT_EQ(2u, failure->index);
  EXPECT_EQ(20u, GetBytesTransferred(outcomes));
}

TEST(WorkerPoolTest, StopDispatchWhenCancelled) {
  ConcurrencyProbe probe;
  WorkerPool pool(1);
  PartOutcomeList outcomes = pool.Run(
      MakeParts(5, 10),
      boost::bind(&ConcurrencyProbe::Transport, &probe, _1, 1, NO_FAILURE),
      CountDown(2));

  ASSERT_EQ(5u, outcomes.size());
  EXPECT_EQ(2u, probe.GetCalls());
  EXPECT_TRUE(outcomes[1].success);
  EXPECT_FALSE(outcomes[2].attempted);
  EXPECT_EQ(TransferError::CANCELLED, outcomes[2].error.GetError());
  EXPECT_EQ(TransferError::CANCELLED, outcomes[4].error.GetError());
}

TEST(WorkerPoolTest, TransportExceptionFailsPart) {
  WorkerPool pool(1);
  PartOutcomeList outcomes = pool.Run(MakeParts(3, 10), ThrowingTransport);
  ASSERT_EQ(3u, outcomes.size());
  EXPECT_TRUE(outcomes[0].success);
  EXPECT_FALSE(outcomes[1].success);
  EXPECT_TRUE(outcomes[1].attempted);
  EXPECT_EQ(TransferError::UNKNOWN, outcomes[1].error.GetError());
  EXPECT_FALSE(outcomes[2].attempted);
}

TEST(WorkerPoolTest, EmptyPartList) {
  WorkerPool pool(2);
  EXPECT_TRUE(pool.Run(PartList(), ThrowingTransport).empty());
}

TEST(WorkerPoolTest, PoolIsReusable) {
  ConcurrencyProbe probe;
  WorkerPool pool(2);
  pool.Run(MakeParts(4, 1), boost::bind(&ConcurrencyProbe::Transport, &probe,
                                        _1, 1, NO_FAILURE));
  pool.Run(MakeParts(4, 1), boost::bind(&ConcurrencyProbe::Transport, &probe,
                                        _1, 1, NO_FAILURE));
  EXPECT_EQ(8u, probe.GetCalls());
}

}  // namespace Transfer
}  // namespace S3Xfer

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
