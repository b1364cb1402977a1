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

#include "gtest/gtest.h"

#include "client/RetryStrategy.h"
#include "client/TransferError.h"
#include "configure/Default.h"

namespace S3Xfer {
namespace Client {

TEST(RetryStrategyTest, RetryableErrorWithinBudget) {
  RetryStrategy strategy(3, 10);
  TransferClientError transient =
      MakeTransferError(TransferError::TRANSIENT, "InternalError", "");
  EXPECT_TRUE(strategy.ShouldRetry(transient, 0));
  EXPECT_TRUE(strategy.ShouldRetry(transient, 2));
  EXPECT_FALSE(strategy.ShouldRetry(transient, 3));
  EXPECT_FALSE(strategy.ShouldRetry(transient, 4));

  TransferClientError timeout =
      MakeTransferError(TransferError::REQUEST_TIMEOUT, "RequestTimeout", "");
  EXPECT_TRUE(strategy.ShouldRetry(timeout, 1));
}

TEST(RetryStrategyTest, NeverRetryPermanentError) {
  RetryStrategy strategy(3, 10);
  EXPECT_FALSE(strategy.ShouldRetry(
      MakeTransferError(TransferError::PERMANENT, "AccessDenied", ""), 0));
  EXPECT_FALSE(strategy.ShouldRetry(
      MakeTransferError(TransferError::NOT_FOUND, "NoSuchKey", ""), 0));
  EXPECT_FALSE(strategy.ShouldRetry(
      MakeTransferError(TransferError::INCONSISTENT_SOURCE, "", ""), 0));
}

TEST(RetryStrategyTest, NoRetryBudget) {
  RetryStrategy strategy(0, 10);
  EXPECT_FALSE(strategy.ShouldRetry(
      MakeTransferError(TransferError::TRANSIENT, "", ""), 0));
}

TEST(RetryStrategyTest, ExponentialDelay) {
  RetryStrategy strategy(5, 25);
  EXPECT_EQ(0u, strategy.CalculateDelayBeforeNextRetry(0));
  EXPECT_EQ(50u, strategy.CalculateDelayBeforeNextRetry(1));
  EXPECT_EQ(100u, strategy.CalculateDelayBeforeNextRetry(2));
  EXPECT_EQ(200u, strategy.CalculateDelayBeforeNextRetry(3));
  // exponent is capped
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(16),
            strategy.CalculateDelayBeforeNextRetry(100));
}

TEST(RetryStrategyTest, DefaultStrategy) {
  RetryStrategy strategy = GetDefaultRetryStrategy();
  EXPECT_EQ(S3Xfer::Configure::Default::GetDefaultTransactionRetries(),
            strategy.GetMaxRetryTimes());
  EXPECT_EQ(S3Xfer::Configure::Default::GetDefaultRetryScaleFactor(),
            strategy.GetScaleFactor());
}

}  // namespace Client
}  // namespace S3Xfer

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
