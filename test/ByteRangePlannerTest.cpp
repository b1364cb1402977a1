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

#include <stdint.h>

#include "gtest/gtest.h"

#include "base/Size.h"
#include "client/TransferError.h"
#include "transfer/ByteRangePlanner.h"
#include "transfer/Part.h"
#include "transfer/TransferTypes.h"

namespace S3Xfer {
namespace Transfer {

using S3Xfer::Client::TransferError;
using S3Xfer::Size::GB1;
using S3Xfer::Size::GB5;
using S3Xfer::Size::KB1;
using S3Xfer::Size::MB1;
using S3Xfer::Size::MB5;
using S3Xfer::Size::MB12;
using ByteRangePlanner::IsContiguous;
using ByteRangePlanner::Plan;

namespace {

const TransferDirection::Value Upload = TransferDirection::Upload;
const TransferDirection::Value Download = TransferDirection::Download;

void ExpectInvalidPlan(const PlanOutcome &outcome) {
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(TransferError::INVALID_CONFIGURATION,
            outcome.GetError().GetError());
}

}  // namespace

TEST(ByteRangePlannerTest, MultipartUploadLastPartIsShort) {
  PlanOutcome outcome = Plan(Upload, MB12, MB5, 4, StrategyOverride::Auto);
  ASSERT_TRUE(outcome.IsSuccess());
  const TransferPlan &plan = outcome.GetResult();
  EXPECT_EQ(TransferStrategy::Multipart, plan.strategy);
  ASSERT_EQ(3u, plan.parts.size());
  EXPECT_EQ(Part(0, 0, MB5), plan.parts[0]);
  EXPECT_EQ(Part(1, MB5, MB5), plan.parts[1]);
  EXPECT_EQ(Part(2, 2 * MB5, 2 * MB1), plan.parts[2]);
  EXPECT_EQ(3, plan.parts[2].GetPartNumber());
  EXPECT_EQ(MB12 - 1, plan.parts[2].GetRangeEnd());
  EXPECT_TRUE(IsContiguous(plan.parts, MB12));
}

TEST(ByteRangePlannerTest, ReplanningIsDeterministic) {
  StrategyOverride::Value overrides[] = {StrategyOverride::Auto,
                                         StrategyOverride::ForceChunked};
  uint64_t sizes[] = {0, KB1, MB5, MB12, MB12 + 1};
  for (size_t i = 0; i < sizeof(overrides) / sizeof(overrides[0]); ++i) {
    for (size_t j = 0; j < sizeof(sizes) / sizeof(sizes[0]); ++j) {
      PlanOutcome first = Plan(Download, sizes[j], MB5, 4, overrides[i]);
      PlanOutcome second = Plan(Download, sizes[j], MB5, 4, overrides[i]);
      ASSERT_TRUE(first.IsSuccess());
      ASSERT_TRUE(second.IsSuccess());
      EXPECT_EQ(first.GetResult().strategy, second.GetResult().strategy);
      EXPECT_EQ(first.GetResult().parts, second.GetResult().parts)
          << "size " << sizes[j];
    }
  }
}

TEST(ByteRangePlannerTest, SmallUploadIsSingleShot) {
  PlanOutcome outcome =
      Plan(Upload, 3 * MB1, MB5, 4, StrategyOverride::Auto);
  ASSERT_TRUE(outcome.IsSuccess());
  const TransferPlan &plan = outcome.GetResult();
  EXPECT_TRUE(plan.IsSingleShot());
  ASSERT_EQ(1u, plan.parts.size());
  EXPECT_EQ(Part(0, 0, 3 * MB1), plan.parts[0]);
}

TEST(ByteRangePlannerTest, ObjectOfExactlyOneChunkIsSingleShot) {
  PlanOutcome outcome = Plan(Download, MB5, MB5, 4, StrategyOverride::Auto);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_TRUE(outcome.GetResult().IsSingleShot());
}

TEST(ByteRangePlannerTest, EmptyObject) {
  StrategyOverride::Value overrides[] = {
      StrategyOverride::Auto, StrategyOverride::ForceSingle,
      StrategyOverride::ForceMultipart};
  for (size_t i = 0; i < sizeof(overrides) / sizeof(overrides[0]); ++i) {
    PlanOutcome outcome = Plan(Upload, 0, MB5, 4, overrides[i]);
    ASSERT_TRUE(outcome.IsSuccess());
    const TransferPlan &plan = outcome.GetResult();
    EXPECT_TRUE(plan.IsSingleShot());
    ASSERT_EQ(1u, plan.parts.size());
    EXPECT_TRUE(plan.parts[0].IsEmpty());
    EXPECT_EQ(0u, plan.parts[0].GetRangeBegin());
    EXPECT_TRUE(IsContiguous(plan.parts, 0));
  }

  PlanOutcome download = Plan(Download, 0, MB5, 4, StrategyOverride::Auto);
  ASSERT_TRUE(download.IsSuccess());
  EXPECT_TRUE(download.GetResult().IsSingleShot());
}

TEST(ByteRangePlannerTest, ForceChunkedSmallDownload) {
  PlanOutcome outcome =
      Plan(Download, KB1, MB5, 4, StrategyOverride::ForceChunked);
  ASSERT_TRUE(outcome.IsSuccess());
  const TransferPlan &plan = outcome.GetResult();
  EXPECT_EQ(TransferStrategy::Chunked, plan.strategy);
  ASSERT_EQ(1u, plan.parts.size());
  EXPECT_EQ(Part(0, 0, KB1), plan.parts[0]);
}

TEST(ByteRangePlannerTest, ForceMultipartSmallUpload) {
  PlanOutcome outcome =
      Plan(Upload, KB1, MB5, 4, StrategyOverride::ForceMultipart);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(TransferStrategy::Multipart, outcome.GetResult().strategy);
  EXPECT_EQ(1u, outcome.GetResult().parts.size());
}

TEST(ByteRangePlannerTest, ForceSingleLargeUpload) {
  PlanOutcome outcome =
      Plan(Upload, MB12, MB5, 4, StrategyOverride::ForceSingle);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_TRUE(outcome.GetResult().IsSingleShot());
  EXPECT_EQ(MB12, outcome.GetResult().parts[0].GetSize());
}

TEST(ByteRangePlannerTest, ChunkedDownload) {
  PlanOutcome outcome =
      Plan(Download, MB12 + 1, 4 * MB1, 2, StrategyOverride::Auto);
  ASSERT_TRUE(outcome.IsSuccess());
  const TransferPlan &plan = outcome.GetResult();
  EXPECT_EQ(TransferStrategy::Chunked, plan.strategy);
  ASSERT_EQ(4u, plan.parts.size());
  EXPECT_EQ(1u, plan.parts[3].GetSize());
  EXPECT_TRUE(IsContiguous(plan.parts, MB12 + 1));
}

TEST(ByteRangePlannerTest, InvalidChunkAndWorkers) {
  ExpectInvalidPlan(Plan(Upload, MB12, 0, 4, StrategyOverride::Auto));
  ExpectInvalidPlan(Plan(Upload, MB12, -1, 4, StrategyOverride::Auto));
  ExpectInvalidPlan(Plan(Download, MB12, MB5, 0, StrategyOverride::Auto));
  ExpectInvalidPlan(Plan(Download, 0, MB5, -2, StrategyOverride::Auto));
}

TEST(ByteRangePlannerTest, OverrideMustMatchDirection) {
  ExpectInvalidPlan(Plan(Upload, MB12, MB5, 4, StrategyOverride::ForceChunked));
  ExpectInvalidPlan(
      Plan(Download, MB12, MB5, 4, StrategyOverride::ForceMultipart));
}

TEST(ByteRangePlannerTest, StoreLimits) {
  // single put above the store limit
  ExpectInvalidPlan(Plan(Upload, GB5 + 1, GB5 + 1, 4, StrategyOverride::Auto));
  ExpectInvalidPlan(
      Plan(Upload, GB5 + 1, MB5, 4, StrategyOverride::ForceSingle));
  // more than 10000 parts
  ExpectInvalidPlan(Plan(Upload, 10001 * MB5, MB5, 4, StrategyOverride::Auto));
  // part above the store limit
  ExpectInvalidPlan(
      Plan(Upload, 3 * GB5, GB5 + 1, 4, StrategyOverride::Auto));
  // single download buffered above the limit
  ExpectInvalidPlan(
      Plan(Download, GB1 + 1, MB5, 4, StrategyOverride::ForceSingle));
  ExpectInvalidPlan(
      Plan(Download, 2 * GB1 + 2, GB1 + 1, 4, StrategyOverride::Auto));

  PlanOutcome maxParts =
      Plan(Upload, 10000 * MB5, MB5, 4, StrategyOverride::Auto);
  ASSERT_TRUE(maxParts.IsSuccess());
  EXPECT_EQ(10000u, maxParts.GetResult().parts.size());
}

TEST(ByteRangePlannerTest, SmallUploadChunkIsAllowed) {
  PlanOutcome outcome = Plan(Upload, 3 * MB1, MB1, 4, StrategyOverride::Auto);
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(TransferStrategy::Multipart, outcome.GetResult().strategy);
  EXPECT_EQ(3u, outcome.GetResult().parts.size());
}

TEST(ByteRangePlannerTest, PartsCoverObjectExactly) {
  uint64_t sizes[] = {1, KB1 - 1, MB5 - 1, MB5 + 1, 7 * MB5, MB12 * 3 + 17};
  int64_t chunks[] = {1, 1000, static_cast<int64_t>(MB1),
                      static_cast<int64_t>(MB5)};
  for (size_t i = 0; i < sizeof(sizes) / sizeof(sizes[0]); ++i) {
    for (size_t j = 0; j < sizeof(chunks) / sizeof(chunks[0]); ++j) {
      if (sizes[i] / static_cast<uint64_t>(chunks[j]) > 10000) {
        continue;
      }
      PlanOutcome outcome =
          Plan(Download, sizes[i], chunks[j], 3, StrategyOverride::Auto);
      ASSERT_TRUE(outcome.IsSuccess());
      const PartList &parts = outcome.GetResult().parts;
      EXPECT_TRUE(IsContiguous(parts, sizes[i]))
          << "size " << sizes[i] << " chunk " << chunks[j];
      for (size_t k = 0; k + 1 < parts.size(); ++k) {
        EXPECT_EQ(static_cast<uint64_t>(chunks[j]), parts[k].GetSize());
      }
    }
  }
}

TEST(ByteRangePlannerTest, Contiguity) {
  PartList parts;
  EXPECT_FALSE(IsContiguous(parts, 0));

  parts.push_back(Part(0, 0, 10));
  parts.push_back(Part(1, 10, 5));
  EXPECT_TRUE(IsContiguous(parts, 15));
  EXPECT_FALSE(IsContiguous(parts, 16));

  PartList gap;
  gap.push_back(Part(0, 0, 10));
  gap.push_back(Part(1, 11, 4));
  EXPECT_FALSE(IsContiguous(gap, 15));

  PartList misordered;
  misordered.push_back(Part(1, 0, 10));
  misordered.push_back(Part(0, 10, 5));
  EXPECT_FALSE(IsContiguous(misordered, 15));
}

}  // namespace Transfer
}  // namespace S3Xfer

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
