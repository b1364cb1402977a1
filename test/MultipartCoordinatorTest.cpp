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

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/make_shared.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/shared_ptr.hpp"

#include "client/EncryptionContext.h"
#include "client/RetryStrategy.h"
#include "client/TransferError.h"
#include "data/LocalFile.h"
#include "transfer/ByteRangePlanner.h"
#include "transfer/CancellationToken.h"
#include "transfer/MultipartCoordinator.h"
#include "transfer/PartTransporter.h"
#include "transfer/WorkerPool.h"

#include "FakeObjectStoreClient.h"
#include "TestFiles.h"

namespace S3Xfer {
namespace Transfer {

using boost::scoped_ptr;
using boost::shared_ptr;
using S3Xfer::Client::CompletedPart;
using S3Xfer::Client::CompletedPartList;
using S3Xfer::Client::EncryptionContext;
using S3Xfer::Client::FakeObjectStoreClient;
using S3Xfer::Client::IsGoodTransferError;
using S3Xfer::Client::RetryStrategy;
using S3Xfer::Client::StoreRequest;
using S3Xfer::Client::TransferClientError;
using S3Xfer::Client::TransferError;
using S3Xfer::Data::LocalFile;
using std::string;
using std::vector;

static const char *const objectKey = "backup/archive.tar";

class MultipartCoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() {
    m_store = boost::make_shared<FakeObjectStoreClient>();
    m_transporter = boost::make_shared<PartTransporter>(
        m_store, objectKey, EncryptionContext(), RetryStrategy(2, 1),
        boost::make_shared<CancellationToken>());
    m_coordinator.reset(new MultipartCoordinator(m_transporter));

    string dir = S3Xfer::Test::MakeTestDirectory("MultipartCoordinatorTest");
    m_content = S3Xfer::Test::MakeContent(1000);
    m_sourcePath = dir + "source";
    S3Xfer::Test::WriteTestFile(m_sourcePath, m_content);
    ASSERT_TRUE(IsGoodTransferError(m_source.OpenForRead(m_sourcePath)));

    PlanOutcome outcome =
        ByteRangePlanner::Plan(TransferDirection::Upload, m_content.size(),
                               300, 2, StrategyOverride::Auto);
    ASSERT_TRUE(outcome.IsSuccess());
    m_parts = outcome.GetResult().parts;
    ASSERT_EQ(4u, m_parts.size());
  }

  void TearDown() { m_coordinator.reset(); }

  PartOutcomeList UploadAll() {
    WorkerPool pool(2);
    return m_coordinator->UploadParts(&pool, m_parts, m_source);
  }

 protected:
  shared_ptr<FakeObjectStoreClient> m_store;
  shared_ptr<PartTransporter> m_transporter;
  scoped_ptr<MultipartCoordinator> m_coordinator;
  vector<char> m_content;
  string m_sourcePath;
  LocalFile m_source;
  PartList m_parts;
};

TEST_F(MultipartCoordinatorTest, UploadAndComplete) {
  EXPECT_EQ(MultipartState::NotStarted, m_coordinator->GetState());
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("text/plain")));
  EXPECT_EQ(MultipartState::Initiated, m_coordinator->GetState());
  ASSERT_TRUE(m_coordinator->GetSession());
  EXPECT_FALSE(m_coordinator->GetSession()->GetUploadId().empty());

  PartOutcomeList outcomes = UploadAll();
  EXPECT_EQ(MultipartState::PartsInFlight, m_coordinator->GetState());
  EXPECT_TRUE(FindFirstFailure(outcomes) == NULL);
  EXPECT_EQ(4u, m_coordinator->GetSession()->GetRecordedPartCount());

  string eTag;
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Complete(4, &eTag)));
  EXPECT_EQ(MultipartState::Completed, m_coordinator->GetState());
  EXPECT_EQ(m_store->GetObjectETag(objectKey), eTag);
  EXPECT_EQ(m_content, m_store->GetObject(objectKey));
  EXPECT_EQ(string("text/plain"), m_store->GetObjectContentType(objectKey));

  CompletedPartList completed = m_store->GetCompletedParts();
  ASSERT_EQ(4u, completed.size());
  for (size_t i = 0; i < completed.size(); ++i) {
    EXPECT_EQ(static_cast<int>(i) + 1, completed[i].partNumber);
  }
  EXPECT_EQ(0, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));

  // completed uploads are never aborted
  EXPECT_TRUE(IsGoodTransferError(m_coordinator->Abort()));
  m_coordinator.reset();
  EXPECT_EQ(0, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));
}

TEST_F(MultipartCoordinatorTest, RetryTransientPartFailure) {
  m_store->ScriptError(StoreRequest::UploadPart, TransferError::TRANSIENT, 2);
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("")));
  PartOutcomeList outcomes = UploadAll();
  EXPECT_TRUE(FindFirstFailure(outcomes) == NULL);
  EXPECT_EQ(5, m_store->GetRequestCount(StoreRequest::UploadPart));

  string eTag;
  EXPECT_TRUE(IsGoodTransferError(m_coordinator->Complete(4, &eTag)));
}

TEST_F(MultipartCoordinatorTest, PermanentPartFailureAbortsOnce) {
  m_store->ScriptError(StoreRequest::UploadPart, TransferError::PERMANENT, 3);
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("")));
  PartOutcomeList outcomes = UploadAll();
  const PartOutcome *failure = FindFirstFailure(outcomes);
  ASSERT_TRUE(failure != NULL);
  EXPECT_EQ(TransferError::PERMANENT, failure->error.GetError());

  EXPECT_TRUE(IsGoodTransferError(m_coordinator->Abort()));
  EXPECT_EQ(MultipartState::Aborted, m_coordinator->GetState());
  EXPECT_TRUE(IsGoodTransferError(m_coordinator->Abort()));
  m_coordinator.reset();

  EXPECT_EQ(1, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));
  EXPECT_EQ(0,
            m_store->GetRequestCount(StoreRequest::CompleteMultipartUpload));
  EXPECT_EQ(0u, m_store->GetOpenUploadCount());
  EXPECT_FALSE(m_store->HasObject(objectKey));
}

TEST_F(MultipartCoordinatorTest, CompleteWithMissingPartAborts) {
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("")));
  WorkerPool pool(1);
  PartList firstTwo(m_parts.begin(), m_parts.begin() + 2);
  m_coordinator->UploadParts(&pool, firstTwo, m_source);

  string eTag;
  TransferClientError err = m_coordinator->Complete(4, &eTag);
  EXPECT_EQ(TransferError::INCOMPLETE_TRANSFER, err.GetError());
  EXPECT_EQ(MultipartState::Aborted, m_coordinator->GetState());
  EXPECT_EQ(0,
            m_store->GetRequestCount(StoreRequest::CompleteMultipartUpload));
  EXPECT_EQ(1, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));
}

TEST_F(MultipartCoordinatorTest, CompleteFailureAborts) {
  m_store->ScriptError(StoreRequest::CompleteMultipartUpload,
                       TransferError::PERMANENT);
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("")));
  UploadAll();

  string eTag;
  TransferClientError err = m_coordinator->Complete(4, &eTag);
  EXPECT_EQ(TransferError::PERMANENT, err.GetError());
  EXPECT_EQ(MultipartState::Aborted, m_coordinator->GetState());
  EXPECT_EQ(1, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));
  EXPECT_FALSE(m_store->HasObject(objectKey));
}

TEST_F(MultipartCoordinatorTest, AbortFailure) {
  m_store->ScriptError(StoreRequest::AbortMultipartUpload,
                       TransferError::PERMANENT);
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("")));
  TransferClientError err = m_coordinator->Abort();
  EXPECT_EQ(TransferError::ABORT_FAILED, err.GetError());
  EXPECT_EQ(MultipartState::Aborted, m_coordinator->GetState());

  // never retried through a second abort
  m_coordinator.reset();
  EXPECT_EQ(1, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));
}

TEST_F(MultipartCoordinatorTest, InitiateFailure) {
  m_store->ScriptError(StoreRequest::InitiateMultipartUpload,
                       TransferError::PERMANENT);
  TransferClientError err = m_coordinator->Initiate("");
  EXPECT_EQ(TransferError::PERMANENT, err.GetError());
  EXPECT_EQ(MultipartState::Aborted, m_coordinator->GetState());
  m_coordinator.reset();
  EXPECT_EQ(0, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));
}

TEST_F(MultipartCoordinatorTest, DestructorAbortsUnfinishedUpload) {
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("")));
  UploadAll();
  m_coordinator.reset();
  EXPECT_EQ(1, m_store->GetRequestCount(StoreRequest::AbortMultipartUpload));
  EXPECT_EQ(0u, m_store->GetOpenUploadCount());
}

TEST_F(MultipartCoordinatorTest, CompleteRequiresParts) {
  string eTag;
  EXPECT_FALSE(IsGoodTransferError(m_coordinator->Complete(4, &eTag)));
  ASSERT_TRUE(IsGoodTransferError(m_coordinator->Initiate("")));
  EXPECT_FALSE(IsGoodTransferError(m_coordinator->Initiate("")));
  EXPECT_FALSE(IsGoodTransferError(m_coordinator->Complete(4, &eTag)));
  EXPECT_EQ(0,
            m_store->GetRequestCount(StoreRequest::CompleteMultipartUpload));
}

TEST_F(MultipartCoordinatorTest, AbortBeforeInitiate) {
  EXPECT_TRUE(IsGoodTransferError(m_coordinator->Abort()));
  EXPECT_EQ(MultipartState::Aborted, m_coordinator->GetState());
  EXPECT_EQ(0, m_store->GetTotalRequestCount());
}

TEST(MultipartSessionTest, CompletedPartsSorted) {
  MultipartSession session("upload-1");
  session.RecordPart(3, "c");
  session.RecordPart(1, "a");
  session.RecordPart(2, "b");
  session.RecordPart(2, "b2");
  EXPECT_EQ(3u, session.GetRecordedPartCount());

  CompletedPartList parts = session.GetCompletedParts();
  ASSERT_EQ(3u, parts.size());
  EXPECT_EQ(1, parts[0].partNumber);
  EXPECT_EQ(string("b2"), parts[1].eTag);
  EXPECT_EQ(3, parts[2].partNumber);
  EXPECT_TRUE(IsGoodTransferError(ValidateCompletedParts(parts, 3)));
}

TEST(MultipartSessionTest, ValidateCompletionList) {
  CompletedPartList parts;
  parts.push_back(CompletedPart(1, "a"));
  parts.push_back(CompletedPart(3, "c"));
  EXPECT_EQ(TransferError::INCOMPLETE_TRANSFER,
            ValidateCompletedParts(parts, 3).GetError());
  EXPECT_EQ(TransferError::INCOMPLETE_TRANSFER,
            ValidateCompletedParts(parts, 2).GetError());

  CompletedPartList missingTag;
  missingTag.push_back(CompletedPart(1, ""));
  EXPECT_EQ(TransferError::INCOMPLETE_TRANSFER,
            ValidateCompletedParts(missingTag, 1).GetError());

  EXPECT_TRUE(
      IsGoodTransferError(ValidateCompletedParts(CompletedPartList(), 0)));
}

TEST(MultipartSessionTest, StateNames) {
  EXPECT_EQ(string("PartsInFlight"),
            GetMultipartStateName(MultipartState::PartsInFlight));
  EXPECT_EQ(string("Aborted"), GetMultipartStateName(MultipartState::Aborted));
}

}  // namespace Transfer
}  // namespace S3Xfer

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
