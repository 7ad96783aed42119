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

#include <stddef.h>
#include <stdint.h>

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "FakeClient.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/Downloader.h"
#include "client/FilePortion.h"
#include "client/PartLedger.h"
#include "client/TransferError.h"
#include "client/TransferSession.h"
#include "client/Uploader.h"
#include "data/Sink.h"
#include "data/Source.h"

namespace CS {

namespace Client {

using boost::make_shared;
using boost::shared_ptr;
using CS::Data::InputSource;
using CS::Data::StreamSink;
using CS::Data::StreamSource;
using std::string;
using std::stringstream;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/chanstor.test.logs/";
void InitLog() {
  CS::Utils::MakeDirectories(defaultLogDir);
  CS::Logging::Log::Instance().Initialize(defaultLogDir);
}

// Source whose every read fails
class BrokenSource : public InputSource {
 public:
  BrokenSource() : m_destroyed(false) {}
  bool Read(char *buf, size_t size, size_t *readSize) { return false; }
  void Destroy() { m_destroyed = true; }
  bool IsDestroyed() const { return m_destroyed; }

 private:
  bool m_destroyed;
};

struct Recorder {
  Recorder() : m_completeCount(0), m_stoppedCount(0) {}

  void OnPortion(const shared_ptr<FilePortion> &portion) {
    m_portions.push_back(portion);
  }
  void OnComplete(const PartLedger &ledger, const string &channel) {
    ++m_completeCount;
    m_completeChannel = channel;
  }
  void OnStopped() { ++m_stoppedCount; }

  vector<shared_ptr<FilePortion> > m_portions;
  int m_completeCount;
  string m_completeChannel;
  int m_stoppedCount;
};

string MakeContent(size_t size) {
  string content;
  for (size_t i = 0; i < size; ++i) {
    content.push_back(static_cast<char>('a' + i % 26));
  }
  return content;
}

shared_ptr<StreamSource> MakeSource(const string &content) {
  return boost::make_shared<StreamSource>(boost::make_shared<stringstream>(content));
}

class UploaderTest : public Test {
 protected:
  static void SetUpTestCase() { InitLog(); }

  shared_ptr<Uploader> MakeUploader(const shared_ptr<FakeClient> &client,
                                    const string &channel,
                                    const string &fileName, uint64_t pageSize,
                                    uint64_t minBufferSize) {
    shared_ptr<Uploader> uploader = boost::make_shared<Uploader>(
        "ul-test", client, channel, fileName,
        UploadConfigure(pageSize, minBufferSize, "self"));
    uploader->SetPortionUploadedCallback(
        boost::bind(&Recorder::OnPortion, &m_recorder, _1));
    uploader->SetCompleteUploadCallback(
        boost::bind(&Recorder::OnComplete, &m_recorder, _1, _2));
    uploader->SetStoppedCallback(
        boost::bind(&Recorder::OnStopped, &m_recorder));
    return uploader;
  }

  Recorder m_recorder;
};

TEST_F(UploaderTest, SmallInputStaysBuffered) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "note.txt", 4, 10);
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource("abcdefg"));

  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Completed);
  EXPECT_TRUE(client->GetCalls().empty());
  EXPECT_EQ(uploader->GetBytesTransferred(), 0u);

  ASSERT_EQ(uploader->GetLedger().GetCount(), 1u);
  shared_ptr<FilePortion> portion = uploader->GetLedger().GetCurrent();
  ASSERT_TRUE(portion->IsBuffered());
  EXPECT_EQ(string(portion->m_bufferedContent->begin(),
                   portion->m_bufferedContent->end()),
            "abcdefg");
  EXPECT_EQ(portion->m_size, 7u);
  EXPECT_FALSE(portion->m_hasMessageId);
  EXPECT_TRUE(portion->m_finalized);
  EXPECT_EQ(portion->m_mime, "text/plain");

  ASSERT_EQ(m_recorder.m_portions.size(), 1u);
  EXPECT_EQ(m_recorder.m_portions[0], portion);
  EXPECT_EQ(m_recorder.m_completeCount, 1);
  EXPECT_EQ(m_recorder.m_stoppedCount, 0);
}

TEST_F(UploaderTest, InputOfMinBufferSizeStaysBuffered) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 10);
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(MakeContent(10)));

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_EQ(client->CountCalls("SendFileParts"), 0u);
  EXPECT_TRUE(uploader->GetLedger().GetCurrent()->IsBuffered());
  EXPECT_EQ(uploader->GetLedger().GetTotalSize(), 10u);
}

TEST_F(UploaderTest, EmptyInputIsBuffered) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "empty", 4, 0);
  ClientError<TransferError::Value> err = uploader->Execute(MakeSource(""));

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_TRUE(client->GetCalls().empty());
  ASSERT_EQ(uploader->GetLedger().GetCount(), 1u);
  shared_ptr<FilePortion> portion = uploader->GetLedger().GetCurrent();
  ASSERT_TRUE(portion->IsBuffered());
  EXPECT_TRUE(portion->m_bufferedContent->empty());
  EXPECT_EQ(portion->m_mime, "application/octet-stream");
  EXPECT_EQ(m_recorder.m_completeCount, 1);
}

TEST_F(UploaderTest, CrossingMinBufferFlushesPages) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 6);
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(MakeContent(10)));
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);

  vector<FakeClient::SentPage> pages = client->GetSentPages();
  ASSERT_EQ(pages.size(), 3u);
  EXPECT_EQ(pages[0].m_pageIndex, 0);
  EXPECT_EQ(pages[0].m_totalPages, -1);
  EXPECT_EQ(pages[0].m_bytes, "abcd");
  EXPECT_EQ(pages[1].m_pageIndex, 1);
  EXPECT_EQ(pages[1].m_totalPages, -1);
  EXPECT_EQ(pages[1].m_bytes, "efgh");
  EXPECT_EQ(pages[2].m_pageIndex, 2);
  EXPECT_EQ(pages[2].m_totalPages, 3);
  EXPECT_EQ(pages[2].m_bytes, "ij");
  EXPECT_EQ(uploader->GetBytesTransferred(), 10u);

  // not prepared, committed to the default destination
  vector<FakeClient::Commit> commits = client->GetCommits();
  ASSERT_EQ(commits.size(), 1u);
  EXPECT_EQ(commits[0].m_channel, "<null>");
  EXPECT_EQ(commits[0].m_parts, 3);
  EXPECT_EQ(commits[0].m_fileName, "a.bin");

  shared_ptr<FilePortion> portion = uploader->GetLedger().GetCurrent();
  EXPECT_FALSE(portion->IsBuffered());
  EXPECT_TRUE(portion->m_hasMessageId);
  EXPECT_EQ(portion->m_messageId, commits[0].m_messageId);
}

TEST_F(UploaderTest, LongInputSplitsIntoPortions) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>(2);
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "data.bin", 16, 0);
  ASSERT_TRUE(IsGoodTransferError(uploader->Prepare()));

  string content = MakeContent(16 * 3 + 10);
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(content));
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Completed);

  vector<FakeClient::SentPage> pages = client->GetSentPages();
  ASSERT_EQ(pages.size(), 4u);
  EXPECT_EQ(pages[0].m_fileId, pages[1].m_fileId);
  EXPECT_EQ(pages[2].m_fileId, pages[3].m_fileId);
  EXPECT_NE(pages[0].m_fileId, pages[2].m_fileId);
  EXPECT_EQ(pages[0].m_pageIndex, 0);
  EXPECT_EQ(pages[0].m_totalPages, -1);
  EXPECT_EQ(pages[1].m_pageIndex, 1);
  EXPECT_EQ(pages[1].m_totalPages, 2);
  EXPECT_EQ(pages[2].m_pageIndex, 0);
  EXPECT_EQ(pages[2].m_totalPages, -1);
  EXPECT_EQ(pages[3].m_pageIndex, 1);
  EXPECT_EQ(pages[3].m_totalPages, 2);
  EXPECT_EQ(pages[3].m_bytes.size(), 10u);

  vector<FakeClient::Commit> commits = client->GetCommits();
  ASSERT_EQ(commits.size(), 2u);
  EXPECT_EQ(commits[0].m_channel, "self");
  EXPECT_EQ(commits[0].m_fileName, "data.bin.001");
  EXPECT_EQ(commits[0].m_parts, 2);
  EXPECT_EQ(commits[1].m_fileName, "data.bin.002");
  EXPECT_EQ(commits[1].m_parts, 2);

  const PartLedger &ledger = uploader->GetLedger();
  ASSERT_EQ(ledger.GetCount(), 2u);
  EXPECT_EQ(ledger.GetPortions()[0]->m_size, 32u);
  EXPECT_EQ(ledger.GetPortions()[1]->m_size, 26u);
  EXPECT_EQ(ledger.GetTotalSize(), content.size());
  EXPECT_EQ(m_recorder.m_portions.size(), 2u);
  EXPECT_EQ(m_recorder.m_completeCount, 1);
  EXPECT_EQ(m_recorder.m_completeChannel, "self");

  // read the portions back as one file
  vector<FilePart> parts;
  parts.push_back(FilePart("self", commits[0].m_messageId, 32));
  parts.push_back(FilePart("self", commits[1].m_messageId, 26));
  Downloader downloader("dl-test", parts, 0, content.size() - 1,
                        DownloadConfigure(16));
  shared_ptr<stringstream> out = boost::make_shared<stringstream>();
  err = downloader.Execute(client, boost::make_shared<StreamSink>(out));
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(out->str(), content);
}

TEST_F(UploaderTest, ExactMultipleOfPortionKeepsOnePortion) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>(2);
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(MakeContent(8)));

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_EQ(client->GetSentPages().size(), 2u);
  EXPECT_EQ(client->GetCommits().size(), 1u);
  EXPECT_EQ(uploader->GetLedger().GetCount(), 1u);
  EXPECT_EQ(uploader->GetLedger().GetTotalSize(), 8u);
}

TEST_F(UploaderTest, MinBufferIsClampedBelowPortionLimit) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>(2);
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 1000);
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(MakeContent(8)));

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_EQ(uploader->GetConfigure().m_minBufferSize, 7u);
  EXPECT_EQ(client->GetSentPages().size(), 2u);
  EXPECT_EQ(client->GetCommits().size(), 1u);
  EXPECT_FALSE(uploader->GetLedger().GetCurrent()->IsBuffered());
}

TEST_F(UploaderTest, StopAfterFirstPortion) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>(2);
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  client->SetCommitHook(boost::bind(&Uploader::Stop, uploader.get()));
  shared_ptr<StreamSource> source = MakeSource(MakeContent(20));
  ClientError<TransferError::Value> err = uploader->Execute(source);

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Cancelled);
  EXPECT_TRUE(uploader->IsAborted());
  EXPECT_TRUE(source->IsDestroyed());
  EXPECT_EQ(client->GetCommits().size(), 1u);
  EXPECT_EQ(client->GetSentPages().size(), 2u);
  EXPECT_EQ(m_recorder.m_portions.size(), 1u);
  EXPECT_EQ(m_recorder.m_completeCount, 0);
  EXPECT_EQ(m_recorder.m_stoppedCount, 1);
}

TEST_F(UploaderTest, StopBeforeExecute) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  uploader->Stop();
  shared_ptr<StreamSource> source = MakeSource(MakeContent(20));
  ClientError<TransferError::Value> err = uploader->Execute(source);

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Cancelled);
  EXPECT_TRUE(source->IsDestroyed());
  EXPECT_TRUE(client->GetCalls().empty());
  EXPECT_EQ(m_recorder.m_completeCount, 0);
  EXPECT_EQ(m_recorder.m_stoppedCount, 1);
}

TEST_F(UploaderTest, StopDuringBufferFlush) {
  // five pages are buffered, the sixth crosses the threshold and the stop
  // request comes with the first flushed page
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 20);
  client->SetSendHook(boost::bind(&Uploader::Stop, uploader.get()));
  shared_ptr<StreamSource> source = MakeSource(MakeContent(40));
  ClientError<TransferError::Value> err = uploader->Execute(source);

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Cancelled);
  EXPECT_EQ(client->CountCalls("SendFileParts"), 1u);
  EXPECT_EQ(client->GetSentPages().size(), 1u);
  EXPECT_EQ(uploader->GetBytesTransferred(), 4u);
  EXPECT_TRUE(client->GetCommits().empty());
  EXPECT_TRUE(source->IsDestroyed());
  EXPECT_TRUE(m_recorder.m_portions.empty());
  EXPECT_EQ(m_recorder.m_completeCount, 0);
  EXPECT_EQ(m_recorder.m_stoppedCount, 1);
}

TEST_F(UploaderTest, StopDuringPagePush) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  client->SetSendHook(boost::bind(&Uploader::Stop, uploader.get()));
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(MakeContent(40)));

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Cancelled);
  EXPECT_EQ(client->GetSentPages().size(), 1u);
  EXPECT_TRUE(client->GetCommits().empty());
  EXPECT_EQ(m_recorder.m_completeCount, 0);
}

TEST_F(UploaderTest, StopAfterLastCommitKeepsCompleted) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  client->SetCommitHook(boost::bind(&Uploader::Stop, uploader.get()));
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(MakeContent(6)));

  EXPECT_TRUE(IsGoodTransferError(err));
  EXPECT_TRUE(uploader->IsAborted());
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Completed);
  EXPECT_EQ(client->GetSentPages().size(), 2u);
  EXPECT_EQ(client->GetCommits().size(), 1u);
  EXPECT_EQ(m_recorder.m_portions.size(), 1u);
  EXPECT_EQ(m_recorder.m_completeCount, 1);
}

TEST_F(UploaderTest, SendFailure) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  client->SetFailSendAfter(1);
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  shared_ptr<StreamSource> source = MakeSource(MakeContent(10));
  ClientError<TransferError::Value> err = uploader->Execute(source);

  EXPECT_EQ(err.GetError(), TransferError::BACKEND_PUSH_ERROR);
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Failed);
  EXPECT_EQ(uploader->GetError().GetError(), TransferError::BACKEND_PUSH_ERROR);
  EXPECT_TRUE(source->IsDestroyed());
  EXPECT_EQ(client->CountCalls("MoveFileToChat"), 0u);
  EXPECT_EQ(m_recorder.m_completeCount, 0);
}

TEST_F(UploaderTest, CommitFailure) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  client->SetFailMoveFileToChat(true);
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  ClientError<TransferError::Value> err =
      uploader->Execute(MakeSource(MakeContent(6)));

  EXPECT_EQ(err.GetError(), TransferError::BACKEND_COMMIT_ERROR);
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Failed);
  EXPECT_TRUE(m_recorder.m_portions.empty());
}

TEST_F(UploaderTest, ReadFailure) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 0);
  shared_ptr<BrokenSource> source = boost::make_shared<BrokenSource>();
  ClientError<TransferError::Value> err = uploader->Execute(source);

  EXPECT_EQ(err.GetError(), TransferError::SOURCE_READ_ERROR);
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Failed);
  EXPECT_TRUE(source->IsDestroyed());
}

TEST_F(UploaderTest, PrepareResolvesChannel) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  client->AddChannel("ch1");
  shared_ptr<Uploader> named = MakeUploader(client, "ch1", "a.bin", 4, 0);
  EXPECT_TRUE(IsGoodTransferError(named->Prepare()));
  EXPECT_TRUE(named->IsPrepared());

  shared_ptr<Uploader> fallback = MakeUploader(client, "", "a.bin", 4, 0);
  EXPECT_TRUE(IsGoodTransferError(fallback->Prepare()));
  EXPECT_EQ(fallback->GetChannelRef(), "self");

  vector<string> calls = client->GetCalls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0], "GetChannel:ch1");
  EXPECT_EQ(calls[1], "GetChannel:self");

  shared_ptr<Uploader> unknown = MakeUploader(client, "nowhere", "a", 4, 0);
  EXPECT_EQ(unknown->Prepare().GetError(), TransferError::CHANNEL_NOT_FOUND);
  EXPECT_FALSE(unknown->IsPrepared());

  client->DenyChannel("ch1");
  shared_ptr<Uploader> denied = MakeUploader(client, "ch1", "a", 4, 0);
  EXPECT_EQ(denied->Prepare().GetError(), TransferError::ACCESS_DENIED);
}

TEST_F(UploaderTest, ExecuteTwice) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 10);
  EXPECT_TRUE(IsGoodTransferError(uploader->Execute(MakeSource("abc"))));
  ClientError<TransferError::Value> err = uploader->Execute(MakeSource("abc"));
  EXPECT_EQ(err.GetError(), TransferError::ILLEGAL_STATE);
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::Completed);
}

TEST_F(UploaderTest, MissingSource) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  shared_ptr<Uploader> uploader = MakeUploader(client, "", "a.bin", 4, 10);
  ClientError<TransferError::Value> err =
      uploader->Execute(shared_ptr<InputSource>());
  EXPECT_EQ(err.GetError(), TransferError::PARAMETER_MISSING);
  EXPECT_EQ(uploader->GetStatus(), TransferStatus::NotStarted);
}

TEST_F(UploaderTest, MimeFromFileName) {
  shared_ptr<FakeClient> client = boost::make_shared<FakeClient>();
  EXPECT_EQ(MakeUploader(client, "", "/tmp/photo.png", 4, 0)->GetMime(),
            "image/png");
  EXPECT_EQ(MakeUploader(client, "", "README", 4, 0)->GetMime(),
            "application/octet-stream");
}

}  // namespace Client
}  // namespace CS

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
