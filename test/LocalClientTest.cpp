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
#include <sys/stat.h>  // for chmod
#include <unistd.h>    // for geteuid

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Logging.h"
#include "base/Utils.h"
#include "client/BackendTypes.h"
#include "client/Downloader.h"
#include "client/LocalClient.h"
#include "client/TransferError.h"
#include "client/Uploader.h"
#include "data/Sink.h"
#include "data/Source.h"

namespace CS {

namespace Client {

using boost::make_shared;
using boost::shared_ptr;
using CS::Data::StreamSink;
using CS::Data::StreamSource;
using CS::Utils::FileExists;
using std::string;
using std::stringstream;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/chanstor.test.logs/";
static const char *storeDir = "/tmp/chanstor.test.store/";

void InitLog() {
  CS::Utils::MakeDirectories(defaultLogDir);
  CS::Logging::Log::Instance().Initialize(defaultLogDir);
}

vector<char> ToBytes(const string &str) {
  return vector<char>(str.begin(), str.end());
}

class LocalClientTest : public Test {
 protected:
  static void SetUpTestCase() { InitLog(); }

  void SetUp() {
    CS::Utils::RemoveDirectory(storeDir);
    m_client = boost::make_shared<LocalClient>(storeDir, 3);
  }

  void TearDown() { CS::Utils::RemoveDirectory(storeDir); }

  shared_ptr<LocalClient> m_client;
};

TEST_F(LocalClientTest, Layout) {
  EXPECT_EQ(m_client->GetStoreDirectory(), storeDir);
  EXPECT_EQ(m_client->GetChannelDirectory("ch1"),
            string(storeDir) + "channels/ch1/");
  EXPECT_EQ(m_client->GetUploadDirectory(42),
            string(storeDir) + "uploads/42/");
  EXPECT_TRUE(CS::Utils::IsDirectory(m_client->GetChannelDirectory("self")));
  EXPECT_EQ(m_client->GetMaxUploadParts(), 3);
}

TEST_F(LocalClientTest, GetChannel) {
  Channel channel;
  EXPECT_EQ(m_client->GetChannel("ch1", &channel).GetError(),
            TransferError::CHANNEL_NOT_FOUND);
  EXPECT_FALSE(m_client->CreateChannel("a/b"));
  EXPECT_FALSE(m_client->CreateChannel(".."));
  EXPECT_EQ(m_client->GetChannel("..", &channel).GetError(),
            TransferError::CHANNEL_NOT_FOUND);

  ASSERT_TRUE(m_client->CreateChannel("ch1"));
  EXPECT_TRUE(IsGoodTransferError(m_client->GetChannel("ch1", &channel)));
  EXPECT_EQ(channel.m_id, "ch1");

  Channel again;
  m_client->GetChannel("ch1", &again);
  EXPECT_EQ(again.m_accessHash, channel.m_accessHash);
}

TEST_F(LocalClientTest, GetChannelWithoutPermission) {
  if (geteuid() == 0) {
    return;  // root passes every access check
  }
  ASSERT_TRUE(m_client->CreateChannel("locked"));
  string dir = m_client->GetChannelDirectory("locked");
  ASSERT_EQ(chmod(dir.c_str(), S_IRUSR | S_IXUSR), 0);

  Channel channel;
  ClientError<TransferError::Value> err =
      m_client->GetChannel("locked", &channel);
  EXPECT_EQ(err.GetError(), TransferError::ACCESS_DENIED);
  EXPECT_EQ(err.GetOperation(), "GetChannel");
  chmod(dir.c_str(), S_IRWXU);
}

TEST_F(LocalClientTest, SendFilePartsChecksIndex) {
  EXPECT_EQ(m_client->SendFileParts(1, -1, -1, ToBytes("abc")).GetError(),
            TransferError::BACKEND_PUSH_ERROR);
  EXPECT_EQ(m_client->SendFileParts(1, 3, -1, ToBytes("abc")).GetError(),
            TransferError::BACKEND_PUSH_ERROR);
  EXPECT_EQ(m_client->SendFileParts(1, 1, 3, ToBytes("abc")).GetError(),
            TransferError::BACKEND_PUSH_ERROR);
  EXPECT_TRUE(
      IsGoodTransferError(m_client->SendFileParts(1, 0, -1, ToBytes("abc"))));
  EXPECT_TRUE(FileExists(m_client->GetUploadDirectory(1) + "000000.part"));
}

TEST_F(LocalClientTest, CommitAndRead) {
  ASSERT_TRUE(m_client->CreateChannel("ch1"));
  Channel channel;
  ASSERT_TRUE(IsGoodTransferError(m_client->GetChannel("ch1", &channel)));

  ASSERT_TRUE(IsGoodTransferError(
      m_client->SendFileParts(77, 0, -1, ToBytes("hello "))));
  ASSERT_TRUE(IsGoodTransferError(
      m_client->SendFileParts(77, 1, 2, ToBytes("world"))));

  Message committed;
  ClientError<TransferError::Value> err = m_client->MoveFileToChat(
      &channel, UploadedFile(77, 2, "greeting.txt", "text/plain"), &committed);
  ASSERT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(committed.m_id, 1);
  EXPECT_EQ(committed.m_document.m_size, 11u);
  EXPECT_FALSE(FileExists(m_client->GetUploadDirectory(77)));

  Message message;
  ASSERT_TRUE(IsGoodTransferError(m_client->GetMessage(channel, 1, &message)));
  EXPECT_EQ(message.m_id, 1);
  EXPECT_EQ(message.m_document.m_id, 77u);
  EXPECT_EQ(message.m_document.m_size, 11u);
  EXPECT_EQ(message.m_fileName, "greeting.txt");
  EXPECT_EQ(message.m_mime, "text/plain");

  vector<char> bytes;
  ASSERT_TRUE(
      IsGoodTransferError(m_client->GetFile(message.m_document, 6, 4, &bytes)));
  EXPECT_EQ(string(bytes.begin(), bytes.end()), "worl");
  ASSERT_TRUE(IsGoodTransferError(
      m_client->GetFile(message.m_document, 8, 100, &bytes)));
  EXPECT_EQ(string(bytes.begin(), bytes.end()), "rld");
  ASSERT_TRUE(IsGoodTransferError(
      m_client->GetFile(message.m_document, 11, 4, &bytes)));
  EXPECT_TRUE(bytes.empty());

  // ids keep growing in a channel
  ASSERT_TRUE(
      IsGoodTransferError(m_client->SendFileParts(78, 0, 1, ToBytes("x"))));
  ASSERT_TRUE(IsGoodTransferError(m_client->MoveFileToChat(
      &channel, UploadedFile(78, 1, "x", "text/plain"), &committed)));
  EXPECT_EQ(committed.m_id, 2);
}

TEST_F(LocalClientTest, CommitWithoutChannelGoesToSelf) {
  ASSERT_TRUE(
      IsGoodTransferError(m_client->SendFileParts(5, 0, 1, ToBytes("abc"))));
  Message committed;
  ASSERT_TRUE(IsGoodTransferError(m_client->MoveFileToChat(
      NULL, UploadedFile(5, 1, "abc", "text/plain"), &committed)));
  EXPECT_TRUE(FileExists(m_client->GetChannelDirectory("self") + "1.dat"));
  EXPECT_TRUE(FileExists(m_client->GetChannelDirectory("self") + "1.meta"));
}

TEST_F(LocalClientTest, CommitChecksPageCount) {
  ASSERT_TRUE(
      IsGoodTransferError(m_client->SendFileParts(5, 0, -1, ToBytes("abc"))));
  Message committed;
  EXPECT_EQ(m_client
                ->MoveFileToChat(NULL, UploadedFile(5, 2, "abc", "text/plain"),
                                 &committed)
                .GetError(),
            TransferError::BACKEND_COMMIT_ERROR);

  Channel missing("nowhere", 0);
  EXPECT_EQ(m_client
                ->MoveFileToChat(&missing,
                                 UploadedFile(5, 1, "abc", "text/plain"),
                                 &committed)
                .GetError(),
            TransferError::CHANNEL_NOT_FOUND);
}

TEST_F(LocalClientTest, GetMessageFailures) {
  Channel channel;
  ASSERT_TRUE(IsGoodTransferError(m_client->GetChannel("self", &channel)));
  Message message;
  EXPECT_EQ(m_client->GetMessage(channel, 9, &message).GetError(),
            TransferError::MESSAGE_NOT_FOUND);

  Channel forged("self", channel.m_accessHash + 1);
  EXPECT_EQ(m_client->GetMessage(forged, 9, &message).GetError(),
            TransferError::ACCESS_DENIED);
}

TEST_F(LocalClientTest, UploadThenDownload) {
  ASSERT_TRUE(m_client->CreateChannel("ch1"));
  string content;
  for (int i = 0; i < 100; ++i) {
    content.push_back(static_cast<char>('A' + i % 26));
  }

  // three pages a portion, 100 bytes in three portions
  Uploader uploader("ul-local", m_client, "ch1", "abc.txt",
                    UploadConfigure(12, 0, "self"));
  ASSERT_TRUE(IsGoodTransferError(uploader.Prepare()));
  ClientError<TransferError::Value> err = uploader.Execute(
      boost::make_shared<StreamSource>(boost::make_shared<stringstream>(content)));
  ASSERT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);

  const PartLedger &ledger = uploader.GetLedger();
  ASSERT_EQ(ledger.GetCount(), 3u);
  vector<FilePart> parts;
  for (size_t i = 0; i < ledger.GetCount(); ++i) {
    const shared_ptr<FilePortion> &portion = ledger.GetPortions()[i];
    ASSERT_TRUE(portion->m_hasMessageId);
    parts.push_back(FilePart("ch1", portion->m_messageId, portion->m_size));
  }
  EXPECT_EQ(ledger.GetPortions()[0]->m_fileName, "abc.txt.001");

  shared_ptr<stringstream> out = boost::make_shared<stringstream>();
  Downloader whole("dl-local", parts, 0, content.size() - 1,
                   DownloadConfigure(8));
  err = whole.Execute(m_client, boost::make_shared<StreamSink>(out));
  ASSERT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(out->str(), content);

  shared_ptr<stringstream> window = boost::make_shared<stringstream>();
  Downloader ranged("dl-range", parts, 30, 79, DownloadConfigure(8));
  err = ranged.Execute(m_client, boost::make_shared<StreamSink>(window));
  ASSERT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(window->str(), content.substr(30, 50));
}

}  // namespace Client
}  // namespace CS

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
