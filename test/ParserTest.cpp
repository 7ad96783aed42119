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

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Size.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "tool/Parser.h"

namespace CS {

namespace Tool {

using CS::Configure::Options;
using CS::Exception::CSException;
using CS::Logging::LogLevel;
using std::string;
using std::vector;

// Owns a mutable argv, getopt may permute it
class CommandLine {
 public:
  explicit CommandLine(const string &args) {
    Add("chanstor");
    string::size_type start = 0;
    while (start < args.size()) {
      string::size_type end = args.find(' ', start);
      if (end == string::npos) {
        end = args.size();
      }
      if (end > start) {
        Add(args.substr(start, end - start));
      }
      start = end + 1;
    }
    for (size_t i = 0; i < m_storage.size(); ++i) {
      m_argv.push_back(&m_storage[i][0]);
    }
    m_argv.push_back(NULL);
  }

  int GetArgc() const { return static_cast<int>(m_storage.size()); }
  char **GetArgv() { return &m_argv[0]; }

 private:
  void Add(const string &arg) {
    vector<char> buf(arg.begin(), arg.end());
    buf.push_back('\0');
    m_storage.push_back(buf);
  }

  vector<vector<char> > m_storage;
  vector<char *> m_argv;
};

void ParseLine(const string &args, Options *options) {
  CommandLine line(args);
  Parser::Parse(line.GetArgc(), line.GetArgv(), options);
}

TEST(ParserTest, Defaults) {
  Options options;
  ParseLine("", &options);
  EXPECT_TRUE(options.GetCommand().empty());
  EXPECT_TRUE(options.GetArguments().empty());
  EXPECT_EQ(options.GetStoreDirectory(),
            CS::Configure::Default::GetDefaultStoreDirectory());
  EXPECT_EQ(options.GetChannel(), "self");
  EXPECT_EQ(options.GetLogLevel(), LogLevel::Warn);
  EXPECT_EQ(options.GetDownloadPageSize(), CS::Size::MB1);
  EXPECT_EQ(options.GetUploadPageSize(), CS::Size::MB1);
  EXPECT_EQ(options.GetMinBufferSize(), CS::Size::MB10);
  EXPECT_EQ(options.GetMaxUploadParts(), 4000);
  EXPECT_EQ(options.GetRangeStart(), 0u);
  EXPECT_FALSE(options.HasRangeEnd());
  EXPECT_FALSE(options.IsNoTransfer());
}

TEST(ParserTest, Upload) {
  Options options;
  ParseLine("upload -s /tmp/store -c ch1 --ulpagesize 512 --minbuf 0 "
            "-m 10 -n 3 -L info -d a.txt b.txt",
            &options);
  EXPECT_EQ(options.GetCommand(), "upload");
  ASSERT_EQ(options.GetArguments().size(), 2u);
  EXPECT_EQ(options.GetArguments()[0], "a.txt");
  EXPECT_EQ(options.GetArguments()[1], "b.txt");
  EXPECT_EQ(options.GetStoreDirectory(), "/tmp/store");
  EXPECT_EQ(options.GetChannel(), "ch1");
  EXPECT_EQ(options.GetUploadPageSize(), 512 * CS::Size::KB1);
  EXPECT_EQ(options.GetMinBufferSize(), 0u);
  EXPECT_EQ(options.GetMaxUploadParts(), 10);
  EXPECT_EQ(options.GetParallelTransfers(), 3u);
  EXPECT_EQ(options.GetLogLevel(), LogLevel::Info);
  EXPECT_TRUE(options.IsDebug());
}

TEST(ParserTest, DownloadRange) {
  Options options;
  ParseLine("download --start 10 --end 99 -o out.bin --dlpagesize 64 "
            "ch1:1:100 ch1:2:50",
            &options);
  EXPECT_EQ(options.GetCommand(), "download");
  EXPECT_EQ(options.GetArguments().size(), 2u);
  EXPECT_EQ(options.GetRangeStart(), 10u);
  ASSERT_TRUE(options.HasRangeEnd());
  EXPECT_EQ(options.GetRangeEnd(), 99u);
  EXPECT_EQ(options.GetOutputFile(), "out.bin");
  EXPECT_EQ(options.GetDownloadPageSize(), 64 * CS::Size::KB1);
}

TEST(ParserTest, NonPositiveFallsBackToDefault) {
  Options options;
  ParseLine("-m 0 -n -2 --ulpagesize 0", &options);
  EXPECT_EQ(options.GetMaxUploadParts(), 4000);
  EXPECT_EQ(options.GetParallelTransfers(),
            CS::Configure::Default::GetDefaultParallelTransfers());
  EXPECT_EQ(options.GetUploadPageSize(), CS::Size::MB1);
}

TEST(ParserTest, HelpAndVersion) {
  Options help;
  ParseLine("-h", &help);
  EXPECT_TRUE(help.IsShowHelp());
  EXPECT_TRUE(help.IsNoTransfer());

  Options version;
  ParseLine("--version", &version);
  EXPECT_TRUE(version.IsShowVersion());
  EXPECT_TRUE(version.IsNoTransfer());
}

TEST(ParserTest, Flags) {
  Options options;
  ParseLine("-C -f", &options);
  EXPECT_TRUE(options.IsClearLogDir());
  EXPECT_TRUE(options.IsForeground());
  EXPECT_FALSE(options.IsDebug());
}

TEST(ParserTest, BadInput) {
  Options options;
  EXPECT_THROW(ParseLine("--unknown", &options), CSException);
  EXPECT_THROW(ParseLine("-x", &options), CSException);
  EXPECT_THROW(ParseLine("-m", &options), CSException);
  EXPECT_THROW(ParseLine("-m ten", &options), CSException);
  EXPECT_THROW(ParseLine("--start -1", &options), CSException);
  EXPECT_THROW(ParseLine("-L verbose", &options), CSException);
  EXPECT_THROW(Parser::Parse(0, NULL, NULL), CSException);
}

}  // namespace Tool
}  // namespace CS

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
