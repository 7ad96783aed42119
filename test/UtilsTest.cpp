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

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

#include "base/Utils.h"

using std::pair;
using std::string;
using std::vector;

static const char *testDir = "/tmp/chanstor.test.utils/";

void WriteFile(const string &path, const string &content) {
  std::ofstream out(path.c_str());
  out << content;
}

TEST(UtilsTest, MakeDirectories) {
  using CS::Utils::IsDirectory;
  CS::Utils::RemoveDirectory(testDir);
  string nested = string(testDir) + "channels/ch1/";
  EXPECT_TRUE(CS::Utils::MakeDirectories(nested));
  EXPECT_TRUE(IsDirectory(nested));
  // existing dir is fine
  EXPECT_TRUE(CS::Utils::MakeDirectories(string(testDir) + "channels"));
  EXPECT_FALSE(CS::Utils::MakeDirectories(""));

  // a file in the way
  WriteFile(string(testDir) + "plain", "x");
  EXPECT_FALSE(CS::Utils::MakeDirectories(string(testDir) + "plain/sub"));

  EXPECT_TRUE(CS::Utils::RemoveDirectory(testDir).first);
  EXPECT_FALSE(CS::Utils::FileExists(testDir));
}

TEST(UtilsTest, ClearDirectoryKeepsDirectory) {
  string uploads = string(testDir) + "uploads/";
  ASSERT_TRUE(CS::Utils::MakeDirectories(uploads + "7/"));
  WriteFile(uploads + "7/000000.part", "abcd");
  WriteFile(uploads + "7/000001.part", "ef");

  pair<bool, string> outcome = CS::Utils::ClearDirectory(uploads);
  EXPECT_TRUE(outcome.first) << outcome.second;
  EXPECT_TRUE(CS::Utils::IsDirectory(uploads));
  EXPECT_FALSE(CS::Utils::FileExists(uploads + "7"));

  CS::Utils::RemoveDirectory(testDir);
  EXPECT_FALSE(CS::Utils::ClearDirectory(testDir).first);
}

TEST(UtilsTest, ListFileNamesAndSize) {
  string dir = string(testDir) + "uploads/9/";
  ASSERT_TRUE(CS::Utils::MakeDirectories(dir + "nested"));
  WriteFile(dir + "000001.part", "efgh");
  WriteFile(dir + "000000.part", "abcdef");

  vector<string> names;
  EXPECT_TRUE(CS::Utils::ListFileNames(dir, &names).first);
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "000000.part");
  EXPECT_EQ(names[1], "000001.part");

  pair<bool, uint64_t> size = CS::Utils::GetFileSize(dir + "000000.part");
  EXPECT_TRUE(size.first);
  EXPECT_EQ(size.second, 6u);
  EXPECT_FALSE(CS::Utils::GetFileSize(dir + "nested").first);
  EXPECT_FALSE(CS::Utils::GetFileSize(dir + "missing").first);

  CS::Utils::RemoveDirectory(testDir);
  EXPECT_FALSE(CS::Utils::ListFileNames(dir, &names).first);
  // missing file counts as removed
  EXPECT_TRUE(CS::Utils::RemoveFileIfExists(dir + "000000.part"));
}

TEST(UtilsTest, PathHelpers) {
  using CS::Utils::AppendPathDelim;
  using CS::Utils::GetBaseName;
  EXPECT_EQ(AppendPathDelim("/store"), "/store/");
  EXPECT_EQ(AppendPathDelim("/store/"), "/store/");
  EXPECT_EQ(AppendPathDelim(""), "/");

  EXPECT_EQ(GetBaseName("/data/report.pdf"), "report.pdf");
  EXPECT_EQ(GetBaseName("report.pdf"), "report.pdf");
  EXPECT_EQ(GetBaseName("/data/inline/"), "inline");
  EXPECT_EQ(GetBaseName("/"), "/");
  EXPECT_EQ(GetBaseName(""), "");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
