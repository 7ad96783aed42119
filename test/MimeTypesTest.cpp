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

#include <fstream>
#include <string>

#include "gtest/gtest.h"

#include "base/Utils.h"
#include "data/MimeTypes.h"

namespace CS {

namespace Data {

using std::string;

static const char *mimeFile = "/tmp/chanstor.test.mime.types";

TEST(MimeTypesTest, LoadDefaults) {
  MimeTypes mimeTypes;
  EXPECT_EQ(mimeTypes.GetCount(), 0u);
  mimeTypes.LoadDefaults();
  EXPECT_GT(mimeTypes.GetCount(), 0u);
  EXPECT_EQ(mimeTypes.Find("txt"), "text/plain");
  EXPECT_EQ(mimeTypes.Find("PNG"), "image/png");
  EXPECT_EQ(mimeTypes.Find("nosuchext"), "");
}

TEST(MimeTypesTest, LoadFile) {
  {
    std::ofstream out(mimeFile);
    out << "# comment line\n";
    out << "\n";
    out << "application/x-chanstor\tcst cst2\n";
    out << "text/x-note note\n";
  }
  MimeTypes mimeTypes;
  ASSERT_TRUE(mimeTypes.LoadFile(mimeFile));
  EXPECT_EQ(mimeTypes.GetCount(), 3u);
  EXPECT_EQ(mimeTypes.Find("cst"), "application/x-chanstor");
  EXPECT_EQ(mimeTypes.Find("cst2"), "application/x-chanstor");
  EXPECT_EQ(mimeTypes.Find("note"), "text/x-note");
  CS::Utils::RemoveFileIfExists(mimeFile);

  MimeTypes missing;
  EXPECT_FALSE(missing.LoadFile("/tmp/chanstor.test.no.such.mime.types"));
  EXPECT_EQ(missing.GetCount(), 0u);
}

TEST(MimeTypesTest, LookupMimeType) {
  // no mime file, use the built-in entries
  InitializeMimeTypes("");
  EXPECT_EQ(LookupMimeType("/tmp/photo.jpg"), "image/jpeg");
  EXPECT_EQ(LookupMimeType("archive.tar.gz"), "application/gzip");
  EXPECT_EQ(LookupMimeType("README"), GetDefaultMimeType());
  EXPECT_EQ(LookupMimeType("trailingdot."), GetDefaultMimeType());
  EXPECT_EQ(LookupMimeType("file.unknownext"), "application/octet-stream");
}

}  // namespace Data
}  // namespace CS

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
