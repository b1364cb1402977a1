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

#include "configure/Default.h"
#include "data/MimeTypes.h"

#include "TestFiles.h"

namespace S3Xfer {
namespace Data {

using std::string;

class MimeTypesTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    string mimeFile =
        S3Xfer::Test::MakeTestDirectory("MimeTypesTest") + "mime.types";
    std::ofstream out(mimeFile.c_str());
    out << "# comment line\n"
        << "\n"
        << "text/x-s3xfer-test    sxt sxtt\n"
        << "image/png             png\n"
        << "application/x-empty\n";
    out.close();
    InitializeMimeTypes(mimeFile);
  }
};

TEST_F(MimeTypesTest, Find) {
  EXPECT_EQ(string("text/x-s3xfer-test"), MimeTypes::Instance().Find("sxt"));
  EXPECT_EQ(string("text/x-s3xfer-test"), MimeTypes::Instance().Find("sxtt"));
  EXPECT_EQ(string("image/png"), MimeTypes::Instance().Find("PNG"));
  EXPECT_TRUE(MimeTypes::Instance().Find("x-empty").empty());
  EXPECT_TRUE(MimeTypes::Instance().Find("").empty());
}

TEST_F(MimeTypesTest, LaterInitializationIgnored) {
  InitializeMimeTypes("");
  // the built-in table would map txt
  EXPECT_TRUE(MimeTypes::Instance().Find("txt").empty());
}

TEST_F(MimeTypesTest, LookupMimeType) {
  EXPECT_EQ(string("image/png"), LookupMimeType("/data/photos/cat.png"));
  EXPECT_EQ(string("text/x-s3xfer-test"), LookupMimeType("notes.SXT"));
  string defaultType = S3Xfer::Configure::Default::GetDefaultContentType();
  EXPECT_EQ(defaultType, LookupMimeType("/data/README"));
  EXPECT_EQ(defaultType, LookupMimeType("/data/archive.unknownext"));
}

}  // namespace Data
}  // namespace S3Xfer

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
