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

#include "gtest/gtest.h"

#include "base/Size.h"
#include "base/StringUtils.h"

using std::string;

TEST(StringUtilsTest, ChangeCase) {
  string lowercase = "lowercase";
  EXPECT_EQ(lowercase, S3Xfer::StringUtils::ToLower("LOWerCase"));

  string uppercase = "UPPERCASE";
  EXPECT_EQ(uppercase, S3Xfer::StringUtils::ToUpper("UpperCase"));
}

TEST(StringUtilsTest, Trim) {
  string noboth = "hello world";
  char ch = ' ';

  EXPECT_EQ(noboth, S3Xfer::StringUtils::Trim("    hello world    ", ch));
  EXPECT_EQ(noboth, S3Xfer::StringUtils::Trim("    hello world", ch));
  EXPECT_EQ(noboth, S3Xfer::StringUtils::Trim("hello world    ", ch));
  EXPECT_EQ(noboth, S3Xfer::StringUtils::Trim(noboth, ch));
  EXPECT_EQ(string("x"), S3Xfer::StringUtils::Trim("--x--", '-'));
  EXPECT_EQ(string(), S3Xfer::StringUtils::Trim("    ", ch));
  EXPECT_EQ(string(), S3Xfer::StringUtils::Trim("", ch));
}

TEST(StringUtilsTest, ByteSize) {
  using S3Xfer::StringUtils::FormatByteSize;
  EXPECT_EQ(string("0.00 B (0 bytes)"), FormatByteSize(0));
  EXPECT_EQ(string("1023.00 B (1023 bytes)"), FormatByteSize(1023));
  EXPECT_EQ(string("1.00 KiB (1024 bytes)"),
            FormatByteSize(S3Xfer::Size::KB1));
  EXPECT_EQ(string("12.00 MiB (12582912 bytes)"),
            FormatByteSize(S3Xfer::Size::MB12));
  EXPECT_EQ(string("5.00 GiB (5368709120 bytes)"),
            FormatByteSize(S3Xfer::Size::GB5));
}

TEST(StringUtilsTest, ByteRange) {
  using S3Xfer::StringUtils::FormatByteRange;
  EXPECT_EQ(string("bytes=0-5242879"), FormatByteRange(0, 5242879));
  EXPECT_EQ(string("bytes=10-10"), FormatByteRange(10, 10));
}

TEST(StringUtilsTest, FormatPathAndKey) {
  using S3Xfer::StringUtils::FormatKey;
  using S3Xfer::StringUtils::FormatPath;
  EXPECT_EQ(string("[path=/tmp/a]"), FormatPath("/tmp/a"));
  EXPECT_EQ(string("[from=/tmp/a to=/tmp/b]"), FormatPath("/tmp/a", "/tmp/b"));
  EXPECT_EQ(string("[key=photos/a.jpg]"), FormatKey("photos/a.jpg"));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
