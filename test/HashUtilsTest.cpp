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

#include "base/HashUtils.h"

using S3Xfer::HashUtils::Base64Encode;
using S3Xfer::HashUtils::HexEncode;
using S3Xfer::HashUtils::MD5;
using std::string;

TEST(HashUtilsTest, MD5Digest) {
  EXPECT_EQ(16u, MD5(string()).size());
  EXPECT_EQ(string("d41d8cd98f00b204e9800998ecf8427e"), HexEncode(MD5("")));
  EXPECT_EQ(string("900150983cd24fb0d6963f7d28e17f72"), HexEncode(MD5("abc")));

  const char data[] = "abc";
  EXPECT_EQ(MD5(string("abc")), MD5(data, 3));
}

TEST(HashUtilsTest, Base64) {
  EXPECT_EQ(string(), Base64Encode(string()));
  EXPECT_EQ(string("YQ=="), Base64Encode("a"));
  EXPECT_EQ(string("YWI="), Base64Encode("ab"));
  EXPECT_EQ(string("YWJj"), Base64Encode("abc"));
  EXPECT_EQ(string("1B2M2Y8AsgTpgAmY7PhCfg=="), Base64Encode(MD5("")));
}

TEST(HashUtilsTest, Hex) {
  EXPECT_EQ(string(), HexEncode(string()));
  EXPECT_EQ(string("00ff10"), HexEncode(string("\x00\xff\x10", 3)));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
