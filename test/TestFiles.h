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

#ifndef S3XFER_TEST_TESTFILES_H_
#define S3XFER_TEST_TESTFILES_H_

#include <stddef.h>
#include <unistd.h>  // for access getpid

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "boost/lexical_cast.hpp"

#include "base/Utils.h"

namespace S3Xfer {
namespace Test {

// Fresh directory under /tmp, removed with its contents first
inline std::string MakeTestDirectory(const std::string &name) {
  std::string dir = "/tmp/s3xfer.test." +
                    boost::lexical_cast<std::string>(getpid()) + "/" + name +
                    "/";
  S3Xfer::Utils::DeleteFilesInDirectory(dir, true);
  S3Xfer::Utils::CreateDirectoryIfNotExists(dir);
  return dir;
}

inline bool PathExists(const std::string &path) {
  return access(path.c_str(), F_OK) == 0;
}

// Bytes with a position dependent pattern, so misplaced ranges show up
inline std::vector<char> MakeContent(size_t size) {
  std::vector<char> content(size);
  for (size_t i = 0; i < size; ++i) {
    content[i] = static_cast<char>((i * 31 + i / 251) % 256);
  }
  return content;
}

inline void WriteTestFile(const std::string &path,
                          const std::vector<char> &content) {
  std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
  if (!content.empty()) {
    out.write(&content[0], static_cast<std::streamsize>(content.size()));
  }
}

inline std::vector<char> ReadTestFile(const std::string &path) {
  std::ifstream in(path.c_str(), std::ios::binary);
  return std::vector<char>(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
}

}  // namespace Test
}  // namespace S3Xfer

#endif  // S3XFER_TEST_TESTFILES_H_
