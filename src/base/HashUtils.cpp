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

#include "base/HashUtils.h"

#include <string>
#include <vector>

#include "openssl/evp.h"

#include "base/Exception.h"

namespace S3Xfer {

namespace HashUtils {

using S3Xfer::Exception::S3XferException;
using std::string;

// --------------------------------------------------------------------------
string MD5(const char *data, size_t len) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;
  if (EVP_Digest(data, len, digest, &digestLen, EVP_md5(), NULL) != 1) {
    throw S3XferException("Fail to compute MD5 digest");
  }
  return string(reinterpret_cast<const char *>(digest), digestLen);
}

// --------------------------------------------------------------------------
string MD5(const string &data) { return MD5(data.data(), data.size()); }

// --------------------------------------------------------------------------
string Base64Encode(const string &data) {
  if (data.empty()) {
    return string();
  }
  // 4 output chars per 3 input bytes, plus the terminating null
  std::vector<unsigned char> buf(4 * ((data.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(&buf[0],
                            reinterpret_cast<const unsigned char *>(data.data()),
                            static_cast<int>(data.size()));
  return string(reinterpret_cast<const char *>(&buf[0]), len);
}

// --------------------------------------------------------------------------
string HexEncode(const string &data) {
  static const char digits[] = "0123456789abcdef";
  string hex;
  hex.reserve(data.size() * 2);
  for (string::const_iterator it = data.begin(); it != data.end(); ++it) {
    unsigned char ch = static_cast<unsigned char>(*it);
    hex.append(1, digits[ch >> 4]);
    hex.append(1, digits[ch & 0x0f]);
  }
  return hex;
}

}  // namespace HashUtils
}  // namespace S3Xfer
