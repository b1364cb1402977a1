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

#ifndef S3XFER_BASE_HASHUTILS_H_
#define S3XFER_BASE_HASHUTILS_H_

#include <stddef.h>

#include <string>

namespace S3Xfer {

namespace HashUtils {

// Compute MD5 digest
//
// @param  : data, length
// @return : raw 16 bytes digest
//
// Throw S3XferException if the digest could not be computed
std::string MD5(const char *data, size_t len);
std::string MD5(const std::string &data);

// Encode bytes in base64 with padding
std::string Base64Encode(const std::string &data);

// Encode bytes as lowercase hex
std::string HexEncode(const std::string &data);

}  // namespace HashUtils
}  // namespace S3Xfer

#endif  // S3XFER_BASE_HASHUTILS_H_
