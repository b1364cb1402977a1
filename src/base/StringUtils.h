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

#ifndef S3XFER_BASE_STRINGUTILS_H_
#define S3XFER_BASE_STRINGUTILS_H_

#include <stdint.h>

#include <string>

namespace S3Xfer {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

// Strip leading and trailing c
std::string Trim(const std::string &str, unsigned char c);

// Format a byte count in human readable form
//
// @param  : number of bytes
// @return : e.g. "12.00 MiB (12582912 bytes)"
std::string FormatByteSize(uint64_t bytes);

// Format an inclusive byte range as used in a Range header value
//
// @param  : first byte, last byte
// @return : e.g. "bytes=0-5242879"
std::string FormatByteRange(uint64_t first, uint64_t last);

// Format path
//
// @param  : path
// @return : formatted string
std::string FormatPath(const std::string &path);
std::string FormatPath(const std::string &from, const std::string &to);

// Format object key
//
// @param  : object key
// @return : formatted string
std::string FormatKey(const std::string &key);

}  // namespace StringUtils
}  // namespace S3Xfer

#endif  // S3XFER_BASE_STRINGUTILS_H_
