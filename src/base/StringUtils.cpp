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

#include "base/StringUtils.h"

#include <stdio.h>

#include <algorithm>
#include <cctype>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"

namespace S3Xfer {

namespace StringUtils {

using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::tolower(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string ToUpper(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::toupper(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string::const_iterator first =
      std::find_if(str.begin(), str.end(), ch != _1);
  if (first == str.end()) {
    return string();
  }
  string::const_reverse_iterator last =
      std::find_if(str.rbegin(), str.rend(), ch != _1);
  return string(first, last.base());
}

// --------------------------------------------------------------------------
string FormatByteSize(uint64_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  char buf[32];
  snprintf(buf, sizeof(buf), "%.2f", value);
  return string(buf) + " " + units[unit] + " (" + to_string(bytes) +
         " bytes)";
}

// --------------------------------------------------------------------------
string FormatByteRange(uint64_t first, uint64_t last) {
  return "bytes=" + to_string(first) + "-" + to_string(last);
}

// --------------------------------------------------------------------------
string FormatPath(const string &path) { return "[path=" + path + "]"; }

// --------------------------------------------------------------------------
string FormatPath(const string &from, const string &to) {
  return "[from=" + from + " to=" + to + "]";
}

// --------------------------------------------------------------------------
string FormatKey(const string &key) { return "[key=" + key + "]"; }

}  // namespace StringUtils
}  // namespace S3Xfer
