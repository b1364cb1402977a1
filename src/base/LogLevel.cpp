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

#include "base/LogLevel.h"

#include <string>

#include "base/StringUtils.h"

namespace S3Xfer {

namespace Logging {

using std::string;

namespace {

const char *const kLogLevelNames[] = {"INFO", "WARN", "ERROR", "FATAL"};

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  if (logLevel < LogLevel::Info || logLevel > LogLevel::Fatal) {
    return string();
  }
  return kLogLevelNames[logLevel];
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  string upper = S3Xfer::StringUtils::ToUpper(
      S3Xfer::StringUtils::Trim(name, ' '));
  if (upper == "WARN" || upper == "WARNING") {
    return LogLevel::Warn;
  } else if (upper == "ERROR") {
    return LogLevel::Error;
  } else if (upper == "FATAL") {
    return LogLevel::Fatal;
  }
  return LogLevel::Info;
}

// --------------------------------------------------------------------------
bool IsValidLogLevelName(const string &name) {
  string upper = S3Xfer::StringUtils::ToUpper(
      S3Xfer::StringUtils::Trim(name, ' '));
  return upper == "INFO" || upper == "WARN" || upper == "WARNING" ||
         upper == "ERROR" || upper == "FATAL";
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace S3Xfer
