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

#ifndef S3XFER_BASE_LOGMACROS_H_
#define S3XFER_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_S3XFER_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)

#else  // !DISABLE_S3XFER_LOGGING

#define S3XFER_LOG_PREFIX(level) \
  S3Xfer::Logging::GetLogLevelPrefix(S3Xfer::Logging::LogLevel::level)

// Worker threads log concurrently with the main thread, so every non-fatal
// message flushes the INFO stream to keep the log file complete when the
// process is interrupted.
#define S3XFER_LOG(severity, level, msg)               \
  {                                                    \
    LOG(severity) << S3XFER_LOG_PREFIX(level) << msg;  \
    google::FlushLogFiles(google::INFO);               \
  }

#define S3XFER_LOG_IF(severity, level, condition, msg)               \
  {                                                                  \
    LOG_IF(severity, (condition)) << S3XFER_LOG_PREFIX(level) << msg; \
    google::FlushLogFiles(google::INFO);                             \
  }

#define S3XFER_DEBUG_LOG(severity, level, msg)          \
  {                                                     \
    if (S3Xfer::Logging::Log::Instance().IsDebug()) {   \
      S3XFER_LOG(severity, level, msg)                  \
    }                                                   \
  }

#define S3XFER_DEBUG_LOG_IF(severity, level, condition, msg) \
  {                                                          \
    if (S3Xfer::Logging::Log::Instance().IsDebug()) {        \
      S3XFER_LOG_IF(severity, level, condition, msg)         \
    }                                                        \
  }

#define Info(msg) S3XFER_LOG(INFO, Info, msg)
#define Warning(msg) S3XFER_LOG(WARNING, Warn, msg)
#define Error(msg) S3XFER_LOG(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << S3XFER_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) S3XFER_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) \
  S3XFER_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) S3XFER_LOG_IF(ERROR, Error, condition, msg)

#define DebugInfo(msg) S3XFER_DEBUG_LOG(INFO, Info, msg)
#define DebugWarning(msg) S3XFER_DEBUG_LOG(WARNING, Warn, msg)
#define DebugError(msg) S3XFER_DEBUG_LOG(ERROR, Error, msg)

#define DebugInfoIf(condition, msg) \
  S3XFER_DEBUG_LOG_IF(INFO, Info, condition, msg)
#define DebugWarningIf(condition, msg) \
  S3XFER_DEBUG_LOG_IF(WARNING, Warn, condition, msg)

#endif  // DISABLE_S3XFER_LOGGING

#endif  // S3XFER_BASE_LOGMACROS_H_
