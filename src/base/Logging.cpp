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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <string>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace S3Xfer {

namespace Logging {

using S3Xfer::Exception::S3XferException;
using std::string;

static boost::once_flag initOnce = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir, LogLevel::Value level,
                     bool debug) {
  boost::call_once(initOnce,
                   boost::bind(boost::type<void>(), &Log::DoInitialize, this,
                               logdir, level, debug));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir, LogLevel::Value level,
                       bool debug) {
  SetDebug(debug);
  SetLogLevel(debug ? LogLevel::Info : level);

  if (logdir.empty() || debug) {
    FLAGS_logtostderr = 1;
    FLAGS_colorlogtostderr = true;
  } else {
    if (!S3Xfer::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw S3XferException("Unable to create log directory " + logdir +
                            " : " + strerror(errno));
    }
    if (!S3Xfer::Utils::HavePermission(logdir)) {
      throw S3XferException("Could not create logging file at " + logdir +
                            ": Permission denied");
    }

    m_logDirectory = logdir;
    // glog reads FLAGS_log_dir only when InitGoogleLogging is called.
    FLAGS_log_dir = logdir.c_str();
    FLAGS_max_log_size = S3Xfer::Configure::Default::GetMaxLogSizeMB();
    FLAGS_stop_logging_if_full_disk = true;
  }

  google::InitGoogleLogging(S3Xfer::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
}

}  // namespace Logging
}  // namespace S3Xfer
