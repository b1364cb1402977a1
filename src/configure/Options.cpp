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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/LogLevel.h"
#include "base/Size.h"
#include "configure/Default.h"

namespace S3Xfer {

namespace Configure {

using boost::to_string;
using S3Xfer::Configure::Default::GetDefaultChunkSize;
using S3Xfer::Configure::Default::GetDefaultLogDirectory;
using S3Xfer::Configure::Default::GetDefaultLogLevelName;
using S3Xfer::Configure::Default::GetDefaultTransactionRetries;
using S3Xfer::Configure::Default::GetDefaultTransactionTimeDuration;
using S3Xfer::Configure::Default::GetDefaultWorkerCount;
using S3Xfer::Logging::GetLogLevelByName;
using S3Xfer::Logging::GetLogLevelName;
using std::ostream;
using std::string;

// --------------------------------------------------------------------------
string GetCommandName(Command::Value command) {
  switch (command) {
    case Command::Upload:
      return "upload";
    case Command::Download:
      return "download";
    default:
      return "none";
  }
}

// --------------------------------------------------------------------------
Options::Options() { ResetToDefaults(); }

// --------------------------------------------------------------------------
void Options::ResetToDefaults() {
  m_command = Command::None;
  m_localPath.clear();
  m_objectKey.clear();
  m_storeRoot.clear();
  m_versionId.clear();
  m_contentType.clear();
  m_chunkSizeInMB = GetDefaultChunkSize() / S3Xfer::Size::MB1;
  m_workers = GetDefaultWorkerCount();
  m_forceSingle = false;
  m_forceMultipart = false;
  m_forceChunked = false;
  m_encryption = "none";
  m_kmsKeyId.clear();
  m_customerKey.clear();
  m_retries = GetDefaultTransactionRetries();
  m_requestTimeOut = GetDefaultTransactionTimeDuration();
  m_logDirectory = GetDefaultLogDirectory();
  m_logLevel = GetLogLevelByName(GetDefaultLogLevelName());
  m_debug = false;
  m_showHelp = false;
  m_showVersion = false;
}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  return os << "[command: " << GetCommandName(opts.m_command) << "] "
            << "[local path: " << opts.m_localPath << "] "
            << "[key: " << opts.m_objectKey << "] "
            << "[store: " << opts.m_storeRoot << "] "
            << "[version id: " << opts.m_versionId << "] "
            << "[content type: " << opts.m_contentType << "] "
            << "[chunk size(MB): " << to_string(opts.m_chunkSizeInMB) << "] "
            << "[workers: " << to_string(opts.m_workers) << "] "
            << std::boolalpha
            << "[force single: " << opts.m_forceSingle << "] "
            << "[force multipart: " << opts.m_forceMultipart << "] "
            << "[force chunked: " << opts.m_forceChunked << "] "
            << "[encryption: " << opts.m_encryption << "] "
            << "[kms key id: " << opts.m_kmsKeyId << "] "
            << "[customer key: "
            << (opts.m_customerKey.empty() ? "" : "<hidden>") << "] "
            << "[retries: " << to_string(opts.m_retries) << "] "
            << "[req timeout(ms): " << to_string(opts.m_requestTimeOut)
            << "] "
            << "[log directory: " << opts.m_logDirectory << "] "
            << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
            << "[debug: " << opts.m_debug << "] "
            << "[show help: " << opts.m_showHelp << "] "
            << "[show version: " << opts.m_showVersion << "]"
            << std::noboolalpha;
}

}  // namespace Configure
}  // namespace S3Xfer
