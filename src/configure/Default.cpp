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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "base/Size.h"

namespace S3Xfer {

namespace Configure {

namespace Default {

using std::string;
using std::vector;

static const char* const PROGRAM_NAME = "s3xfer";
static const char* const PROGRAM_VERSION = "1.0.0";
static const char* const S3XFER_DEFAULT_LOG_DIR = "/tmp/s3xfer_log/";
static const char* const S3XFER_DEFAULT_LOGLEVEL_NAME = "INFO";
static const char* const MIME_FILE_DEFAULT = "/etc/mime.types";
static const char* const CONTENT_TYPE_DEFAULT = "application/octet-stream";
static const char* const STAGING_FILE_SUFFIX = ".s3xfer-part";
static uint16_t const S3XFER_DEFAULT_TRANSACTION_RETRIES = 3;
static const int S3XFER_DEFAULT_WORKERS = 4;

const char* GetProgramName() { return PROGRAM_NAME; }
const char* GetProgramVersion() { return PROGRAM_VERSION; }

string GetDefaultLogDirectory() { return S3XFER_DEFAULT_LOG_DIR; }
string GetDefaultLogLevelName() { return S3XFER_DEFAULT_LOGLEVEL_NAME; }
uint32_t GetMaxLogSizeMB() { return 100; }

vector<string> GetMimeFiles() {
  vector<string> mimes;
  mimes.push_back(MIME_FILE_DEFAULT);
  return mimes;
}

string GetDefaultContentType() { return CONTENT_TYPE_DEFAULT; }

mode_t GetDefineFileMode() { return (S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH); }
mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

uint64_t GetDefaultChunkSize() { return S3Xfer::Size::MB5; }
int GetDefaultWorkerCount() { return S3XFER_DEFAULT_WORKERS; }

uint16_t GetDefaultTransactionRetries() {
  return S3XFER_DEFAULT_TRANSACTION_RETRIES;
}

uint32_t GetDefaultRetryScaleFactor() { return 25; }

uint32_t GetDefaultTransactionTimeDuration() {
  return 30 * 1000;  // in milliseconds
}

// S3 specific
uint64_t GetSingleUploadMaxSize() { return S3Xfer::Size::GB5; }
size_t GetMaxMultipartPartCount() { return 10000; }
uint64_t GetUploadMultipartMinPartSize() { return S3Xfer::Size::MB5; }

uint64_t GetSingleDownloadMaxSize() { return S3Xfer::Size::GB1; }

const char* GetStagingFileSuffix() { return STAGING_FILE_SUFFIX; }

}  // namespace Default
}  // namespace Configure
}  // namespace S3Xfer
