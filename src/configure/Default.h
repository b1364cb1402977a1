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

#ifndef S3XFER_CONFIGURE_DEFAULT_H_
#define S3XFER_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>
#include <vector>

namespace S3Xfer {

namespace Configure {

namespace Default {

const char* GetProgramName();
const char* GetProgramVersion();

std::string GetDefaultLogDirectory();
std::string GetDefaultLogLevelName();
uint32_t GetMaxLogSizeMB();
std::vector<std::string> GetMimeFiles();
std::string GetDefaultContentType();

mode_t GetDefineFileMode();
mode_t GetDefineDirMode();

uint64_t GetDefaultChunkSize();  // in bytes
int GetDefaultWorkerCount();
uint16_t GetDefaultTransactionRetries();
uint32_t GetDefaultRetryScaleFactor();          // in milliseconds
uint32_t GetDefaultTransactionTimeDuration();  // in milliseconds

// Store limits
uint64_t GetSingleUploadMaxSize();
size_t GetMaxMultipartPartCount();
uint64_t GetUploadMultipartMinPartSize();

// Largest object a forced single download may buffer in memory
uint64_t GetSingleDownloadMaxSize();

// Suffix of the staging file a download writes before renaming it
const char* GetStagingFileSuffix();

}  // namespace Default
}  // namespace Configure
}  // namespace S3Xfer

#endif  // S3XFER_CONFIGURE_DEFAULT_H_
