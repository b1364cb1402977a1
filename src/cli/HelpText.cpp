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

#include "cli/HelpText.h"

#include <iostream>

#include "boost/exception/to_string.hpp"

#include "base/Size.h"
#include "configure/Default.h"

namespace S3Xfer {
namespace Cli {
namespace HelpText {

using boost::to_string;
using S3Xfer::Configure::Default::GetDefaultChunkSize;
using S3Xfer::Configure::Default::GetDefaultLogDirectory;
using S3Xfer::Configure::Default::GetDefaultLogLevelName;
using S3Xfer::Configure::Default::GetDefaultTransactionRetries;
using S3Xfer::Configure::Default::GetDefaultTransactionTimeDuration;
using S3Xfer::Configure::Default::GetDefaultWorkerCount;
using S3Xfer::Configure::Default::GetProgramName;
using S3Xfer::Configure::Default::GetProgramVersion;
using std::cout;
using std::endl;

void ShowS3XferVersion() {
  cout << GetProgramName() << " version: " << GetProgramVersion() << endl;
}

void ShowS3XferHelp() {
  cout <<
  "Transfer large objects to and from an S3 compatible store in parallel parts.\n";
  ShowS3XferUsage();
  cout <<
  "\n"
  "Transfer Options:\n"
  "Mandatory arguments to long options are mandatory for short options too.\n"
  "  -s, --store          Root directory of the local object store\n"
  "  -c, --chunk-size     Part size(MB), default value is "
                          << to_string(GetDefaultChunkSize() / S3Xfer::Size::MB1) << "MB\n"
  "  -w, --workers        Max number of parts transferred in parallel, default\n"
  "                       value is " << to_string(GetDefaultWorkerCount()) << "\n"
  "      --force-single     Transfer the object with one request\n"
  "      --force-multipart  Upload with the multipart protocol even if small\n"
  "      --force-chunked    Download with ranged requests even if small\n"
  "  -e, --encryption     Server side encryption, one of\n"
  "                       none,aes256,aws-kms,customer-key; none by default\n"
  "      --kms-key-id     KMS key id, required by aws-kms\n"
  "      --customer-key   32 byte key, required by customer-key; the same key\n"
  "                       must be given to download the object\n"
  "      --version-id     Download this version of the object\n"
  "      --content-type   Content type of the uploaded object, looked up by\n"
  "                       file extension by default\n"
  "  -r, --retries        Number of times to retry a failed request, default\n"
  "                       value is " << to_string(GetDefaultTransactionRetries()) << " times\n"
  "  -R, --timeout        Time(milliseconds) to wait before timing out a request,\n"
  "                       default value is " << to_string(GetDefaultTransactionTimeDuration())
                                            << " milliseconds\n"
  "\n"
  "Miscellaneous Options:\n"
  "  -l, --log-dir        Specify log directory, default path is " <<
                          GetDefaultLogDirectory() << "\n" <<
  "  -L, --log-level      Min log level, message lower than this level don't logged;\n"
  "                       Specify one of following log level: INFO,WARN,ERROR,FATAL;\n"
  "                       " << GetDefaultLogLevelName() << " is set by default\n"
  "  -d, --debug          Turn on debug messages and log to STDERR\n"
  "  -h, --help           Print this help\n"
  "  -V, --version        Print version info\n"
  "\n"
  "Interrupt with Ctrl-C to cancel; an unfinished upload is aborted and a\n"
  "partial download is removed.\n";
}

void ShowS3XferUsage() {
  cout <<
  "Usage: " << GetProgramName() << " upload <LOCAL-FILE> <KEY> -s=<DIR> [options]\n"
  "       " << GetProgramName() << " download <KEY> <LOCAL-FILE> -s=<DIR> [options]\n"
  "       " << GetProgramName() << " -h | --help\n"
  "       " << GetProgramName() << " -V | --version\n";
}

}  // namespace HelpText
}  // namespace Cli
}  // namespace S3Xfer
