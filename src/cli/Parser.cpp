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

#include "cli/Parser.h"

#include <errno.h>
#include <getopt.h>
#include <limits.h>
#include <stdint.h>
#include <stdlib.h>

#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace S3Xfer {
namespace Cli {
namespace Parser {

using boost::to_string;
using S3Xfer::Configure::Command;
using S3Xfer::Configure::Options;
using S3Xfer::Exception::S3XferException;
using S3Xfer::Logging::GetLogLevelByName;
using S3Xfer::Logging::IsValidLogLevelName;
using std::string;

namespace {

// values of the long only options
enum {
  OPT_FORCE_SINGLE = 256,
  OPT_FORCE_MULTIPART,
  OPT_FORCE_CHUNKED,
  OPT_KMS_KEY_ID,
  OPT_CUSTOMER_KEY,
  OPT_VERSION_ID,
  OPT_CONTENT_TYPE
};

// leading colon: a missing value is reported as ':'
const char *const shortOptionSpec = ":s:c:w:e:r:R:l:L:dhV";

const struct option longOptionSpec[] = {
    {"store",           required_argument, NULL, 's'},
    {"chunk-size",      required_argument, NULL, 'c'},
    {"workers",         required_argument, NULL, 'w'},
    {"force-single",    no_argument,       NULL, OPT_FORCE_SINGLE},
    {"force-multipart", no_argument,       NULL, OPT_FORCE_MULTIPART},
    {"force-chunked",   no_argument,       NULL, OPT_FORCE_CHUNKED},
    {"encryption",      required_argument, NULL, 'e'},
    {"kms-key-id",      required_argument, NULL, OPT_KMS_KEY_ID},
    {"customer-key",    required_argument, NULL, OPT_CUSTOMER_KEY},
    {"version-id",      required_argument, NULL, OPT_VERSION_ID},
    {"content-type",    required_argument, NULL, OPT_CONTENT_TYPE},
    {"retries",         required_argument, NULL, 'r'},
    {"timeout",         required_argument, NULL, 'R'},
    {"log-dir",         required_argument, NULL, 'l'},
    {"log-level",       required_argument, NULL, 'L'},
    {"debug",           no_argument,       NULL, 'd'},
    {"help",            no_argument,       NULL, 'h'},
    {"version",         no_argument,       NULL, 'V'},
    {NULL, 0, NULL, 0}
};

// Parse a decimal integer within [minVal, maxVal]
int64_t ParseInteger(const char *opt, const char *arg, int64_t minVal,
                     int64_t maxVal) {
  string value = arg == NULL ? string() : S3Xfer::StringUtils::Trim(arg, ' ');
  char *end = NULL;
  errno = 0;
  long long parsed = strtoll(value.c_str(), &end, 10);
  if (value.empty() || end == NULL || *end != '\0' || errno == ERANGE ||
      parsed < minVal || parsed > maxVal) {
    throw S3XferException("Invalid value '" + value + "' for option " + opt);
  }
  return static_cast<int64_t>(parsed);
}

}  // namespace

// --------------------------------------------------------------------------
void Parse(int argc, char **argv) {
  Options &options = Options::Instance();

  options.ResetToDefaults();

  // reset getopt so the command line can be parsed more than once
  optind = 0;
  opterr = 0;

  int opt = 0;
  int forceCount = 0;
  while ((opt = getopt_long(argc, argv, shortOptionSpec, longOptionSpec,
                            NULL)) != -1) {
    switch (opt) {
      case 's':
        options.SetStoreRoot(optarg);
        break;
      case 'c':
        options.SetChunkSizeInMB(ParseInteger(
            "--chunk-size", optarg,
            INT64_MIN / static_cast<int64_t>(S3Xfer::Size::MB1),
            INT64_MAX / static_cast<int64_t>(S3Xfer::Size::MB1)));
        break;
      case 'w':
        options.SetWorkers(static_cast<int>(
            ParseInteger("--workers", optarg, INT_MIN, INT_MAX)));
        break;
      case OPT_FORCE_SINGLE:
        options.SetForceSingle(true);
        ++forceCount;
        break;
      case OPT_FORCE_MULTIPART:
        options.SetForceMultipart(true);
        ++forceCount;
        break;
      case OPT_FORCE_CHUNKED:
        options.SetForceChunked(true);
        ++forceCount;
        break;
      case 'e':
        options.SetEncryption(optarg);
        break;
      case OPT_KMS_KEY_ID:
        options.SetKMSKeyId(optarg);
        break;
      case OPT_CUSTOMER_KEY:
        options.SetCustomerKey(optarg);
        break;
      case OPT_VERSION_ID:
        options.SetVersionId(optarg);
        break;
      case OPT_CONTENT_TYPE:
        options.SetContentType(optarg);
        break;
      case 'r':
        options.SetRetries(static_cast<unsigned>(
            ParseInteger("--retries", optarg, 0, UINT16_MAX)));
        break;
      case 'R':
        options.SetRequestTimeOut(static_cast<uint32_t>(
            ParseInteger("--timeout", optarg, 0, UINT32_MAX)));
        break;
      case 'l':
        options.SetLogDirectory(optarg);
        break;
      case 'L':
        if (!IsValidLogLevelName(optarg)) {
          throw S3XferException(string("Invalid log level ") + optarg +
                                ", expect one of INFO,WARN,ERROR,FATAL");
        }
        options.SetLogLevel(GetLogLevelByName(optarg));
        break;
      case 'd':
        options.SetDebug(true);
        break;
      case 'h':
        options.SetShowHelp(true);
        break;
      case 'V':
        options.SetShowVersion(true);
        break;
      case ':':
        throw S3XferException(string("Missing value for option ") +
                              argv[optind - 1]);
      default:
        throw S3XferException(string("Unrecognized option ") +
                              argv[optind - 1]);
    }
  }

  if (options.IsNoTransfer()) {
    return;
  }

  if (forceCount > 1) {
    throw S3XferException(
        "Options --force-single, --force-multipart and --force-chunked are "
        "mutually exclusive");
  }

  // positional arguments: command and two paths
  int positional = argc - optind;
  if (positional == 0) {
    throw S3XferException("Missing command, expect upload or download");
  }
  string command = argv[optind];
  if (command == "upload") {
    options.SetCommand(Command::Upload);
  } else if (command == "download") {
    options.SetCommand(Command::Download);
  } else {
    throw S3XferException("Unknown command " + command +
                          ", expect upload or download");
  }
  if (positional != 3) {
    throw S3XferException(
        command + " takes exactly 2 arguments, got " +
        to_string(positional - 1));
  }
  if (options.GetCommand() == Command::Upload) {
    options.SetLocalPath(argv[optind + 1]);
    options.SetObjectKey(argv[optind + 2]);
  } else {
    options.SetObjectKey(argv[optind + 1]);
    options.SetLocalPath(argv[optind + 2]);
  }

  if (options.GetStoreRoot().empty()) {
    throw S3XferException("Missing store directory, specify it by --store");
  }
}

}  // namespace Parser
}  // namespace Cli
}  // namespace S3Xfer
