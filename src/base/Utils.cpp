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

#include "base/Utils.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <dirent.h>  // for opendir readdir
#include <libgen.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <string>
#include <utility>

#include "boost/scope_exit.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace S3Xfer {

namespace Utils {

using S3Xfer::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " " + FormatPath(path);
}

bool FileExists(const string &path) {
  return access(path.c_str(), F_OK) == 0;
}

bool IsDirectory(const string &path) {
  struct stat stBuf;
  return stat(path.c_str(), &stBuf) == 0 && S_ISDIR(stBuf.st_mode);
}

string GetBaseName(const string &path) {
  char *cpy = strdup(path.c_str());
  string ret(basename(cpy));
  free(cpy);
  return ret;
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path)) {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path);
  }
  // if parent dir exist or created
  if (!CreateDirectoryIfNotExists(GetDirName(path))) {
    return false;
  }
  int errorCode =
      mkdir(path.c_str(), S3Xfer::Configure::Default::GetDefineDirMode());
  return errorCode == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  int errorCode = unlink(path.c_str());
  return (errorCode == 0 || errno == ENOENT);
}

// --------------------------------------------------------------------------
pair<bool, string> DeleteFilesInDirectory(const string &path,
                                          bool deleteSelf) {
  bool success = true;
  string msg;

  DIR *dir = opendir(path.c_str());
  BOOST_SCOPE_EXIT((dir)) {
    if (dir) {
      closedir(dir);
      dir = NULL;
    }
  }
  BOOST_SCOPE_EXIT_END

  if (dir) {
    struct dirent *nextDir = NULL;
    while ((nextDir = readdir(dir)) != NULL) {
      if (strcmp(nextDir->d_name, ".") == 0 ||
          strcmp(nextDir->d_name, "..") == 0) {
        continue;
      }

      string fullPath = AppendPathDelim(path) + nextDir->d_name;
      struct stat st;
      if (lstat(fullPath.c_str(), &st) != 0) {
        success = false;
        msg.assign("Could not get stats of file " + PostErrMsg(fullPath));
        break;
      }

      if (S_ISDIR(st.st_mode)) {
        pair<bool, string> outcome = DeleteFilesInDirectory(fullPath, true);
        if (!outcome.first) {
          success = false;
          msg.assign(outcome.second);
          break;
        }
      } else if (unlink(fullPath.c_str()) != 0) {
        success = false;
        msg.assign("Could not remove file " + PostErrMsg(fullPath));
        break;
      }
    }
  } else {
    success = false;
    msg.assign("Could not open directory " + PostErrMsg(path));
  }

  if (success && deleteSelf && rmdir(path.c_str()) != 0) {
    success = false;
    msg.assign("Could not remove dir " + PostErrMsg(path));
  }

  return make_pair(success, msg);
}

// --------------------------------------------------------------------------
bool HavePermission(const string &path) {
  return access(path.c_str(), W_OK | X_OK) == 0;
}

// --------------------------------------------------------------------------
bool IsRootDirectory(const string &path) { return path == "/"; }

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  string cpy(path);
  if (path.empty() || path[path.size() - 1] != PATH_DELIM) {
    cpy.append(1, PATH_DELIM);
  }
  return cpy;
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }

  char *cpy = strdup(path.c_str());
  string ret = AppendPathDelim(dirname(cpy));
  free(cpy);
  return ret;
}

// --------------------------------------------------------------------------
string GetFileExtension(const string &path) {
  string name = GetBaseName(path);
  string::size_type pos = name.find_last_of('.');
  // a leading dot marks a hidden file, not an extension
  if (pos == string::npos || pos == 0 || pos + 1 == name.size()) {
    return string();
  }
  return name.substr(pos + 1);
}

}  // namespace Utils
}  // namespace S3Xfer
