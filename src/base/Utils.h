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

#ifndef S3XFER_BASE_UTILS_H_
#define S3XFER_BASE_UTILS_H_

#include <string>
#include <utility>

namespace S3Xfer {

namespace Utils {

// Create directory, including any missing parent
//
// @param  : dir path
// @return : bool
bool CreateDirectoryIfNotExists(const std::string &path);

// Remove file if it exists
//
// @param  : file path
// @return : bool
bool RemoveFileIfExists(const std::string &path);

// Delete all files in the directory
//
// @param  : dir path, flag to delete the directory itself
// @return : {true, ""} if succeed, {false, error message} otherwise
std::pair<bool, std::string> DeleteFilesInDirectory(const std::string &path,
                                                    bool deleteSelf);

// Check if the process can write and search in directory
bool HavePermission(const std::string &path);

bool IsRootDirectory(const std::string &path);

// Append '/' to the path if it has none
std::string AppendPathDelim(const std::string &path);

// Get directory name of path, ending with '/'
std::string GetDirName(const std::string &path);

// Get extension of the last path component without the leading dot
//
// @param  : path
// @return : extension, or empty string if it has none
std::string GetFileExtension(const std::string &path);

}  // namespace Utils
}  // namespace S3Xfer

#endif  // S3XFER_BASE_UTILS_H_
