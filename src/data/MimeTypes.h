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

#ifndef S3XFER_DATA_MIMETYPES_H_
#define S3XFER_DATA_MIMETYPES_H_

#include <string.h>  // for strcasecmp

#include <map>
#include <string>

#include "base/Singleton.hpp"

namespace S3Xfer {

namespace Data {

// Load the extension table once, from the mime file or the built-in table
// if the file is empty or unreadable. Later calls have no effect.
void InitializeMimeTypes(const std::string &mimeFile);

struct CaseInsensitiveCmp {
  bool operator()(const std::string &lhs, const std::string &rhs) const {
    return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
  }
};

typedef std::map<std::string, std::string, CaseInsensitiveCmp>
    ExtToMimetypeMap;

class MimeTypes : public Singleton<MimeTypes> {
 public:
  // Find Mime Type by extension
  //
  // @param  : ext, without the leading dot
  // @return : mime type, or empty string if not found
  std::string Find(const std::string &ext) const;

 private:
  MimeTypes() {}
  void Initialize(const std::string &mimeFile);
  void DoDefaultInitialize();

  // extension to mime type map, read only after initialization
  ExtToMimetypeMap m_extToMimeTypeMap;

  friend class Singleton<MimeTypes>;
  friend void InitializeMimeTypes(const std::string &mimeFile);
};

// Look up the content type of a local file
//
// @param  : e.g., "/data/index.html"
// @return : e.g., "text/html", or the default content type if unknown
std::string LookupMimeType(const std::string &path);

}  // namespace Data
}  // namespace S3Xfer


#endif  // S3XFER_DATA_MIMETYPES_H_
