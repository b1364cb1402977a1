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

#ifndef S3XFER_DATA_LOCALFILE_H_
#define S3XFER_DATA_LOCALFILE_H_

#include <stddef.h>
#include <stdint.h>

#include <sys/types.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"

#include "client/TransferError.h"

namespace S3Xfer {

namespace Data {

//
// LocalFile
//
// A local file accessed by offset. ReadAt and WriteAt use positional I/O,
// so parts of one open file can be read or written from several threads.
// Failures are reported as LOCAL_IO errors.
//
class LocalFile : private boost::noncopyable {
 public:
  LocalFile();
  ~LocalFile();

 public:
  S3Xfer::Client::TransferClientError OpenForRead(const std::string &path);

  // Create the file if it does not exist, truncate it otherwise
  S3Xfer::Client::TransferClientError OpenForWrite(const std::string &path);

  // Read exactly len bytes at offset
  //
  // @param  : offset, length, data (output)
  // @return : ClientError, LOCAL_IO if the file ends before offset + len
  S3Xfer::Client::TransferClientError ReadAt(uint64_t offset, size_t len,
                                             std::vector<char> *data) const;

  // Write all bytes at offset
  S3Xfer::Client::TransferClientError WriteAt(uint64_t offset,
                                              const char *data, size_t len);

  S3Xfer::Client::TransferClientError Truncate(uint64_t size);
  S3Xfer::Client::TransferClientError Sync();
  S3Xfer::Client::TransferClientError GetSize(uint64_t *size) const;
  S3Xfer::Client::TransferClientError Close();

  bool IsOpen() const { return m_fd >= 0; }
  const std::string &GetPath() const { return m_path; }

 private:
  S3Xfer::Client::TransferClientError Open(const std::string &path,
                                           int flags);
  S3Xfer::Client::TransferClientError IOError(const std::string &action) const;

  int m_fd;
  std::string m_path;
};

// Get size of a local file
//
// @param  : path, size (output)
// @return : ClientError, LOCAL_IO if the path is not a readable regular file
S3Xfer::Client::TransferClientError GetLocalFileSize(const std::string &path,
                                                     uint64_t *size);

//
// StagedFile
//
// A file written under a staging name beside its destination. Commit makes
// it visible under the destination name with one rename; a staged file that
// is never committed is removed when it is discarded or destroyed, so a
// partial write is never visible under the destination name.
//
class StagedFile : private boost::noncopyable {
 public:
  explicit StagedFile(const std::string &destination);
  ~StagedFile();

 public:
  // Create the staging file with its final size
  S3Xfer::Client::TransferClientError Create(uint64_t size);

  S3Xfer::Client::TransferClientError WriteAt(uint64_t offset,
                                              const char *data, size_t len);

  // Flush and rename to the destination
  S3Xfer::Client::TransferClientError Commit();

  // Close and remove the staging file, no effect after commit
  void Discard();

  const std::string &GetDestination() const { return m_destination; }
  const std::string &GetStagingPath() const { return m_stagingPath; }
  uint64_t GetSize() const { return m_size; }
  bool IsCommitted() const { return m_committed; }

 private:
  LocalFile m_file;
  std::string m_destination;
  std::string m_stagingPath;
  uint64_t m_size;
  bool m_committed;
};

}  // namespace Data
}  // namespace S3Xfer

#endif  // S3XFER_DATA_LOCALFILE_H_
