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

#include "data/LocalFile.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>   // for rename
#include <string.h>  // for strerror
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace S3Xfer {

namespace Data {

using boost::to_string;
using S3Xfer::Client::MakeGoodTransferError;
using S3Xfer::Client::MakeTransferError;
using S3Xfer::Client::TransferClientError;
using S3Xfer::Client::TransferError;
using S3Xfer::StringUtils::FormatPath;
using std::string;
using std::vector;

namespace {

TransferClientError LocalIOError(const string &message) {
  return MakeTransferError(TransferError::LOCAL_IO, "LocalIO", message);
}

}  // namespace

// --------------------------------------------------------------------------
LocalFile::LocalFile() : m_fd(-1) {}

// --------------------------------------------------------------------------
LocalFile::~LocalFile() {
  if (IsOpen()) {
    TransferClientError err = Close();
    DebugWarningIf(!S3Xfer::Client::IsGoodTransferError(err),
                   err.GetMessage());
  }
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::IOError(const string &action) const {
  return LocalIOError("Fail to " + action + ": " + strerror(errno) + " " +
                      FormatPath(m_path));
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::Open(const string &path, int flags) {
  if (IsOpen()) {
    return LocalIOError("File already open " + FormatPath(m_path));
  }
  m_path = path;
  m_fd = open(path.c_str(), flags | O_CLOEXEC,
              S3Xfer::Configure::Default::GetDefineFileMode());
  if (m_fd < 0) {
    return IOError("open file");
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::OpenForRead(const string &path) {
  return Open(path, O_RDONLY);
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::OpenForWrite(const string &path) {
  return Open(path, O_WRONLY | O_CREAT | O_TRUNC);
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::ReadAt(uint64_t offset, size_t len,
                                      vector<char> *data) const {
  data->resize(len);
  size_t done = 0;
  while (done < len) {
    ssize_t n = pread(m_fd, &(*data)[done], len - done,
                      static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return IOError("read file");
    }
    if (n == 0) {
      return LocalIOError("Unexpected end of file at offset " +
                          to_string(offset + done) + ", expect " +
                          to_string(len) + " bytes from offset " +
                          to_string(offset) + " " + FormatPath(m_path));
    }
    done += static_cast<size_t>(n);
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::WriteAt(uint64_t offset, const char *data,
                                       size_t len) {
  size_t done = 0;
  while (done < len) {
    ssize_t n = pwrite(m_fd, data + done, len - done,
                       static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return IOError("write file");
    }
    done += static_cast<size_t>(n);
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::Truncate(uint64_t size) {
  if (ftruncate(m_fd, static_cast<off_t>(size)) != 0) {
    return IOError("resize file to " + to_string(size) + " bytes");
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::Sync() {
  if (fsync(m_fd) != 0) {
    return IOError("sync file");
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::GetSize(uint64_t *size) const {
  struct stat st;
  if (fstat(m_fd, &st) != 0) {
    return IOError("stat file");
  }
  *size = static_cast<uint64_t>(st.st_size);
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError LocalFile::Close() {
  if (!IsOpen()) {
    return MakeGoodTransferError();
  }
  int fd = m_fd;
  m_fd = -1;
  if (close(fd) != 0) {
    return IOError("close file");
  }
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
TransferClientError GetLocalFileSize(const string &path, uint64_t *size) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return LocalIOError(string("Unable to access file: ") + strerror(errno) +
                        " " + FormatPath(path));
  }
  if (!S_ISREG(st.st_mode)) {
    return LocalIOError("Not a regular file " + FormatPath(path));
  }
  *size = static_cast<uint64_t>(st.st_size);
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
StagedFile::StagedFile(const string &destination)
    : m_destination(destination),
      m_stagingPath(destination +
                    S3Xfer::Configure::Default::GetStagingFileSuffix() + "." +
                    to_string(getpid())),
      m_size(0),
      m_committed(false) {}

// --------------------------------------------------------------------------
StagedFile::~StagedFile() { Discard(); }

// --------------------------------------------------------------------------
TransferClientError StagedFile::Create(uint64_t size) {
  string dir = S3Xfer::Utils::GetDirName(m_destination);
  if (!S3Xfer::Utils::CreateDirectoryIfNotExists(dir)) {
    return LocalIOError(string("Unable to create directory: ") +
                        strerror(errno) + " " + FormatPath(dir));
  }
  TransferClientError err = m_file.OpenForWrite(m_stagingPath);
  if (!S3Xfer::Client::IsGoodTransferError(err)) {
    return err;
  }
  m_size = size;
  // sized up front, so writes landing out of order never move the end
  return m_file.Truncate(size);
}

// --------------------------------------------------------------------------
TransferClientError StagedFile::WriteAt(uint64_t offset, const char *data,
                                        size_t len) {
  if (offset + len > m_size) {
    return LocalIOError("Write of " + to_string(len) + " bytes at offset " +
                        to_string(offset) + " exceeds file size " +
                        to_string(m_size) + " " + FormatPath(m_stagingPath));
  }
  return m_file.WriteAt(offset, data, len);
}

// --------------------------------------------------------------------------
TransferClientError StagedFile::Commit() {
  if (m_committed) {
    return MakeGoodTransferError();
  }
  TransferClientError err = m_file.Sync();
  if (!S3Xfer::Client::IsGoodTransferError(err)) {
    return err;
  }
  err = m_file.Close();
  if (!S3Xfer::Client::IsGoodTransferError(err)) {
    return err;
  }
  if (rename(m_stagingPath.c_str(), m_destination.c_str()) != 0) {
    return LocalIOError(string("Fail to rename: ") + strerror(errno) + " " +
                        FormatPath(m_stagingPath, m_destination));
  }
  m_committed = true;
  return MakeGoodTransferError();
}

// --------------------------------------------------------------------------
void StagedFile::Discard() {
  if (m_committed) {
    return;
  }
  TransferClientError err = m_file.Close();
  DebugWarningIf(!S3Xfer::Client::IsGoodTransferError(err), err.GetMessage());
  if (!S3Xfer::Utils::RemoveFileIfExists(m_stagingPath)) {
    Warning("Unable to remove staging file " + FormatPath(m_stagingPath));
  }
}

}  // namespace Data
}  // namespace S3Xfer
