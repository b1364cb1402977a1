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

#ifndef S3XFER_CONFIGURE_OPTIONS_H_
#define S3XFER_CONFIGURE_OPTIONS_H_

#include <stdint.h>  // for uint16_t

#include <ostream>
#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace S3Xfer {

namespace Cli {
namespace Parser {
void Parse(int argc, char **argv);

}  // namespace Parser
}  // namespace Cli

namespace Configure {

using S3Xfer::Logging::LogLevel;

struct Command {
  enum Value { None, Upload, Download };
};

std::string GetCommandName(Command::Value command);

class Options : public Singleton<Options> {
 public:
  bool IsNoTransfer() const { return m_showHelp || m_showVersion; }

  // accessor
  Command::Value GetCommand() const { return m_command; }
  const std::string &GetLocalPath() const { return m_localPath; }
  const std::string &GetObjectKey() const { return m_objectKey; }
  const std::string &GetStoreRoot() const { return m_storeRoot; }
  const std::string &GetVersionId() const { return m_versionId; }
  const std::string &GetContentType() const { return m_contentType; }
  int64_t GetChunkSizeInMB() const { return m_chunkSizeInMB; }
  int GetWorkers() const { return m_workers; }
  bool IsForceSingle() const { return m_forceSingle; }
  bool IsForceMultipart() const { return m_forceMultipart; }
  bool IsForceChunked() const { return m_forceChunked; }
  const std::string &GetEncryption() const { return m_encryption; }
  const std::string &GetKMSKeyId() const { return m_kmsKeyId; }
  const std::string &GetCustomerKey() const { return m_customerKey; }
  uint16_t GetRetries() const { return m_retries; }
  uint32_t GetRequestTimeOut() const { return m_requestTimeOut; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_debug; }
  bool IsShowHelp() const { return m_showHelp; }
  bool IsShowVersion() const { return m_showVersion; }

 private:
  Options();

  // Parsing starts from the defaults
  void ResetToDefaults();

  // mutator
  void SetCommand(Command::Value command) { m_command = command; }
  void SetLocalPath(const std::string &path) { m_localPath = path; }
  void SetObjectKey(const std::string &key) { m_objectKey = key; }
  void SetStoreRoot(const std::string &root) { m_storeRoot = root; }
  void SetVersionId(const std::string &versionId) { m_versionId = versionId; }
  void SetContentType(const std::string &type) { m_contentType = type; }
  void SetChunkSizeInMB(int64_t chunkSize) { m_chunkSizeInMB = chunkSize; }
  void SetWorkers(int workers) { m_workers = workers; }
  void SetForceSingle(bool force) { m_forceSingle = force; }
  void SetForceMultipart(bool force) { m_forceMultipart = force; }
  void SetForceChunked(bool force) { m_forceChunked = force; }
  void SetEncryption(const std::string &mode) { m_encryption = mode; }
  void SetKMSKeyId(const std::string &keyId) { m_kmsKeyId = keyId; }
  void SetCustomerKey(const std::string &key) { m_customerKey = key; }
  void SetRetries(unsigned retries) { m_retries = retries; }
  void SetRequestTimeOut(uint32_t timeout) { m_requestTimeOut = timeout; }
  void SetLogDirectory(const std::string &path) { m_logDirectory = path; }
  void SetLogLevel(LogLevel::Value level) { m_logLevel = level; }
  void SetDebug(bool debug) { m_debug = debug; }
  void SetShowHelp(bool showHelp) { m_showHelp = showHelp; }
  void SetShowVersion(bool showVersion) { m_showVersion = showVersion; }

  Command::Value m_command;
  std::string m_localPath;
  std::string m_objectKey;
  std::string m_storeRoot;  // root directory of the local object store
  std::string m_versionId;
  std::string m_contentType;
  int64_t m_chunkSizeInMB;
  int m_workers;
  bool m_forceSingle;
  bool m_forceMultipart;
  bool m_forceChunked;
  std::string m_encryption;  // none, aes256, aws-kms, customer-key
  std::string m_kmsKeyId;
  std::string m_customerKey;
  uint16_t m_retries;         // transaction retries
  uint32_t m_requestTimeOut;  // in milliseconds
  std::string m_logDirectory;
  LogLevel::Value m_logLevel;
  bool m_debug;
  bool m_showHelp;
  bool m_showVersion;

  friend class Singleton<Options>;
  friend class OptionsTest;
  friend void S3Xfer::Cli::Parser::Parse(int argc, char **argv);
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

// Customer key is never printed
std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace S3Xfer

#endif  // S3XFER_CONFIGURE_OPTIONS_H_
