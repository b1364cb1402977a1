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

#ifndef S3XFER_CLIENT_ENCRYPTIONCONTEXT_H_
#define S3XFER_CLIENT_ENCRYPTIONCONTEXT_H_

#include <stddef.h>

#include <map>
#include <string>

#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace S3Xfer {

namespace Client {

struct EncryptionMode {
  enum Value {
    None,
    SSE_S3,   // store managed AES256 keys
    SSE_KMS,  // store managed keys in a key management service
    SSE_C     // customer provided key
  };
};

std::string GetEncryptionModeName(EncryptionMode::Value mode);

// Return None if name not belongs to {aes256, aws-kms, customer-key}
EncryptionMode::Value GetEncryptionModeByName(const std::string &name);

struct StoreRequest {
  enum Value {
    HeadObject,
    GetObject,
    PutObject,
    InitiateMultipartUpload,
    UploadPart,
    CompleteMultipartUpload,
    AbortMultipartUpload
  };
};

typedef std::map<std::string, std::string> RequestHeaders;

class EncryptionContext;
typedef Outcome<EncryptionContext, TransferClientError> EncryptionOutcome;

//
// EncryptionContext
//
// Server side encryption parameters of one transfer. A context can only be
// built through the Make* factories, which validate the parameters, so an
// invalid combination never reaches a request. The customer key integrity
// value is derived once in MakeSSEC and reused for every request.
//
class EncryptionContext {
 public:
  // No encryption
  EncryptionContext();
  EncryptionContext(const EncryptionContext &other);
  EncryptionContext &operator=(const EncryptionContext &other);

  // Wipe the customer key material
  ~EncryptionContext();

 public:
  static EncryptionOutcome MakeNone();
  static EncryptionOutcome MakeSSES3();

  // @param  : kms key id, must not be empty
  static EncryptionOutcome MakeSSEKMS(const std::string &kmsKeyId);

  // @param  : raw customer key, must be exactly GetCustomerKeyLength() bytes
  static EncryptionOutcome MakeSSEC(const std::string &customerKey);

  // AES256 key length in bytes
  static size_t GetCustomerKeyLength() { return 32; }

 public:
  EncryptionMode::Value GetMode() const { return m_mode; }
  const std::string &GetKMSKeyId() const { return m_kmsKeyId; }
  const std::string &GetCustomerKeyBase64() const { return m_keyBase64; }
  // base64 of the MD5 digest of the raw customer key
  const std::string &GetCustomerKeyMD5() const { return m_keyMD5Base64; }

  // Customer keys have to be sent with every read and write of the object
  bool IsCustomerKey() const { return m_mode == EncryptionMode::SSE_C; }

  // Get the headers a request of the given kind has to carry
  //
  // @param  : request kind
  // @return : header name to value, empty if the request needs none
  RequestHeaders GetRequestHeaders(StoreRequest::Value request) const;

  // Describe the context without any key material
  std::string ToString() const;

 private:
  void Wipe();

  EncryptionMode::Value m_mode;
  std::string m_kmsKeyId;
  std::string m_keyBase64;
  std::string m_keyMD5Base64;
};

// Build a context from command line values
//
// @param  : mode name {none, aes256, aws-kms, customer-key}, kms key id,
//           customer key
// @return : outcome with INVALID_CONFIGURATION error for bad input
EncryptionOutcome MakeEncryptionContext(const std::string &modeName,
                                        const std::string &kmsKeyId,
                                        const std::string &customerKey);

}  // namespace Client
}  // namespace S3Xfer

#endif  // S3XFER_CLIENT_ENCRYPTIONCONTEXT_H_
