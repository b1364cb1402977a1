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

#include "client/EncryptionContext.h"

#include <string>

#include "boost/exception/to_string.hpp"
#include "openssl/crypto.h"

#include "base/HashUtils.h"
#include "base/StringUtils.h"

namespace S3Xfer {

namespace Client {

using boost::to_string;
using S3Xfer::HashUtils::Base64Encode;
using S3Xfer::HashUtils::MD5;
using std::string;

namespace {

const char *const SSE_HEADER = "x-amz-server-side-encryption";
const char *const SSE_KMS_KEY_ID_HEADER =
    "x-amz-server-side-encryption-aws-kms-key-id";
const char *const SSE_C_ALGORITHM_HEADER =
    "x-amz-server-side-encryption-customer-algorithm";
const char *const SSE_C_KEY_HEADER =
    "x-amz-server-side-encryption-customer-key";
const char *const SSE_C_KEY_MD5_HEADER =
    "x-amz-server-side-encryption-customer-key-MD5";
const char *const AES256 = "AES256";
const char *const AWS_KMS = "aws:kms";

EncryptionOutcome InvalidEncryption(const string &message) {
  return EncryptionOutcome(MakeTransferError(
      TransferError::INVALID_CONFIGURATION, "InvalidEncryption", message));
}

// Requests which create the object carry the store managed encryption mode
bool IsObjectCreation(StoreRequest::Value request) {
  return request == StoreRequest::PutObject ||
         request == StoreRequest::InitiateMultipartUpload;
}

void Cleanse(string *str) {
  if (!str->empty()) {
    OPENSSL_cleanse(&(*str)[0], str->size());
  }
  str->clear();
}

}  // namespace

// --------------------------------------------------------------------------
string GetEncryptionModeName(EncryptionMode::Value mode) {
  switch (mode) {
    case EncryptionMode::SSE_S3:
      return "aes256";
    case EncryptionMode::SSE_KMS:
      return "aws-kms";
    case EncryptionMode::SSE_C:
      return "customer-key";
    default:
      return "none";
  }
}

// --------------------------------------------------------------------------
EncryptionMode::Value GetEncryptionModeByName(const string &name) {
  string lower = S3Xfer::StringUtils::ToLower(name);
  if (lower == "aes256") {
    return EncryptionMode::SSE_S3;
  } else if (lower == "aws-kms") {
    return EncryptionMode::SSE_KMS;
  } else if (lower == "customer-key") {
    return EncryptionMode::SSE_C;
  }
  return EncryptionMode::None;
}

// --------------------------------------------------------------------------
EncryptionContext::EncryptionContext() : m_mode(EncryptionMode::None) {}

// --------------------------------------------------------------------------
EncryptionContext::EncryptionContext(const EncryptionContext &other)
    : m_mode(other.m_mode),
      m_kmsKeyId(other.m_kmsKeyId),
      m_keyBase64(other.m_keyBase64),
      m_keyMD5Base64(other.m_keyMD5Base64) {}

// --------------------------------------------------------------------------
EncryptionContext &EncryptionContext::operator=(
    const EncryptionContext &other) {
  if (&other != this) {
    Wipe();
    m_mode = other.m_mode;
    m_kmsKeyId = other.m_kmsKeyId;
    m_keyBase64 = other.m_keyBase64;
    m_keyMD5Base64 = other.m_keyMD5Base64;
  }
  return *this;
}

// --------------------------------------------------------------------------
EncryptionContext::~EncryptionContext() { Wipe(); }

// --------------------------------------------------------------------------
void EncryptionContext::Wipe() {
  Cleanse(&m_keyBase64);
  Cleanse(&m_keyMD5Base64);
}

// --------------------------------------------------------------------------
EncryptionOutcome EncryptionContext::MakeNone() {
  return EncryptionOutcome(EncryptionContext());
}

// --------------------------------------------------------------------------
EncryptionOutcome EncryptionContext::MakeSSES3() {
  EncryptionContext context;
  context.m_mode = EncryptionMode::SSE_S3;
  return EncryptionOutcome(context);
}

// --------------------------------------------------------------------------
EncryptionOutcome EncryptionContext::MakeSSEKMS(const string &kmsKeyId) {
  if (S3Xfer::StringUtils::Trim(kmsKeyId, ' ').empty()) {
    return InvalidEncryption("KMS encryption requires a key id");
  }
  EncryptionContext context;
  context.m_mode = EncryptionMode::SSE_KMS;
  context.m_kmsKeyId = kmsKeyId;
  return EncryptionOutcome(context);
}

// --------------------------------------------------------------------------
EncryptionOutcome EncryptionContext::MakeSSEC(const string &customerKey) {
  if (customerKey.size() != GetCustomerKeyLength()) {
    return InvalidEncryption(
        "Customer key must be " + to_string(GetCustomerKeyLength()) +
        " bytes, got " + to_string(customerKey.size()) + " bytes");
  }
  EncryptionContext context;
  context.m_mode = EncryptionMode::SSE_C;
  context.m_keyBase64 = Base64Encode(customerKey);
  context.m_keyMD5Base64 = Base64Encode(MD5(customerKey));
  return EncryptionOutcome(context);
}

// --------------------------------------------------------------------------
RequestHeaders EncryptionContext::GetRequestHeaders(
    StoreRequest::Value request) const {
  RequestHeaders headers;
  switch (m_mode) {
    case EncryptionMode::SSE_S3:
      if (IsObjectCreation(request)) {
        headers[SSE_HEADER] = AES256;
      }
      break;
    case EncryptionMode::SSE_KMS:
      if (IsObjectCreation(request)) {
        headers[SSE_HEADER] = AWS_KMS;
        headers[SSE_KMS_KEY_ID_HEADER] = m_kmsKeyId;
      }
      break;
    case EncryptionMode::SSE_C:
      // abort only names the upload id, it never touches object data
      if (request != StoreRequest::AbortMultipartUpload) {
        headers[SSE_C_ALGORITHM_HEADER] = AES256;
        headers[SSE_C_KEY_HEADER] = m_keyBase64;
        headers[SSE_C_KEY_MD5_HEADER] = m_keyMD5Base64;
      }
      break;
    default:
      break;
  }
  return headers;
}

// --------------------------------------------------------------------------
string EncryptionContext::ToString() const {
  string str = "[encryption=" + GetEncryptionModeName(m_mode);
  if (m_mode == EncryptionMode::SSE_KMS) {
    str.append(" kms key id=" + m_kmsKeyId);
  } else if (m_mode == EncryptionMode::SSE_C) {
    str.append(" key md5=" + m_keyMD5Base64);
  }
  return str + "]";
}

// --------------------------------------------------------------------------
EncryptionOutcome MakeEncryptionContext(const string &modeName,
                                        const string &kmsKeyId,
                                        const string &customerKey) {
  string mode = S3Xfer::StringUtils::ToLower(modeName);
  if (mode.empty() || mode == "none") {
    if (!kmsKeyId.empty() || !customerKey.empty()) {
      return InvalidEncryption(
          "Key given without choosing an encryption mode");
    }
    return EncryptionContext::MakeNone();
  } else if (mode == "aes256") {
    return EncryptionContext::MakeSSES3();
  } else if (mode == "aws-kms") {
    return EncryptionContext::MakeSSEKMS(kmsKeyId);
  } else if (mode == "customer-key") {
    if (customerKey.empty()) {
      return InvalidEncryption(
          "Customer key is required for customer-key encryption");
    }
    return EncryptionContext::MakeSSEC(customerKey);
  }
  return InvalidEncryption("Unknown encryption mode " + modeName);
}

}  // namespace Client
}  // namespace S3Xfer
