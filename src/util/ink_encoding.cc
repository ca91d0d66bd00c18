#include "util/ink_encoding.h"
#include "core/ink_errors.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cctype>
#include <vector>

namespace ink {

std::string Base64Encode(const std::string& data) {
  if (data.empty()) {
    return std::string();
  }
  // 4 output bytes per 3 input bytes plus the terminating NUL EVP writes
  std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(buffer.data(),
                                reinterpret_cast<const unsigned char*>(data.data()),
                                static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written));
}

bool Base64Decode(const std::string& encoded, std::string* out) {
  out->clear();

  std::string compact;
  compact.reserve(encoded.size());
  for (char c : encoded) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      compact.push_back(c);
    }
  }
  if (compact.empty()) {
    return true;
  }
  if (compact.size() % 4 != 0) {
    return false;
  }

  std::vector<unsigned char> buffer(3 * (compact.size() / 4));
  int decoded = EVP_DecodeBlock(buffer.data(),
                                reinterpret_cast<const unsigned char*>(compact.data()),
                                static_cast<int>(compact.size()));
  if (decoded < 0) {
    return false;
  }

  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  if (compact[compact.size() - 1] == '=') padding++;
  if (compact[compact.size() - 2] == '=') padding++;

  out->assign(reinterpret_cast<const char*>(buffer.data()),
              static_cast<size_t>(decoded) - padding);
  return true;
}

std::string Sha1Digest(const std::string& data) {
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
  return std::string(reinterpret_cast<const char*>(digest), SHA_DIGEST_LENGTH);
}

std::string RandomBytes(size_t count) {
  std::vector<unsigned char> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    throw ProtocolConnectionError("OpenSSL RAND_bytes failed");
  }
  return std::string(reinterpret_cast<const char*>(bytes.data()), count);
}

}  // namespace ink
