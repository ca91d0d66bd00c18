#pragma once

#include <string>

namespace ink {

// Base64 helpers backed by OpenSSL's EVP block codec.
std::string Base64Encode(const std::string& data);

// Decodes standard base64 (whitespace tolerated). Returns false when the
// input is not valid base64; `out` is left empty in that case.
bool Base64Decode(const std::string& encoded, std::string* out);

// Raw 20-byte SHA-1 digest.
std::string Sha1Digest(const std::string& data);

// Cryptographically random bytes.
std::string RandomBytes(size_t count);

}  // namespace ink
