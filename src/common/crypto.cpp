#include "runbox/common/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace runbox::common {

namespace {

bool is_base64_char(const unsigned char ch) {
  return std::isalnum(ch) != 0 || ch == '+' || ch == '/';
}

} // namespace

std::string base64_encode(const std::string &bytes) {
  if (bytes.empty()) {
    return "";
  }
  const std::size_t output_len = 4 * ((bytes.size() + 2) / 3);
  std::string output(output_len + 1, '\0');
  const int written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                      reinterpret_cast<const unsigned char *>(bytes.data()),
                      static_cast<int>(bytes.size()));
  output.resize(static_cast<std::size_t>(written));
  return output;
}

Result<std::string> base64_decode(const std::string &text) {
  std::string compact;
  compact.reserve(text.size());
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      compact.push_back(ch);
    }
  }
  if (compact.empty()) {
    return Result<std::string>::success("");
  }
  if (compact.size() % 4 != 0) {
    return Result<std::string>::failure(ErrorCode::ArchiveFormat,
                                        "Invalid base64 input: length is not a multiple of 4");
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < compact.size(); ++i) {
    const auto ch = static_cast<unsigned char>(compact[i]);
    if (ch == '=') {
      if (i + 2 < compact.size()) {
        return Result<std::string>::failure(ErrorCode::ArchiveFormat,
                                            "Invalid base64 input: misplaced padding");
      }
      ++padding;
      continue;
    }
    if (padding > 0 || !is_base64_char(ch)) {
      return Result<std::string>::failure(ErrorCode::ArchiveFormat,
                                          "Invalid base64 input: unexpected character");
    }
  }

  std::vector<unsigned char> decoded(compact.size());
  const int len =
      EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(compact.data()),
                      static_cast<int>(compact.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return Result<std::string>::failure(ErrorCode::ArchiveFormat, "Invalid base64 input");
  }

  return Result<std::string>::success(
      std::string(reinterpret_cast<const char *>(decoded.data()),
                  static_cast<std::size_t>(len) - padding));
}

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    std::random_device device;
    for (auto &byte : buffer) {
      byte = static_cast<unsigned char>(device() & 0xFF);
    }
  }
  std::ostringstream out;
  for (const unsigned char byte : buffer) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return out.str();
}

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  for (const unsigned char byte : digest) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return out.str();
}

// Compares digests so neither length nor content leaks through timing.
bool constant_time_equals(const std::string &left, const std::string &right) {
  unsigned char left_digest[SHA256_DIGEST_LENGTH];
  unsigned char right_digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(left.data()), left.size(), left_digest);
  SHA256(reinterpret_cast<const unsigned char *>(right.data()), right.size(), right_digest);
  return CRYPTO_memcmp(left_digest, right_digest, SHA256_DIGEST_LENGTH) == 0 &&
         left.size() == right.size();
}

} // namespace runbox::common
