// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#include "util/identity.hpp"

#include "util/time.hpp"

#include <array>
#include <random>
#include <stdexcept>

#include <openssl/evp.h>

namespace plebnet {
namespace util {

namespace {

constexpr size_t SALT_LETTERS = 5;

std::string RandomLowercase(size_t length) {
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<int> dist('a', 'z');
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(static_cast<char>(dist(gen)));
  }
  return out;
}

}  // namespace

std::string Sha256Hex(const std::string& data) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0f]);
  }
  return hex;
}

std::string GenerateContactId(const std::string& parent_id) {
  return Sha256Hex(RandomLowercase(SALT_LETTERS) + parent_id) + std::to_string(GetTime());
}

}  // namespace util
}  // namespace plebnet
