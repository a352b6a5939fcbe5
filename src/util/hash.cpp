// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/hash.hpp"
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace forkscan {
namespace util {

namespace {

using EvpContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void Sha256(const uint8_t *data, size_t size, uint8_t out[SHA256_DIGEST_LENGTH]) {
  EvpContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned int out_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1 ||
      out_len != SHA256_DIGEST_LENGTH) {
    throw std::runtime_error("SHA-256 digest failed");
  }
}

} // namespace

uint256 DoubleSha256(std::span<const uint8_t> data) {
  static_assert(SHA256_DIGEST_LENGTH == 32, "SHA-256 digest must fit uint256");

  uint8_t first[SHA256_DIGEST_LENGTH];
  Sha256(data.data(), data.size(), first);

  uint256 out;
  Sha256(first, sizeof(first), out.begin());
  return out;
}

HashFunction DefaultHashFunction() {
  return [](std::span<const uint8_t> data) { return DoubleSha256(data); };
}

} // namespace util
} // namespace forkscan
