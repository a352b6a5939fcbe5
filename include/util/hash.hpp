// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <functional>
#include <span>

namespace forkscan {
namespace util {

// Hash collaborator: maps serialized frame bytes to the identity used by the
// chain index. The core never computes identities itself; it calls whatever
// function it was handed.
using HashFunction = std::function<uint256(std::span<const uint8_t>)>;

// SHA-256 applied twice over the input (OpenSSL EVP).
// Throws std::runtime_error if the digest context cannot be created.
[[nodiscard]] uint256 DoubleSha256(std::span<const uint8_t> data);

// Default hash function used by the daemon
[[nodiscard]] HashFunction DefaultHashFunction();

} // namespace util
} // namespace forkscan
