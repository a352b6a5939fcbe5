// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of command-line values. Every function validates that the
 entire input is consumed, checks bounds, and returns std::nullopt on any
 error (never throws).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "util/uint.hpp"

namespace forkscan {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

// true if all characters are hex digits [0-9a-fA-F] (empty -> false)
bool IsValidHex(const std::string& str);

/**
 * Parse 64-character hexadecimal hash string (optional "0x" prefix)
 *
 * Examples:
 *   SafeParseHash("00ff...") -> valid uint256
 *   SafeParseHash("123") -> std::nullopt (wrong length)
 */
std::optional<uint256> SafeParseHash(const std::string& str);

// Split on a single-character delimiter. Empty fields are dropped.
std::vector<std::string> SplitString(const std::string& str, char delim);

} // namespace util
} // namespace forkscan
