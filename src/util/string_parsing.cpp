// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace forkscan {
namespace util {

namespace {

// Shared front end for the integer parsers: rejects empty or
// whitespace-leading input and trailing garbage.
std::optional<long long> ParseWhole(const std::string& str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWhole(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseWhole(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  auto value = ParseWhole(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int64_t>(*value);
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint256> SafeParseHash(const std::string& str) {
  std::string digits = str;
  if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    digits = digits.substr(2);
  }

  if (digits.size() != 64 || !IsValidHex(digits)) {
    return std::nullopt;
  }

  return uint256S(digits);
}

std::vector<std::string> SplitString(const std::string& str, char delim) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(delim, pos);
    if (next == std::string::npos) {
      next = str.size();
    }
    if (next > pos) {
      parts.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return parts;
}

} // namespace util
} // namespace forkscan
