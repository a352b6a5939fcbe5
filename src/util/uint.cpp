// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr char kHexChars[] = "0123456789abcdef";

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  for (uint8_t byte : m_data) {
    out.push_back(kHexChars[byte >> 4]);
    out.push_back(kHexChars[byte & 0x0f]);
  }
  return out;
}

template <unsigned int BITS> void base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }

  size_t pos = 0;
  for (int i = 0; i < WIDTH && pos < str.size(); ++i, pos += 2) {
    int hi = HexDigit(str[pos]);
    if (hi < 0)
      break;
    int lo = pos + 1 < str.size() ? HexDigit(str[pos + 1]) : -1;
    if (lo < 0) {
      // Odd trailing nibble is the high half of the last byte
      m_data[i] = static_cast<uint8_t>(hi << 4);
      break;
    }
    m_data[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template std::string base_blob<256>::GetHex() const;
template void base_blob<256>::SetHex(std::string_view);
template std::string base_blob<256>::ToString() const;

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
