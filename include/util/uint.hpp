// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0,
                "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 (stored in the first byte) */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  constexpr explicit base_blob(std::span<const unsigned char> vch) : m_data() {
    assert(vch.size() == WIDTH);
    std::copy(vch.begin(), vch.end(), m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  /** Lexicographic ordering over the raw bytes */
  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  /** @name Hex representation
   *
   * Block identities are opaque byte strings, so the hex form is printed in
   * storage (wire) order: byte 0 first. SetHex() accepts exactly the form
   * GetHex() produces, with an optional "0x" prefix. Short input is
   * right-padded with zero bytes.
   * @{*/
  std::string GetHex() const;
  std::string ToString() const;
  void SetHex(std::string_view str);
  /**@}*/

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

/** 256-bit opaque blob. Used for block identities (self hash, parent hash). */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  constexpr explicit uint256(std::span<const unsigned char> vch)
      : base_blob<256>(vch) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from hex string.
 * A free function rather than a constructor so that uint256(0) can never be
 * picked up by accident through an implicit string conversion.
 */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}
