// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace forkscan {
namespace chain {

// VersionByte - Structured view of the packed first byte of a frame
//
// High nibble: protocol revision (reserved, currently 0)
// Low nibble:  message-type discriminator (reserved, currently 0)
//
// Decoded once by the frame decoder; nothing else inspects the raw byte.
struct VersionByte {
  uint8_t revision{0};
  uint8_t message_type{0};

  // Only revision 0 / message type 0 is understood by this implementation
  static constexpr uint8_t SUPPORTED_REVISION = 0;
  static constexpr uint8_t SUPPORTED_MESSAGE_TYPE = 0;

  [[nodiscard]] static constexpr VersionByte Decode(uint8_t raw) noexcept {
    return VersionByte{static_cast<uint8_t>(raw >> 4),
                       static_cast<uint8_t>(raw & 0x0f)};
  }

  [[nodiscard]] constexpr uint8_t Encode() const noexcept {
    return static_cast<uint8_t>(((revision & 0x0f) << 4) | (message_type & 0x0f));
  }

  [[nodiscard]] constexpr bool IsSupported() const noexcept {
    return revision == SUPPORTED_REVISION &&
           message_type == SUPPORTED_MESSAGE_TYPE;
  }

  friend constexpr bool operator==(const VersionByte &a, const VersionByte &b) {
    return a.revision == b.revision && a.message_type == b.message_type;
  }
};

// CBlockHeader - Fixed 45-byte frame header
class CBlockHeader
{
public:
    VersionByte version{};
    uint32_t nPayloadLength{0};     // Number of payload bytes following the header
    uint256 hashParent{};           // Opaque identity of the preceding block (null = genesis)
    uint64_t nBlockNumber{0};       // Height along this chain path

    static constexpr size_t UINT256_BYTES = 32;

    // Serialized header size: 1 + 4 + 32 + 8 = 45 bytes
    static constexpr size_t HEADER_SIZE =
        1 +                          // version
        4 +                          // payloadLength (big-endian)
        UINT256_BYTES +              // parentHash
        8;                           // blockNumber (big-endian)

    // Field offsets within the 45-byte header
    static constexpr size_t OFF_VERSION  = 0;
    static constexpr size_t OFF_LENGTH   = OFF_VERSION + 1;
    static constexpr size_t OFF_PARENT   = OFF_LENGTH + 4;
    static constexpr size_t OFF_NUMBER   = OFF_PARENT + UINT256_BYTES;

    static_assert(sizeof(uint256) == UINT256_BYTES, "uint256 must be 32 bytes");
    static_assert(HEADER_SIZE == 45, "Header size must be 45 bytes");
    static_assert(OFF_NUMBER + 8 == HEADER_SIZE, "offset math must be correct");

    using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

    void SetNull() noexcept
    {
        version = VersionByte{};
        nPayloadLength = 0;
        hashParent.SetNull();
        nBlockNumber = 0;
    }

    // Genesis blocks carry the all-zero sentinel as their parent
    [[nodiscard]] bool IsGenesis() const noexcept { return hashParent.IsNull(); }

    [[nodiscard]] HeaderBytes SerializeFixed() const noexcept;

    // Deserialize from exactly HEADER_SIZE bytes. No semantic checks: the
    // version byte is decoded but not judged here.
    [[nodiscard]] bool Deserialize(const uint8_t* data, size_t size) noexcept;

    [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes) noexcept {
        return Deserialize(bytes.data(), bytes.size());
    }

    [[nodiscard]] std::string ToString() const;
};

// CBlock - Header plus opaque payload
//
// The block's own identity is NOT part of the frame; it is derived by a hash
// collaborator over Serialize() output and supplied alongside the block.
class CBlock
{
public:
    CBlockHeader header;
    std::vector<uint8_t> payload;

    CBlock() = default;
    CBlock(const uint256 &parent, uint64_t number, std::vector<uint8_t> data);

    [[nodiscard]] size_t GetSerializedSize() const noexcept {
        return CBlockHeader::HEADER_SIZE + payload.size();
    }

    // Full wire frame: header followed by payload
    [[nodiscard]] std::vector<uint8_t> Serialize() const;

    [[nodiscard]] std::string ToString() const;
};

} // namespace chain
} // namespace forkscan
