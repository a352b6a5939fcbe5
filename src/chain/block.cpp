// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "chain/endian.hpp"
#include <algorithm>
#include <sstream>

namespace forkscan {
namespace chain {

CBlockHeader::HeaderBytes CBlockHeader::SerializeFixed() const noexcept {
  HeaderBytes data{};

  data[OFF_VERSION] = version.Encode();
  endian::WriteBE32(data.data() + OFF_LENGTH, nPayloadLength);
  std::copy(hashParent.begin(), hashParent.end(), data.begin() + OFF_PARENT);
  endian::WriteBE64(data.data() + OFF_NUMBER, nBlockNumber);

  return data;
}

bool CBlockHeader::Deserialize(const uint8_t *data, size_t size) noexcept {
  if (data == nullptr || size != HEADER_SIZE) {
    return false;
  }

  version = VersionByte::Decode(data[OFF_VERSION]);
  nPayloadLength = endian::ReadBE32(data + OFF_LENGTH);
  std::copy(data + OFF_PARENT, data + OFF_PARENT + UINT256_BYTES,
            hashParent.begin());
  nBlockNumber = endian::ReadBE64(data + OFF_NUMBER);

  return true;
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader("
    << "revision=" << static_cast<int>(version.revision)
    << ", type=" << static_cast<int>(version.message_type)
    << ", payload_length=" << nPayloadLength
    << ", parent=" << hashParent.GetHex().substr(0, 16)
    << ", number=" << nBlockNumber
    << ")";
  return s.str();
}

CBlock::CBlock(const uint256 &parent, uint64_t number, std::vector<uint8_t> data)
    : payload(std::move(data)) {
  header.hashParent = parent;
  header.nBlockNumber = number;
  header.nPayloadLength = static_cast<uint32_t>(payload.size());
}

std::vector<uint8_t> CBlock::Serialize() const {
  std::vector<uint8_t> out;
  out.reserve(GetSerializedSize());

  auto fixed = header.SerializeFixed();
  out.insert(out.end(), fixed.begin(), fixed.end());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

std::string CBlock::ToString() const {
  std::stringstream s;
  s << "CBlock(" << header.ToString() << ", payload=" << payload.size()
    << " bytes)";
  return s.str();
}

} // namespace chain
} // namespace forkscan
