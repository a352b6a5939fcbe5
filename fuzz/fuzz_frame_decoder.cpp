// Fuzz target for FrameDecoder
// Feeds untrusted bytes whole and re-split, and checks both decodes agree

#include "network/frame_decoder.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

using forkscan::chain::CBlock;
using forkscan::network::FrameDecoder;

namespace {

// Small limit so oversized-length rejection is reachable
constexpr uint32_t kFuzzMaxPayload = 1024;

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) {
        return 0;
    }

    // First byte picks the split stride, the rest is the stream
    const size_t stride = (data[0] % 64) + 1;
    std::span<const uint8_t> stream(data + 1, size - 1);

    FrameDecoder whole(kFuzzMaxPayload);
    std::vector<CBlock> whole_out;
    whole.feed(stream, whole_out);

    FrameDecoder split(kFuzzMaxPayload);
    std::vector<CBlock> split_out;
    for (size_t pos = 0; pos < stream.size(); pos += stride) {
        size_t n = std::min(stride, stream.size() - pos);
        if (!split.feed(stream.subspan(pos, n), split_out)) {
            break;
        }
    }

    // Chunking must not change what is emitted or whether the stream fails
    if (whole_out.size() != split_out.size()) {
        __builtin_trap();
    }
    if (whole.error() != split.error()) {
        __builtin_trap();
    }

    size_t consumed = 0;
    for (size_t i = 0; i < whole_out.size(); ++i) {
        const CBlock &a = whole_out[i];
        if (a.Serialize() != split_out[i].Serialize()) {
            __builtin_trap();
        }
        if (a.payload.size() > kFuzzMaxPayload ||
            a.payload.size() != a.header.nPayloadLength) {
            __builtin_trap();
        }
        // Re-encoding an emitted frame reproduces the input bytes exactly
        auto bytes = a.Serialize();
        if (consumed + bytes.size() > stream.size() ||
            !std::equal(bytes.begin(), bytes.end(), stream.begin() + consumed)) {
            __builtin_trap();
        }
        consumed += bytes.size();
    }

    if (!whole.is_poisoned() && consumed + whole.buffered_bytes() != stream.size()) {
        __builtin_trap();
    }
    if (whole.is_poisoned() && whole.feed(stream, whole_out)) {
        // Poison must be sticky
        __builtin_trap();
    }

    return 0;
}
