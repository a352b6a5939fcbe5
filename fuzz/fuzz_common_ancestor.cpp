// Fuzz target for FindCommonAncestor
// Builds an arbitrary (possibly corrupt) parent graph and resolves tip pairs

#include "chain/chain_index.hpp"
#include "chain/common_ancestor.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

using namespace forkscan::chain;

namespace {

uint256 NodeHash(uint8_t id) {
    uint256 h;
    h.data()[0] = 0xF0;
    h.data()[31] = static_cast<uint8_t>(id + 1);
    return h;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    ChainIndex index;
    std::vector<uint256> hashes;

    // Each 3-byte record: node id, parent id (0xFF = genesis), block number
    size_t pos = 0;
    for (; pos + 3 <= size && hashes.size() < 64; pos += 3) {
        uint256 hash = NodeHash(data[pos]);
        uint256 parent = data[pos + 1] == 0xFF ? uint256() : NodeHash(data[pos + 1]);
        uint64_t number = data[pos + 2];
        if (index.Insert(hash, parent, number) == InsertResult::INSERTED) {
            hashes.push_back(hash);
        }
    }
    if (hashes.empty()) {
        return 0;
    }

    // Remaining bytes choose query pairs
    for (; pos + 2 <= size; pos += 2) {
        const uint256 &a = hashes[data[pos] % hashes.size()];
        const uint256 &b = hashes[data[pos + 1] % hashes.size()];

        AncestorResult ab = FindCommonAncestor(index, a, b);
        AncestorResult ba = FindCommonAncestor(index, b, a);

        // Walk gives up on the first hop past tip_a.number + tip_b.number + 2
        auto ea = index.Lookup(a);
        auto eb = index.Lookup(b);
        if (!ea || !eb) {
            __builtin_trap();
        }
        if (ab.steps > ea->block_number + eb->block_number + 3) {
            __builtin_trap();
        }

        if (ab.Found() != ba.Found()) {
            __builtin_trap();
        }
        if (ab.Found()) {
            if (ab.ancestor != ba.ancestor || !index.Contains(ab.ancestor)) {
                __builtin_trap();
            }
        }
        if (a == b && !(ab.Found() && ab.ancestor == a)) {
            __builtin_trap();
        }
    }

    return 0;
}
