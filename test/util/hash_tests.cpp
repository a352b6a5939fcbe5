// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/hash.hpp"
#include <string>
#include <vector>

using namespace forkscan::util;

namespace {

std::span<const uint8_t> AsBytes(const std::string &s) {
    return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
}

} // namespace

TEST_CASE("DoubleSha256 known vectors", "[util][hash]") {
    SECTION("Empty input") {
        uint256 h = DoubleSha256({});
        REQUIRE(h.GetHex() ==
                "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
    }

    SECTION("Different inputs give different digests") {
        std::string a = "frame-a";
        std::string b = "frame-b";
        REQUIRE(DoubleSha256(AsBytes(a)) != DoubleSha256(AsBytes(b)));
    }
}

TEST_CASE("DoubleSha256 is deterministic", "[util][hash]") {
    std::vector<uint8_t> data(1000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 31);
    }
    uint256 first = DoubleSha256(data);
    REQUIRE(DoubleSha256(data) == first);
    REQUIRE_FALSE(first.IsNull());

    data[999] ^= 1;
    REQUIRE(DoubleSha256(data) != first);
}

TEST_CASE("DefaultHashFunction is DoubleSha256", "[util][hash]") {
    HashFunction fn = DefaultHashFunction();
    REQUIRE(fn);

    std::string s = "payload";
    REQUIRE(fn(AsBytes(s)) == DoubleSha256(AsBytes(s)));
}
