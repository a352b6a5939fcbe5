// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/validation.hpp"
#include "test_helpers.hpp"

using namespace forkscan;
using namespace forkscan::validation;

TEST_CASE("ValidationState basics", "[validation]") {
    ValidationState state;
    REQUIRE(state.IsValid());
    REQUIRE_FALSE(state.IsInvalid());
    REQUIRE(state.ToString() == "valid");

    REQUIRE_FALSE(state.Invalid("bad-version", "revision 1"));
    REQUIRE(state.IsInvalid());
    REQUIRE(state.GetRejectReason() == "bad-version");
    REQUIRE(state.GetDebugMessage() == "revision 1");
    REQUIRE(state.ToString() == "bad-version (revision 1)");

    ValidationState bare;
    bare.Invalid("bad-payload-length");
    REQUIRE(bare.ToString() == "bad-payload-length");
}

TEST_CASE("CheckBlock accepts well-formed blocks", "[validation]") {
    ValidationState state;

    SECTION("Genesis with payload") {
        auto block = test::MakeBlock(uint256::ZERO, 0, "genesis");
        REQUIRE(CheckBlock(block, state));
        REQUIRE(state.IsValid());
    }

    SECTION("Empty payload") {
        auto block = test::MakeBlock(test::TestHash(4), 10);
        REQUIRE(CheckBlock(block, state));
    }

    SECTION("Parent need not be known") {
        auto block = test::MakeBlock(test::TestHash(123456), 999, "orphan");
        REQUIRE(CheckBlock(block, state));
    }
}

TEST_CASE("CheckBlock rejects structural mismatches", "[validation]") {
    ValidationState state;

    SECTION("Unsupported revision") {
        auto block = test::MakeBlock(uint256::ZERO, 0, "x");
        block.header.version.revision = 1;
        REQUIRE_FALSE(CheckBlock(block, state));
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetRejectReason() == "bad-version");
    }

    SECTION("Unsupported message type") {
        auto block = test::MakeBlock(uint256::ZERO, 0, "x");
        block.header.version.message_type = 2;
        REQUIRE_FALSE(CheckBlock(block, state));
        REQUIRE(state.GetRejectReason() == "bad-version");
    }

    SECTION("Declared length longer than payload") {
        auto block = test::MakeBlock(uint256::ZERO, 0, "abc");
        block.header.nPayloadLength = 4;
        REQUIRE_FALSE(CheckBlock(block, state));
        REQUIRE(state.GetRejectReason() == "bad-payload-length");
    }

    SECTION("Declared length shorter than payload") {
        auto block = test::MakeBlock(uint256::ZERO, 0, "abc");
        block.header.nPayloadLength = 2;
        REQUIRE_FALSE(CheckBlock(block, state));
        REQUIRE(state.GetRejectReason() == "bad-payload-length");
    }
}
