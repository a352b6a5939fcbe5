// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/common_ancestor.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <limits>
#include <thread>

using namespace forkscan;
using namespace forkscan::chain;
using test::InsertOrThrow;
using test::TestHash;

namespace {

// Named blocks for readable fixtures
const uint256 G = TestHash(1000);
const uint256 B1 = TestHash(1001);
const uint256 B2 = TestHash(1002);
const uint256 B3 = TestHash(1003);
const uint256 B4 = TestHash(1004);
const uint256 B3a = TestHash(2003);
const uint256 B3b = TestHash(3003);
const uint256 B2b = TestHash(4002);

// G -> 1 -> 2 -> 3 -> 4
//        |    \-> 3a
//        |    \-> 3b
//        \-> 2b
void BuildForkTree(ChainIndex& index) {
    InsertOrThrow(index, G, uint256::ZERO, 0);
    InsertOrThrow(index, B1, G, 1);
    InsertOrThrow(index, B2, B1, 2);
    InsertOrThrow(index, B3, B2, 3);
    InsertOrThrow(index, B4, B3, 4);
    InsertOrThrow(index, B3a, B2, 3);
    InsertOrThrow(index, B3b, B2, 3);
    InsertOrThrow(index, B2b, B1, 2);
}

} // namespace

TEST_CASE("FindCommonAncestor on sibling forks", "[ancestor]") {
    ChainIndex index;
    BuildForkTree(index);

    auto result = FindCommonAncestor(index, B3a, B3b);
    REQUIRE(result.status == AncestorStatus::FOUND);
    REQUIRE(result.Found());
    REQUIRE(result.ancestor == B2);
    REQUIRE(result.steps == 2);
}

TEST_CASE("FindCommonAncestor with unequal depths", "[ancestor]") {
    ChainIndex index;
    BuildForkTree(index);

    SECTION("Deeper tip first") {
        auto result = FindCommonAncestor(index, B4, B2b);
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == B1);
    }

    SECTION("Deeper tip second") {
        auto result = FindCommonAncestor(index, B2b, B4);
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == B1);
    }

    SECTION("Fork point at genesis") {
        const uint256 other = TestHash(5001);
        InsertOrThrow(index, other, G, 1);
        auto result = FindCommonAncestor(index, B4, other);
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == G);
    }
}

TEST_CASE("FindCommonAncestor degenerate cases", "[ancestor]") {
    ChainIndex index;
    BuildForkTree(index);

    SECTION("Equal tips resolve to the tip itself") {
        auto result = FindCommonAncestor(index, B3a, B3a);
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == B3a);
        REQUIRE(result.steps == 0);
    }

    SECTION("A tip that is an ancestor of the other") {
        auto result = FindCommonAncestor(index, B4, B2);
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == B2);

        auto reversed = FindCommonAncestor(index, B1, B4);
        REQUIRE(reversed.Found());
        REQUIRE(reversed.ancestor == B1);
    }

    SECTION("Genesis against any descendant") {
        auto result = FindCommonAncestor(index, G, B3b);
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == G);
    }
}

TEST_CASE("FindCommonAncestor reports unknown tips", "[ancestor]") {
    ChainIndex index;
    BuildForkTree(index);
    const uint256 stranger = TestHash(9999);

    auto first = FindCommonAncestor(index, stranger, B4);
    REQUIRE(first.status == AncestorStatus::UNKNOWN_TIP);
    REQUIRE(first.unresolved == stranger);

    auto second = FindCommonAncestor(index, B4, stranger);
    REQUIRE(second.status == AncestorStatus::UNKNOWN_TIP);
    REQUIRE(second.unresolved == stranger);
}

TEST_CASE("FindCommonAncestor on disjoint chains", "[ancestor]") {
    ChainIndex index;
    // Two genesis blocks
    InsertOrThrow(index, TestHash(1), uint256::ZERO, 0);
    InsertOrThrow(index, TestHash(2), TestHash(1), 1);
    InsertOrThrow(index, TestHash(3), TestHash(2), 2);
    InsertOrThrow(index, TestHash(11), uint256::ZERO, 0);
    InsertOrThrow(index, TestHash(12), TestHash(11), 1);

    auto result = FindCommonAncestor(index, TestHash(3), TestHash(12));
    REQUIRE(result.status == AncestorStatus::NO_COMMON_ANCESTOR);
    REQUIRE_FALSE(result.Found());

    SECTION("Two lone genesis blocks") {
        auto roots = FindCommonAncestor(index, TestHash(1), TestHash(11));
        REQUIRE(roots.status == AncestorStatus::NO_COMMON_ANCESTOR);
    }

    SECTION("Genesis at a non-zero number") {
        InsertOrThrow(index, TestHash(21), uint256::ZERO, 7);
        InsertOrThrow(index, TestHash(22), TestHash(21), 8);
        auto other = FindCommonAncestor(index, TestHash(22), TestHash(3));
        REQUIRE(other.status == AncestorStatus::NO_COMMON_ANCESTOR);
    }
}

TEST_CASE("FindCommonAncestor distinguishes missing history", "[ancestor]") {
    ChainIndex index;
    BuildForkTree(index);

    // 7 -> 8 -> 9 where 7's parent (6) was never inserted
    const uint256 missing = TestHash(6006);
    InsertOrThrow(index, TestHash(6007), missing, 7);
    InsertOrThrow(index, TestHash(6008), TestHash(6007), 8);
    InsertOrThrow(index, TestHash(6009), TestHash(6008), 9);

    auto result = FindCommonAncestor(index, TestHash(6009), B4);
    REQUIRE(result.status == AncestorStatus::MISSING_ANCESTOR);
    REQUIRE(result.unresolved == missing);

    SECTION("Missing history is not reported as disjoint") {
        REQUIRE(result.status != AncestorStatus::NO_COMMON_ANCESTOR);
    }

    SECTION("Gap in the middle of an otherwise complete chain") {
        ChainIndex gapped;
        InsertOrThrow(gapped, G, uint256::ZERO, 0);
        InsertOrThrow(gapped, B1, G, 1);
        // B2 missing
        InsertOrThrow(gapped, B3, B2, 3);
        InsertOrThrow(gapped, B2b, B1, 2);

        auto gap = FindCommonAncestor(gapped, B3, B2b);
        REQUIRE(gap.status == AncestorStatus::MISSING_ANCESTOR);
        REQUIRE(gap.unresolved == B2);
    }

    SECTION("Filling the gap makes the query succeed") {
        InsertOrThrow(index, missing, B4, 6);
        auto filled = FindCommonAncestor(index, TestHash(6009), B3a);
        REQUIRE(filled.Found());
        REQUIRE(filled.ancestor == B2);
    }
}

TEST_CASE("FindCommonAncestor guards against corrupt parent links", "[ancestor]") {
    ChainIndex index;

    SECTION("Two-entry cycle") {
        InsertOrThrow(index, TestHash(1), TestHash(2), 2);
        InsertOrThrow(index, TestHash(2), TestHash(1), 1);
        InsertOrThrow(index, TestHash(3), uint256::ZERO, 0);

        auto result = FindCommonAncestor(index, TestHash(1), TestHash(3));
        REQUIRE(result.status == AncestorStatus::MALFORMED_CHAIN);
    }

    SECTION("Parent at the same number as its child") {
        InsertOrThrow(index, TestHash(10), uint256::ZERO, 5);
        InsertOrThrow(index, TestHash(11), TestHash(10), 5);
        InsertOrThrow(index, TestHash(20), uint256::ZERO, 0);

        auto result = FindCommonAncestor(index, TestHash(11), TestHash(20));
        REQUIRE(result.status == AncestorStatus::MALFORMED_CHAIN);
        REQUIRE(result.unresolved == TestHash(11));
    }

    SECTION("Parent above its child") {
        InsertOrThrow(index, TestHash(30), uint256::ZERO, 9);
        InsertOrThrow(index, TestHash(31), TestHash(30), 3);
        InsertOrThrow(index, TestHash(40), uint256::ZERO, 0);

        auto result = FindCommonAncestor(index, TestHash(31), TestHash(40));
        REQUIRE(result.status == AncestorStatus::MALFORMED_CHAIN);
    }

    SECTION("Huge block numbers do not overflow the step bound") {
        const uint64_t top = std::numeric_limits<uint64_t>::max();
        InsertOrThrow(index, TestHash(50), uint256::ZERO, top - 1);
        InsertOrThrow(index, TestHash(51), TestHash(50), top);
        auto result = FindCommonAncestor(index, TestHash(51), TestHash(51));
        REQUIRE(result.Found());
        auto walk = FindCommonAncestor(index, TestHash(51), TestHash(50));
        REQUIRE(walk.Found());
        REQUIRE(walk.ancestor == TestHash(50));
    }
}

TEST_CASE("FindCommonAncestor only walks the relevant branch", "[ancestor]") {
    ChainIndex index;
    InsertOrThrow(index, G, uint256::ZERO, 0);
    uint256 prev = G;
    for (uint64_t n = 1; n <= 1000; ++n) {
        InsertOrThrow(index, TestHash(10000 + n), prev, n);
        prev = TestHash(10000 + n);
    }
    // Two short forks off block 995
    InsertOrThrow(index, TestHash(20996), TestHash(10995), 996);
    InsertOrThrow(index, TestHash(30996), TestHash(10995), 996);

    auto result = FindCommonAncestor(index, TestHash(20996), TestHash(30996));
    REQUIRE(result.Found());
    REQUIRE(result.ancestor == TestHash(10995));
    REQUIRE(result.steps == 2);

    auto deep = FindCommonAncestor(index, TestHash(11000), TestHash(20996));
    REQUIRE(deep.Found());
    REQUIRE(deep.ancestor == TestHash(10995));
    REQUIRE(deep.steps == 6);
}

TEST_CASE("FindCommonAncestor over many tips", "[ancestor]") {
    ChainIndex index;
    BuildForkTree(index);

    SECTION("Empty list") {
        auto result = FindCommonAncestor(index, std::vector<uint256>{});
        REQUIRE(result.status == AncestorStatus::UNKNOWN_TIP);
    }

    SECTION("Single tip resolves to itself") {
        auto result = FindCommonAncestor(index, std::vector<uint256>{B3a});
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == B3a);
    }

    SECTION("Three tips fold to the lowest common ancestor") {
        auto result = FindCommonAncestor(index, std::vector<uint256>{B3a, B3b, B4});
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == B2);

        auto wider = FindCommonAncestor(index, std::vector<uint256>{B3a, B4, B2b});
        REQUIRE(wider.Found());
        REQUIRE(wider.ancestor == B1);
    }

    SECTION("Unknown tip anywhere in the list") {
        auto head = FindCommonAncestor(index, std::vector<uint256>{TestHash(777), B4});
        REQUIRE(head.status == AncestorStatus::UNKNOWN_TIP);

        auto tail = FindCommonAncestor(index, std::vector<uint256>{B4, B3a, TestHash(777)});
        REQUIRE(tail.status == AncestorStatus::UNKNOWN_TIP);
        REQUIRE(tail.unresolved == TestHash(777));
    }
}

TEST_CASE("FindCommonAncestor runs alongside inserts", "[ancestor][concurrency]") {
    ChainIndex index;
    BuildForkTree(index);

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        uint256 prev = B4;
        for (uint64_t n = 5; n < 2000; ++n) {
            uint256 next = TestHash(50000 + n);
            (void)index.Insert(next, prev, n);
            prev = next;
        }
        done = true;
    });

    int queries = 0;
    while (!done.load() || queries < 10) {
        auto result = FindCommonAncestor(index, B3a, B3b);
        REQUIRE(result.Found());
        REQUIRE(result.ancestor == B2);
        ++queries;
    }
    writer.join();

    auto tip = FindCommonAncestor(index, TestHash(50000 + 1999), B2b);
    REQUIRE(tip.Found());
    REQUIRE(tip.ancestor == B1);
}

TEST_CASE("AncestorStatusToString names every status", "[ancestor]") {
    REQUIRE(std::string(AncestorStatusToString(AncestorStatus::FOUND)) == "found");
    REQUIRE(std::string(AncestorStatusToString(AncestorStatus::UNKNOWN_TIP)) == "unknown-tip");
    REQUIRE(std::string(AncestorStatusToString(AncestorStatus::MISSING_ANCESTOR)) == "missing-ancestor");
    REQUIRE(std::string(AncestorStatusToString(AncestorStatus::NO_COMMON_ANCESTOR)) ==
            "no-common-ancestor");
    REQUIRE(std::string(AncestorStatusToString(AncestorStatus::MALFORMED_CHAIN)) == "malformed-chain");
}
