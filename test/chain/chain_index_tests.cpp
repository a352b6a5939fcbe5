// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/chain_index.hpp"
#include "test_helpers.hpp"
#include "util/files.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace forkscan;
using namespace forkscan::chain;
using test::TestHash;

TEST_CASE("ChainIndex insert and lookup", "[chain_index]") {
    ChainIndex index;
    REQUIRE(index.Size() == 0);

    REQUIRE(index.Insert(TestHash(1), uint256::ZERO, 0) == InsertResult::INSERTED);
    REQUIRE(index.Insert(TestHash(2), TestHash(1), 1) == InsertResult::INSERTED);

    REQUIRE(index.Size() == 2);
    REQUIRE(index.Contains(TestHash(1)));
    REQUIRE_FALSE(index.Contains(TestHash(3)));

    auto entry = index.Lookup(TestHash(2));
    REQUIRE(entry.has_value());
    REQUIRE(entry->hash == TestHash(2));
    REQUIRE(entry->parent_hash == TestHash(1));
    REQUIRE(entry->block_number == 1);
    REQUIRE_FALSE(entry->IsGenesis());

    REQUIRE(index.Lookup(TestHash(1))->IsGenesis());
    REQUIRE_FALSE(index.Lookup(TestHash(3)).has_value());
}

TEST_CASE("ChainIndex insert is idempotent", "[chain_index]") {
    ChainIndex index;
    REQUIRE(index.Insert(TestHash(1), uint256::ZERO, 0) == InsertResult::INSERTED);
    REQUIRE(index.Insert(TestHash(1), uint256::ZERO, 0) == InsertResult::DUPLICATE);
    REQUIRE(index.Insert(ChainEntry{TestHash(1), uint256::ZERO, 0}) == InsertResult::DUPLICATE);

    REQUIRE(index.Size() == 1);
    REQUIRE(index.LookupByHeight(0).size() == 1);
    REQUIRE(index.GetTips().size() == 1);
}

TEST_CASE("ChainIndex detects conflicting re-inserts", "[chain_index]") {
    ChainIndex index;
    REQUIRE(index.Insert(TestHash(5), TestHash(4), 4) == InsertResult::INSERTED);

    SECTION("Different parent") {
        REQUIRE(index.Insert(TestHash(5), TestHash(9), 4) == InsertResult::CONFLICT);
    }

    SECTION("Different number") {
        REQUIRE(index.Insert(TestHash(5), TestHash(4), 7) == InsertResult::CONFLICT);
    }

    // The original entry is never overwritten
    auto entry = index.Lookup(TestHash(5));
    REQUIRE(entry->parent_hash == TestHash(4));
    REQUIRE(entry->block_number == 4);
    REQUIRE(index.Size() == 1);
}

TEST_CASE("ChainIndex rejects invalid identities", "[chain_index]") {
    ChainIndex index;
    REQUIRE(index.Insert(uint256::ZERO, TestHash(1), 1) == InsertResult::INVALID);
    REQUIRE(index.Insert(TestHash(2), TestHash(2), 1) == InsertResult::INVALID);
    REQUIRE(index.Size() == 0);
}

TEST_CASE("ChainIndex accepts entries whose parent is unknown", "[chain_index]") {
    ChainIndex index;
    REQUIRE(index.Insert(TestHash(10), TestHash(9), 9) == InsertResult::INSERTED);

    auto orphans = index.GetOrphans();
    REQUIRE(orphans.size() == 1);
    REQUIRE(orphans[0].hash == TestHash(10));

    // Parent arrives later; the link resolves
    REQUIRE(index.Insert(TestHash(9), uint256::ZERO, 8) == InsertResult::INSERTED);
    REQUIRE(index.GetOrphans().empty());
}

TEST_CASE("ChainIndex height buckets hold forks", "[chain_index]") {
    ChainIndex index;
    test::InsertOrThrow(index, TestHash(1), uint256::ZERO, 0);
    test::InsertOrThrow(index, TestHash(2), TestHash(1), 1);
    test::InsertOrThrow(index, TestHash(3), TestHash(1), 1);

    auto at1 = index.LookupByHeight(1);
    REQUIRE(at1.size() == 2);
    REQUIRE(at1[0].hash < at1[1].hash);
    REQUIRE(index.LookupByHeight(2).empty());
}

TEST_CASE("ChainIndex tips are entries nobody builds on", "[chain_index]") {
    ChainIndex index;
    // G -> 1 -> 2a
    //        \-> 2b -> 3b
    test::InsertOrThrow(index, TestHash(100), uint256::ZERO, 0);
    test::InsertOrThrow(index, TestHash(101), TestHash(100), 1);
    test::InsertOrThrow(index, TestHash(102), TestHash(101), 2);
    test::InsertOrThrow(index, TestHash(202), TestHash(101), 2);
    test::InsertOrThrow(index, TestHash(203), TestHash(202), 3);

    auto tips = index.GetTips();
    std::vector<uint256> hashes;
    for (const auto& e : tips) hashes.push_back(e.hash);
    std::sort(hashes.begin(), hashes.end());

    std::vector<uint256> expected = {TestHash(102), TestHash(203)};
    std::sort(expected.begin(), expected.end());
    REQUIRE(hashes == expected);
}

TEST_CASE("ChainIndex concurrent inserts", "[chain_index][concurrency]") {
    ChainIndex index;
    constexpr int kThreads = 8;
    constexpr uint64_t kEntries = 500;

    std::atomic<int> inserted{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> other{0};

    // Every thread inserts the same chain: exactly one INSERTED per hash
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (uint64_t i = 1; i <= kEntries; ++i) {
                uint256 parent = i == 1 ? uint256::ZERO : TestHash(i - 1);
                switch (index.Insert(TestHash(i), parent, i - 1)) {
                    case InsertResult::INSERTED: inserted++; break;
                    case InsertResult::DUPLICATE: duplicates++; break;
                    default: other++; break;
                }
                // Readers run alongside writers
                (void)index.Lookup(TestHash(i / 2 + 1));
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(index.Size() == kEntries);
    REQUIRE(inserted.load() == static_cast<int>(kEntries));
    REQUIRE(duplicates.load() == static_cast<int>(kEntries) * (kThreads - 1));
    REQUIRE(other.load() == 0);
    REQUIRE(index.GetTips().size() == 1);
}

TEST_CASE("ChainIndex snapshot save and load", "[chain_index][persistence]") {
    auto dir = std::filesystem::temp_directory_path() / "forkscan_chain_index_test";
    std::filesystem::remove_all(dir);
    REQUIRE(util::ensure_directory(dir));
    auto file = (dir / "chain_index.json").string();

    ChainIndex index;
    test::InsertOrThrow(index, TestHash(1), uint256::ZERO, 0);
    test::InsertOrThrow(index, TestHash(2), TestHash(1), 1);
    test::InsertOrThrow(index, TestHash(3), TestHash(1), 1);
    test::InsertOrThrow(index, TestHash(50), TestHash(49), 49);

    SECTION("Round trip restores every entry") {
        REQUIRE(index.Save(file));

        ChainIndex loaded;
        REQUIRE(loaded.Load(file));
        REQUIRE(loaded.Size() == 4);
        for (uint64_t tag : {1, 2, 3, 50}) {
            REQUIRE(loaded.Lookup(TestHash(tag)) == index.Lookup(TestHash(tag)));
        }
    }

    SECTION("Loading merges into existing entries") {
        REQUIRE(index.Save(file));

        ChainIndex other;
        test::InsertOrThrow(other, TestHash(1), uint256::ZERO, 0);
        test::InsertOrThrow(other, TestHash(77), TestHash(3), 2);
        REQUIRE(other.Load(file));
        REQUIRE(other.Size() == 5);
    }

    SECTION("Conflicting snapshot is rejected") {
        REQUIRE(index.Save(file));

        ChainIndex other;
        test::InsertOrThrow(other, TestHash(2), TestHash(9), 1);
        REQUIRE_FALSE(other.Load(file));
    }

    SECTION("Missing file fails") {
        ChainIndex other;
        REQUIRE_FALSE(other.Load((dir / "missing.json").string()));
    }

    SECTION("Corrupt file fails") {
        REQUIRE(util::atomic_write_file(file, std::string("{ not json")));
        ChainIndex other;
        REQUIRE_FALSE(other.Load(file));
        REQUIRE(other.Size() == 0);
    }

    SECTION("Wrong format version fails") {
        REQUIRE(util::atomic_write_file(file, std::string(R"({"version": 99, "entries": []})")));
        ChainIndex other;
        REQUIRE_FALSE(other.Load(file));
    }

    SECTION("Malformed hash fails") {
        REQUIRE(util::atomic_write_file(
            file, std::string(R"({"version": 1, "entries": [{"hash": "xyz", "parent_hash": "00", "block_number": 1}]})")));
        ChainIndex other;
        REQUIRE_FALSE(other.Load(file));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("InsertResultToString names every result", "[chain_index]") {
    REQUIRE(std::string(InsertResultToString(InsertResult::INSERTED)) == "inserted");
    REQUIRE(std::string(InsertResultToString(InsertResult::DUPLICATE)) == "duplicate");
    REQUIRE(std::string(InsertResultToString(InsertResult::CONFLICT)) == "conflict");
    REQUIRE(std::string(InsertResultToString(InsertResult::INVALID)) == "invalid");
}
