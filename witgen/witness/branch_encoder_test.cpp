// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "branch_encoder.hpp"

#include <algorithm>
#include <map>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/list.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen::witness {

using namespace evmc::literals;

static constexpr evmc::bytes32 kHashA{0x90d53cd810cc5d4243766cd4451e7b9d14b736a1148b26b3baac7617f617d321_bytes32};
static constexpr evmc::bytes32 kHashB{0x0b4bba9df3fe3f5b9e0d1d9c1c3e7e87d5b6a9f0e1f7f2c6a0b4d2c3e1f0a9b8_bytes32};

// A branch with the given slots holding either a hash or a raw embedded item
static Bytes branch_rlp(const std::map<size_t, Bytes>& slots, ByteView value = {}) {
    std::vector<rlp::RlpBytes> items;
    for (size_t i{0}; i < trie::kBranchChildren; ++i) {
        const auto it{slots.find(i)};
        items.emplace_back(it == slots.end() ? Bytes(1, rlp::kEmptyStringCode) : it->second);
    }
    Bytes value_item;
    rlp::encode(value_item, value);
    items.emplace_back(value_item);
    Bytes out;
    rlp::encode(out, items);
    return out;
}

static Bytes hash_item(const evmc::bytes32& hash) {
    Bytes item;
    rlp::encode(item, hash);
    return item;
}

TEST_CASE("Branch windows") {
    const Bytes branch{branch_rlp({{3, hash_item(kHashA)}, {11, hash_item(kHashB)}})};
    const auto windows{branch_windows(branch)};
    REQUIRE(windows);

    // 2 hashes and 15 nil items: 81 bytes of payload
    CHECK((*windows)[0][0] == 0xf8);
    CHECK((*windows)[0][1] == 0x00);
    CHECK((*windows)[0][2] == 0x51);

    const BranchWindow& hashed{(*windows)[1 + 3]};
    CHECK(hashed[0] == 0x00);
    CHECK(hashed[1] == 0xa0);
    CHECK(ByteView{&hashed[kWindowOffset], kHashLength} == ByteView{kHashA.bytes});

    const BranchWindow& nil{(*windows)[1]};
    CHECK(nil[1] == 0x00);
    CHECK(nil[2] == 0x80);
    CHECK(std::all_of(nil.begin() + 3, nil.end(), [](uint8_t b) { return b == 0; }));
}

TEST_CASE("Branch windows rejects") {
    SECTION("not a branch") {
        const Bytes leaf{*from_hex("c482310102")};
        CHECK(branch_windows(leaf) == tl::unexpected{WitnessError::kMalformedNode});
    }

    SECTION("embedded child") {
        const Bytes branch{branch_rlp({{3, hash_item(kHashA)}, {5, *from_hex("c22001")}})};
        CHECK(branch_windows(branch) == tl::unexpected{WitnessError::kUnexpectedBranchByte});
    }

    SECTION("branch value") {
        const Bytes branch{branch_rlp({{3, hash_item(kHashA)}, {4, hash_item(kHashB)}}, *from_hex("01"))};
        CHECK(branch_windows(branch) == tl::unexpected{WitnessError::kUnexpectedBranchByte});
    }
}

TEST_CASE("Branch pair") {
    const Bytes before{branch_rlp({{3, hash_item(kHashA)}, {11, hash_item(kHashB)}})};
    const Bytes after{branch_rlp({{3, hash_item(kHashB)}, {11, hash_item(kHashB)}})};

    SECTION("divergence at the key nibble") {
        const auto block{encode_branch_pair(before, after, 3, 0)};
        REQUIRE(block);
        CHECK((*block)[0].type() == RowType::kBranchInit);
        CHECK((*block)[0].index() == 3);
        for (size_t i{1}; i < kBranchRows; ++i) {
            const WitnessRow& row{(*block)[i]};
            CHECK(row.type() == RowType::kBranchChild);
            CHECK(row.index() == i - 1);
            CHECK(row.has_flags(kFlagModifiedSlot) == (i == 4));
            if (i != 4) {
                CHECK(row.window(Side::kBefore) == row.window(Side::kAfter));
            }
        }
        CHECK((*block)[4].window(Side::kBefore).substr(kWindowOffset) == ByteView{kHashA.bytes});
        CHECK((*block)[4].window(Side::kAfter).substr(kWindowOffset) == ByteView{kHashB.bytes});
    }

    SECTION("placeholder flags on every row") {
        const auto block{encode_branch_pair(after, after, 3, kFlagBeforePlaceholder)};
        REQUIRE(block);
        for (const WitnessRow& row : *block) {
            CHECK(row.has_flags(kFlagBeforePlaceholder));
        }
    }

    SECTION("divergence off the key") {
        CHECK(encode_branch_pair(before, after, 11, 0) ==
              tl::unexpected{WitnessError::kBranchDivergenceInvariantViolation});
    }
}

}  // namespace witgen::witness
