// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "short_node_encoder.hpp"

#include <algorithm>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/list.hpp>
#include <witgen/core/trie/nibbles.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen::witness {

using namespace evmc::literals;

static constexpr evmc::bytes32 kChild{0x90d53cd810cc5d4243766cd4451e7b9d14b736a1148b26b3baac7617f617d321_bytes32};

static Bytes short_node(ByteView nibbles, bool is_leaf, ByteView second_item) {
    Bytes key_item;
    rlp::encode(key_item, trie::encode_path(nibbles, is_leaf));
    Bytes out;
    rlp::encode(out, std::vector<rlp::RlpBytes>{rlp::RlpBytes{key_item}, rlp::RlpBytes{Bytes{second_item}}});
    return out;
}

static Bytes string_item(ByteView payload) {
    Bytes item;
    rlp::encode(item, payload);
    return item;
}

static bool zero_payload(const WitnessRow& row) {
    return std::all_of(row.payload().begin(), row.payload().end(), [](uint8_t b) { return b == 0; });
}

TEST_CASE("Leaf rows") {
    SECTION("short leaf") {
        const Bytes leaf{*from_hex("c482310102")};
        const auto rows{encode_leaf(leaf, Side::kAfter, kFlagForeignLeaf)};
        REQUIRE(rows);

        const WitnessRow& key_row{(*rows)[0]};
        CHECK(key_row.type() == RowType::kLeafKeyAfter);
        CHECK(to_hex(key_row.payload().substr(0, 7)) == "c4000082310100");
        CHECK(key_row.index() == 2);
        CHECK(key_row.flags() == kFlagForeignLeaf);

        const WitnessRow& value_row{(*rows)[1]};
        CHECK(value_row.type() == RowType::kLeafValueAfter);
        CHECK(to_hex(value_row.payload().substr(0, 4)) == "00000002");
        CHECK(value_row.index() == 1);
    }

    SECTION("long value") {
        const Bytes value(40, 0xab);
        const Bytes leaf{short_node(*from_hex("0102"), /*is_leaf=*/true, string_item(value))};
        const auto rows{encode_leaf(leaf, Side::kBefore, 0)};
        REQUIRE(rows);
        const WitnessRow& value_row{(*rows)[1]};
        CHECK(value_row.type() == RowType::kLeafValueBefore);
        CHECK(value_row[0] == 0xa8);
        CHECK(value_row.payload().substr(kShortNodeDataColumn, 40) == ByteView{value});
        CHECK(value_row.index() == 40);
    }

    SECTION("value too long for a row") {
        const Bytes value(kPayloadWidth, 0xab);
        const Bytes leaf{short_node(*from_hex("0102"), /*is_leaf=*/true, string_item(value))};
        CHECK(encode_leaf(leaf, Side::kBefore, 0) == tl::unexpected{WitnessError::kMalformedNode});
    }

    SECTION("not a leaf") {
        const Bytes ext{short_node(*from_hex("01"), /*is_leaf=*/false, string_item(kChild.bytes))};
        CHECK(encode_leaf(ext, Side::kBefore, 0) == tl::unexpected{WitnessError::kMalformedNode});
    }

    SECTION("empty rows") {
        const LeafRows rows{empty_leaf_rows(Side::kBefore, kFlagBeforePlaceholder)};
        CHECK(rows[0].type() == RowType::kLeafKeyBefore);
        CHECK(rows[1].type() == RowType::kLeafValueBefore);
        CHECK(rows[1].flags() == kFlagBeforePlaceholder);
        CHECK(zero_payload(rows[0]));
        CHECK(zero_payload(rows[1]));
    }
}

TEST_CASE("Extension rows") {
    const Bytes before{short_node(*from_hex("01"), /*is_leaf=*/false, string_item(kChild.bytes))};
    const evmc::bytes32 other_child{keccak256_bytes32(kChild.bytes)};
    const Bytes after{short_node(*from_hex("01"), /*is_leaf=*/false, string_item(other_child.bytes))};

    SECTION("pair") {
        const auto block{encode_extension_pair(before, after, 5, 0)};
        REQUIRE(block);
        const WitnessRow& init_before{(*block)[0]};
        CHECK(init_before.type() == RowType::kExtensionInitBefore);
        CHECK(to_hex(init_before.payload().substr(0, 5)) == "e200001100");
        CHECK(init_before.index() == 1);
        CHECK((*block)[1].type() == RowType::kExtensionInitAfter);

        const WitnessRow& child{(*block)[2]};
        CHECK(child.type() == RowType::kExtensionChild);
        CHECK(child.index() == 5);
        CHECK(child[1] == 0xa0);
        CHECK(child.window(Side::kBefore).substr(kWindowOffset) == ByteView{kChild.bytes});
        CHECK(child[kAfterWindowColumn + 1] == 0xa0);
        CHECK(child.window(Side::kAfter).substr(kWindowOffset) == ByteView{other_child.bytes});
    }

    SECTION("placeholder") {
        const auto block{encode_extension_pair(before, before, 2, kFlagAfterPlaceholder)};
        REQUIRE(block);
        for (const WitnessRow& row : *block) {
            CHECK(row.flags() == kFlagAfterPlaceholder);
        }
        CHECK((*block)[0].payload() == (*block)[1].payload());
    }

    SECTION("not an extension") {
        const Bytes leaf{*from_hex("c482310102")};
        CHECK(encode_extension_pair(leaf, after, 0, 0) == tl::unexpected{WitnessError::kMalformedNode});
    }
}

TEST_CASE("Drifted rows") {
    SECTION("leaf") {
        const Bytes leaf{*from_hex("c482310102")};
        const auto row{encode_drifted(leaf, /*is_leaf=*/true, 9, kFlagAfterPlaceholder)};
        REQUIRE(row);
        CHECK(row->type() == RowType::kDriftedLeaf);
        CHECK(row->index() == 9);
        CHECK(row->flags() == kFlagAfterPlaceholder);
        CHECK(to_hex(row->payload().substr(0, 6)) == "c40000823101");
    }

    SECTION("dissolved extension") {
        const auto row{encode_drifted({}, /*is_leaf=*/false, 4, kFlagBeforePlaceholder)};
        REQUIRE(row);
        CHECK(row->type() == RowType::kDriftedExtension);
        CHECK(row->index() == 4);
        CHECK(zero_payload(*row));
    }

    SECTION("shape mismatch") {
        const Bytes leaf{*from_hex("c482310102")};
        CHECK(encode_drifted(leaf, /*is_leaf=*/false, 1, 0) == tl::unexpected{WitnessError::kMalformedNode});
    }
}

}  // namespace witgen::witness
