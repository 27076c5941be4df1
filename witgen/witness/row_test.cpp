// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "row.hpp"

#include <catch2/catch_test_macros.hpp>

#include <witgen/core/common/util.hpp>

namespace witgen::witness {

TEST_CASE("WitnessRow layout") {
    WitnessRow row{RowType::kExtensionChild};
    CHECK(row.bytes().size() == kRowWidth);
    CHECK(row.type() == RowType::kExtensionChild);
    CHECK(row[kTagColumn] == 8);

    row.write(kBeforeWindowColumn + 1, *from_hex("a0"));
    row.write(kAfterWindowColumn + kWindowOffset, uint8_t{0x80});
    row.set_index(7);
    row.add_flags(kFlagBeforePlaceholder);
    row.add_flags(kFlagModifiedSlot);

    CHECK(row[1] == 0xa0);
    CHECK(row[36] == 0x80);
    CHECK(row[kIndexColumn] == 7);
    CHECK(row.flags() == (kFlagBeforePlaceholder | kFlagModifiedSlot));
    CHECK(row.has_flags(kFlagModifiedSlot));
    CHECK_FALSE(row.has_flags(kFlagAfterPlaceholder));

    CHECK(row.window(Side::kBefore).size() == kWindowWidth);
    CHECK(row.window(Side::kBefore)[1] == 0xa0);
    CHECK(row.window(Side::kAfter)[kWindowOffset] == 0x80);
    CHECK(row.payload().size() == kPayloadWidth);

    WitnessRow copy{row};
    CHECK(copy == row);
    copy.set_type(RowType::kExtensionInitBefore);
    CHECK(copy != row);
}

TEST_CASE("Side helpers") {
    CHECK(placeholder_flag(Side::kBefore) == kFlagBeforePlaceholder);
    CHECK(placeholder_flag(Side::kAfter) == kFlagAfterPlaceholder);
    CHECK(other_side(Side::kBefore) == Side::kAfter);
    CHECK(window_column(Side::kAfter) == 34);
}

TEST_CASE("WitnessMatrix") {
    WitnessMatrix matrix;
    CHECK(matrix.empty());
    CHECK(matrix.to_string().empty());

    WitnessRow init{RowType::kBranchInit};
    init.add_flags(kFlagAfterPlaceholder);
    matrix.append(init);
    std::array<WitnessRow, 2> children{WitnessRow{RowType::kBranchChild}, WitnessRow{RowType::kBranchChild}};
    children[1].add_flags(kFlagAfterPlaceholder | kFlagModifiedSlot);
    matrix.append(children);

    CHECK(matrix.size() == 3);
    CHECK(matrix.count(RowType::kBranchChild) == 2);
    CHECK(matrix.count(RowType::kLeafKeyAfter) == 0);
    CHECK(matrix.count_flagged(kFlagAfterPlaceholder) == 2);
    CHECK(matrix.count_flagged(kFlagAfterPlaceholder | kFlagModifiedSlot) == 1);
    CHECK(matrix[1].type() == RowType::kBranchChild);

    const std::string rendered{matrix.to_string()};
    CHECK(rendered.size() == 3 * (2 * kRowWidth + 1));
    CHECK(rendered.substr(2 * kRowWidth - 6, 7) == "000200\n");
}

TEST_CASE("Header slot") {
    SECTION("single byte") {
        const auto slot{header_slot(*from_hex("05"))};
        REQUIRE(slot);
        CHECK(*slot == HeaderSlot{0, 0, 0});
    }

    SECTION("short string") {
        const auto slot{header_slot(*from_hex("820400"))};
        REQUIRE(slot);
        CHECK(*slot == HeaderSlot{0x82, 0, 0});
    }

    SECTION("one length byte") {
        Bytes item{*from_hex("b838")};
        item.resize(item.size() + 0x38);
        const auto slot{header_slot(item)};
        REQUIRE(slot);
        CHECK(*slot == HeaderSlot{0xb8, 0, 0x38});
    }

    SECTION("two length bytes") {
        Bytes item{*from_hex("f90100")};
        item.resize(item.size() + 0x100);
        const auto slot{header_slot(item)};
        REQUIRE(slot);
        CHECK(*slot == HeaderSlot{0xf9, 0x01, 0x00});
    }

    SECTION("three length bytes") {
        Bytes item{*from_hex("ba010000")};
        item.resize(item.size() + 0x10000);
        CHECK(header_slot(item) == tl::unexpected{WitnessError::kMalformedNode});
    }

    SECTION("truncated") {
        CHECK(header_slot(*from_hex("b9")) == tl::unexpected{WitnessError::kMalformedNode});
    }
}

}  // namespace witgen::witness
