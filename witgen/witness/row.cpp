// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "row.hpp"

#include <algorithm>

#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/decode.hpp>

namespace witgen::witness {

WitnessRow::WitnessRow(RowType type) noexcept {
    set_type(type);
}

void WitnessRow::write(size_t column, ByteView data) noexcept {
    WITGEN_ASSERT(column + data.size() <= kPayloadWidth);
    std::copy(data.begin(), data.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(column));
}

void WitnessRow::write(size_t column, uint8_t byte) noexcept {
    WITGEN_ASSERT(column < kPayloadWidth);
    bytes_[column] = byte;
}

ByteView WitnessRow::window(Side side) const noexcept {
    return ByteView{&bytes_[window_column(side)], kWindowWidth};
}

ByteView WitnessRow::payload() const noexcept {
    return ByteView{bytes_.data(), kPayloadWidth};
}

size_t WitnessMatrix::count(RowType type) const noexcept {
    return static_cast<size_t>(
        std::count_if(rows_.begin(), rows_.end(), [type](const WitnessRow& row) { return row.type() == type; }));
}

size_t WitnessMatrix::count_flagged(uint8_t flags) const noexcept {
    return static_cast<size_t>(
        std::count_if(rows_.begin(), rows_.end(), [flags](const WitnessRow& row) { return row.has_flags(flags); }));
}

std::string WitnessMatrix::to_string() const {
    std::string out;
    out.reserve(rows_.size() * (2 * kRowWidth + 1));
    for (const auto& row : rows_) {
        out += to_hex(row.bytes());
        out += '\n';
    }
    return out;
}

tl::expected<HeaderSlot, WitnessError> header_slot(ByteView item) noexcept {
    const auto length{rlp::header_length(item)};
    if (!length) {
        return malformed(length.error());
    }
    if (*length > kHeaderSlotWidth) {
        return tl::unexpected{WitnessError::kMalformedNode};
    }

    HeaderSlot slot{};
    if (*length == 0) {
        return slot;
    }
    slot[0] = item[0];
    const size_t length_bytes{*length - 1};
    for (size_t i{0}; i < length_bytes; ++i) {
        slot[kHeaderSlotWidth - length_bytes + i] = item[1 + i];
    }
    return slot;
}

}  // namespace witgen::witness
