// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <iterator>
#include <string>
#include <vector>

#include <witgen/core/common/base.hpp>
#include <witgen/core/common/bytes.hpp>
#include <witgen/witness/errors.hpp>

namespace witgen::witness {

// Bytes reserved ahead of a hash in a window: marker column plus one spare
inline constexpr size_t kWindowOffset{2};

// Prefix byte plus up to two length bytes
inline constexpr size_t kHeaderSlotWidth{3};

inline constexpr size_t kWindowWidth{kWindowOffset + kHashLength};
inline constexpr size_t kBeforeWindowColumn{0};
inline constexpr size_t kAfterWindowColumn{kWindowWidth};

// Width available to one-sided rows
inline constexpr size_t kPayloadWidth{2 * kWindowWidth};

inline constexpr size_t kIndexColumn{kPayloadWidth};
inline constexpr size_t kFlagsColumn{kIndexColumn + 1};
inline constexpr size_t kTagColumn{kFlagsColumn + 1};
inline constexpr size_t kRowWidth{kTagColumn + 1};

static_assert(kRowWidth == 71);

enum class RowType : uint8_t {
    kBranchInit = 0,
    kBranchChild = 1,
    kLeafValueBefore = 2,
    kLeafValueAfter = 3,
    kLeafKeyBefore = 4,
    kLeafKeyAfter = 5,
    kExtensionInitBefore = 6,
    kExtensionInitAfter = 7,
    kExtensionChild = 8,
    kAccountKeyBefore = 9,
    kAccountKeyAfter = 10,
    kAccountNonceBalanceBefore = 11,
    kAccountNonceBalanceAfter = 12,
    kAccountStorageCodeHashBefore = 13,
    kAccountStorageCodeHashAfter = 14,
    kStorageBridge = 15,
    kDriftedLeaf = 16,
    kDriftedExtension = 17,
};

enum class Side {
    kBefore,
    kAfter,
};

inline constexpr uint8_t kFlagBeforePlaceholder{1u << 0};
inline constexpr uint8_t kFlagAfterPlaceholder{1u << 1};
inline constexpr uint8_t kFlagModifiedSlot{1u << 2};
inline constexpr uint8_t kFlagForeignLeaf{1u << 3};

inline constexpr uint8_t placeholder_flag(Side side) noexcept {
    return side == Side::kBefore ? kFlagBeforePlaceholder : kFlagAfterPlaceholder;
}

inline constexpr Side other_side(Side side) noexcept {
    return side == Side::kBefore ? Side::kAfter : Side::kBefore;
}

inline constexpr size_t window_column(Side side) noexcept {
    return side == Side::kBefore ? kBeforeWindowColumn : kAfterWindowColumn;
}

//! \brief One fixed-width row of the witness matrix
//! \details Columns [0, kPayloadWidth) hold node bytes, followed by the index, flags and tag columns
class WitnessRow {
  public:
    WitnessRow() noexcept = default;
    explicit WitnessRow(RowType type) noexcept;

    RowType type() const noexcept { return static_cast<RowType>(bytes_[kTagColumn]); }
    void set_type(RowType type) noexcept { bytes_[kTagColumn] = static_cast<uint8_t>(type); }

    uint8_t index() const noexcept { return bytes_[kIndexColumn]; }
    void set_index(uint8_t index) noexcept { bytes_[kIndexColumn] = index; }

    uint8_t flags() const noexcept { return bytes_[kFlagsColumn]; }
    void add_flags(uint8_t flags) noexcept { bytes_[kFlagsColumn] |= flags; }
    bool has_flags(uint8_t flags) const noexcept { return (bytes_[kFlagsColumn] & flags) == flags; }

    //! \brief Copies bytes into the payload columns starting at column
    //! \remarks Writing past kPayloadWidth is a programming error
    void write(size_t column, ByteView data) noexcept;
    void write(size_t column, uint8_t byte) noexcept;

    //! \brief The kWindowWidth bytes of a two-sided row belonging to side
    ByteView window(Side side) const noexcept;

    //! \brief Columns [0, kPayloadWidth)
    ByteView payload() const noexcept;

    uint8_t operator[](size_t column) const noexcept { return bytes_[column]; }

    const std::array<uint8_t, kRowWidth>& bytes() const noexcept { return bytes_; }

    friend bool operator==(const WitnessRow&, const WitnessRow&) = default;

  private:
    std::array<uint8_t, kRowWidth> bytes_{};
};

//! \brief Rows of a witness, root to leaf
class WitnessMatrix {
  public:
    using const_iterator = std::vector<WitnessRow>::const_iterator;

    void append(const WitnessRow& row) { rows_.push_back(row); }

    template <class Rows>
    void append(const Rows& rows) {
        rows_.insert(rows_.end(), std::begin(rows), std::end(rows));
    }

    size_t size() const noexcept { return rows_.size(); }
    bool empty() const noexcept { return rows_.empty(); }

    const WitnessRow& operator[](size_t i) const noexcept { return rows_[i]; }

    const_iterator begin() const noexcept { return rows_.cbegin(); }
    const_iterator end() const noexcept { return rows_.cend(); }

    //! \brief Number of rows carrying the given tag
    size_t count(RowType type) const noexcept;

    //! \brief Number of rows with all the given flag bits set
    size_t count_flagged(uint8_t flags) const noexcept;

    //! \brief One hex line per row
    std::string to_string() const;

  private:
    std::vector<WitnessRow> rows_;
};

using HeaderSlot = std::array<uint8_t, kHeaderSlotWidth>;

//! \brief Lays out the RLP header of an item: prefix byte first, length bytes right-aligned after it
//! \details A single-byte item has no header and yields an all-zero slot
//! \return kMalformedNode when the item is malformed or its header needs more than two length bytes
tl::expected<HeaderSlot, WitnessError> header_slot(ByteView item) noexcept;

}  // namespace witgen::witness
