// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>

#include <witgen/core/trie/node.hpp>
#include <witgen/witness/row.hpp>

namespace witgen::witness {

inline constexpr size_t kLeafRows{2};
inline constexpr size_t kExtensionRows{3};

// Leaf key and value rows: header slot first, raw bytes after it
inline constexpr size_t kShortNodeDataColumn{kHeaderSlotWidth};

using LeafRows = std::array<WitnessRow, kLeafRows>;
using ExtensionBlock = std::array<WitnessRow, kExtensionRows>;

//! \brief Writes the header slot of a leaf or an extension followed by its compact key item
WitnessResult write_short_node_key(WitnessRow& row, const trie::ShortNode& node);

//! \brief Key row and value row of a leaf on one side
//! \details Key row: list header slot, then the compact key item as it is; index column = compact key length.
//! Value row: value item header slot, then the value payload; index column = payload length.
//! \return kMalformedNode when a part does not fit in the row
tl::expected<LeafRows, WitnessError> encode_leaf(const trie::LeafNode& leaf, Side side, uint8_t flags);

//! \brief Same as above on a raw leaf
tl::expected<LeafRows, WitnessError> encode_leaf(ByteView encoded, Side side, uint8_t flags);

//! \brief Leaf rows of a side that has no leaf and nothing to mirror
LeafRows empty_leaf_rows(Side side, uint8_t flags) noexcept;

//! \brief Init rows for both sides followed by the two-sided child row
//! \param position key nibble position the extension starts at
tl::expected<ExtensionBlock, WitnessError> encode_extension_pair(ByteView before, ByteView after, uint8_t position,
                                                                 uint8_t flags);

//! \brief Row for a leaf or an extension rebuilt one level away from where a chain holds it
//! \param moved the rebuilt node, empty when an extension dissolves into its child
//! \param slot the nibble the node occupies in its new parent branch
tl::expected<WitnessRow, WitnessError> encode_drifted(ByteView moved, bool is_leaf, uint8_t slot, uint8_t flags);

}  // namespace witgen::witness
