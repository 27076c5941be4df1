// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "short_node_encoder.hpp"

#include <witgen/core/rlp/encode.hpp>

namespace witgen::witness {

namespace {

    RowType leaf_key_type(Side side) {
        return side == Side::kBefore ? RowType::kLeafKeyBefore : RowType::kLeafKeyAfter;
    }

    RowType leaf_value_type(Side side) {
        return side == Side::kBefore ? RowType::kLeafValueBefore : RowType::kLeafValueAfter;
    }

    tl::expected<WitnessRow, WitnessError> extension_init(const trie::ExtensionNode& ext, Side side, uint8_t flags) {
        WitnessRow row{side == Side::kBefore ? RowType::kExtensionInitBefore : RowType::kExtensionInitAfter};
        if (WitnessResult res{write_short_node_key(row, ext)}; !res) {
            return tl::unexpected{res.error()};
        }
        row.set_index(static_cast<uint8_t>(ext.path.size()));
        row.add_flags(flags);
        return row;
    }

    tl::expected<trie::ExtensionNode, WitnessError> decode_extension(ByteView encoded) {
        auto node{trie::decode_node(encoded)};
        if (!node) {
            return malformed(node.error());
        }
        auto* ext{std::get_if<trie::ExtensionNode>(&*node)};
        if (!ext) {
            return tl::unexpected{WitnessError::kMalformedNode};
        }
        return std::move(*ext);
    }

}  // namespace

WitnessResult write_short_node_key(WitnessRow& row, const trie::ShortNode& node) {
    const auto slot{header_slot(node.rlp)};
    if (!slot) {
        return tl::unexpected{slot.error()};
    }
    if (kShortNodeDataColumn + node.key_item.size() > kPayloadWidth) {
        return tl::unexpected{WitnessError::kMalformedNode};
    }
    row.write(0, *slot);
    row.write(kShortNodeDataColumn, node.key_item);
    return {};
}

tl::expected<LeafRows, WitnessError> encode_leaf(const trie::LeafNode& leaf, Side side, uint8_t flags) {
    LeafRows rows{WitnessRow{leaf_key_type(side)}, WitnessRow{leaf_value_type(side)}};

    WitnessRow& key_row{rows[0]};
    if (WitnessResult res{write_short_node_key(key_row, leaf)}; !res) {
        return tl::unexpected{res.error()};
    }
    key_row.set_index(static_cast<uint8_t>(leaf.compact_key.size()));

    WitnessRow& value_row{rows[1]};
    const auto slot{header_slot(leaf.value_item)};
    if (!slot) {
        return tl::unexpected{slot.error()};
    }
    if (kShortNodeDataColumn + leaf.value.size() > kPayloadWidth) {
        return tl::unexpected{WitnessError::kMalformedNode};
    }
    value_row.write(0, *slot);
    value_row.write(kShortNodeDataColumn, leaf.value);
    value_row.set_index(static_cast<uint8_t>(leaf.value.size()));

    for (auto& row : rows) {
        row.add_flags(flags);
    }
    return rows;
}

tl::expected<LeafRows, WitnessError> encode_leaf(ByteView encoded, Side side, uint8_t flags) {
    const auto node{trie::decode_node(encoded)};
    if (!node) {
        return malformed(node.error());
    }
    const auto* leaf{std::get_if<trie::LeafNode>(&*node)};
    if (!leaf) {
        return tl::unexpected{WitnessError::kMalformedNode};
    }
    return encode_leaf(*leaf, side, flags);
}

LeafRows empty_leaf_rows(Side side, uint8_t flags) noexcept {
    LeafRows rows{WitnessRow{leaf_key_type(side)}, WitnessRow{leaf_value_type(side)}};
    for (auto& row : rows) {
        row.add_flags(flags);
    }
    return rows;
}

tl::expected<ExtensionBlock, WitnessError> encode_extension_pair(ByteView before, ByteView after, uint8_t position,
                                                                 uint8_t flags) {
    const auto before_ext{decode_extension(before)};
    if (!before_ext) {
        return tl::unexpected{before_ext.error()};
    }
    const auto after_ext{decode_extension(after)};
    if (!after_ext) {
        return tl::unexpected{after_ext.error()};
    }

    const auto before_init{extension_init(*before_ext, Side::kBefore, flags)};
    if (!before_init) {
        return tl::unexpected{before_init.error()};
    }
    const auto after_init{extension_init(*after_ext, Side::kAfter, flags)};
    if (!after_init) {
        return tl::unexpected{after_init.error()};
    }

    WitnessRow child_row{RowType::kExtensionChild};
    child_row.write(kBeforeWindowColumn + kWindowOffset - 1, rlp::kHashStringCode);
    child_row.write(kBeforeWindowColumn + kWindowOffset, before_ext->child.bytes);
    child_row.write(kAfterWindowColumn + kWindowOffset - 1, rlp::kHashStringCode);
    child_row.write(kAfterWindowColumn + kWindowOffset, after_ext->child.bytes);
    child_row.set_index(position);
    child_row.add_flags(flags);

    return ExtensionBlock{*before_init, *after_init, child_row};
}

tl::expected<WitnessRow, WitnessError> encode_drifted(ByteView moved, bool is_leaf, uint8_t slot, uint8_t flags) {
    WitnessRow row{is_leaf ? RowType::kDriftedLeaf : RowType::kDriftedExtension};
    row.set_index(slot);
    row.add_flags(flags);
    if (moved.empty()) {
        return row;
    }

    const auto node{trie::decode_node(moved)};
    if (!node) {
        return malformed(node.error());
    }
    const auto* short_node{is_leaf ? static_cast<const trie::ShortNode*>(std::get_if<trie::LeafNode>(&*node))
                                   : static_cast<const trie::ShortNode*>(std::get_if<trie::ExtensionNode>(&*node))};
    if (!short_node) {
        return tl::unexpected{WitnessError::kMalformedNode};
    }
    if (WitnessResult res{write_short_node_key(row, *short_node)}; !res) {
        return tl::unexpected{res.error()};
    }
    return row;
}

}  // namespace witgen::witness
