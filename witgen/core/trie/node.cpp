// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "node.hpp"

#include <vector>

#include <witgen/core/rlp/list.hpp>
#include <witgen/core/trie/nibbles.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen::trie {

static std::optional<evmc::bytes32> hash_reference(ByteView item) {
    if (item.size() != kHashLength + 1 || item[0] != rlp::kHashStringCode) {
        return std::nullopt;
    }
    return to_bytes32(item.substr(1));
}

std::optional<evmc::bytes32> BranchNode::child(size_t index) const {
    return hash_reference(child_items[index]);
}

bool BranchNode::is_nil(size_t index) const {
    return child_items[index].size() == 1 && child_items[index][0] == rlp::kEmptyStringCode;
}

static DecodingResult decode_short_node(const std::vector<rlp::RlpByteView>& items, ShortNode& node, bool& is_leaf) {
    node.key_item = items[0].data;
    ByteView key_view{node.key_item};
    const auto key_header{rlp::decode_header(key_view)};
    if (!key_header) {
        return tl::unexpected{key_header.error()};
    }
    if (key_header->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    node.compact_key = key_view.substr(0, key_header->payload_length);

    auto path{decode_path(node.compact_key)};
    if (!path) {
        return tl::unexpected{path.error()};
    }
    node.path = std::move(path->nibbles);
    is_leaf = path->is_leaf;
    return {};
}

tl::expected<Node, DecodingError> decode_node(ByteView encoded) noexcept {
    ByteView view{encoded};
    const auto header{rlp::decode_header(view)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (!header->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }

    NodeBase base{.rlp = encoded, .header = *header, .header_length = encoded.size() - view.size()};

    view = encoded;
    std::vector<rlp::RlpByteView> items;
    if (DecodingResult res{rlp::decode(view, items)}; !res) {
        return tl::unexpected{res.error()};
    }

    if (items.size() == kBranchChildren + 1) {
        BranchNode branch;
        static_cast<NodeBase&>(branch) = base;
        for (size_t i{0}; i < kBranchChildren; ++i) {
            branch.child_items[i] = items[i].data;
        }
        branch.value_item = items[kBranchChildren].data;
        return branch;
    }

    if (items.size() != 2) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }

    ShortNode short_node;
    static_cast<NodeBase&>(short_node) = base;
    bool is_leaf{false};
    if (DecodingResult res{decode_short_node(items, short_node, is_leaf)}; !res) {
        return tl::unexpected{res.error()};
    }

    if (is_leaf) {
        LeafNode leaf;
        static_cast<ShortNode&>(leaf) = std::move(short_node);
        leaf.value_item = items[1].data;
        ByteView value_view{leaf.value_item};
        const auto value_header{rlp::decode_header(value_view)};
        if (!value_header) {
            return tl::unexpected{value_header.error()};
        }
        if (value_header->list) {
            return tl::unexpected{DecodingError::kUnexpectedList};
        }
        leaf.value = value_view.substr(0, value_header->payload_length);
        return leaf;
    }

    ExtensionNode extension;
    static_cast<ShortNode&>(extension) = std::move(short_node);
    if (extension.path.empty()) {
        return tl::unexpected{DecodingError::kInvalidHexPrefix};
    }
    extension.child_item = items[1].data;
    const auto child{hash_reference(extension.child_item)};
    if (!child) {
        return tl::unexpected{DecodingError::kEmbeddedNode};
    }
    extension.child = *child;
    return extension;
}

ByteView node_rlp(const Node& node) noexcept {
    return std::visit([](const auto& n) { return n.rlp; }, node);
}

evmc::bytes32 node_hash(ByteView encoded) {
    return keccak256_bytes32(encoded);
}

ByteView node_path(const Node& node) noexcept {
    if (const auto* leaf{std::get_if<LeafNode>(&node)}; leaf) {
        return leaf->path;
    }
    if (const auto* extension{std::get_if<ExtensionNode>(&node)}; extension) {
        return extension->path;
    }
    return {};
}

}  // namespace witgen::trie
