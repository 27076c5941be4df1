// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <variant>

#include <evmc/evmc.hpp>

#include <witgen/core/common/base.hpp>
#include <witgen/core/common/bytes.hpp>
#include <witgen/core/common/decoding_result.hpp>
#include <witgen/core/rlp/encode.hpp>

namespace witgen::trie {

inline constexpr size_t kBranchChildren{16};

//! \brief Shape-independent views over the raw RLP of a trie node
//! \remarks All views refer to the buffer passed to decode_node, which must outlive the node
struct NodeBase {
    ByteView rlp;             // The whole node
    rlp::Header header;       // Outer list header
    size_t header_length{0};  // Bytes taken by the outer list header (prefix + length bytes)
};

//! \brief Common part of leaf and extension nodes: a compact partial key followed by one item
struct ShortNode : NodeBase {
    ByteView key_item;     // Compact key RLP item, header included
    ByteView compact_key;  // Compact key payload, hex-prefix flag included
    Bytes path;            // Expanded nibbles of the partial key

    bool odd() const noexcept { return (path.size() & 1) != 0; }
};

struct LeafNode : ShortNode {
    ByteView value_item;  // Value RLP item, header included
    ByteView value;       // Value payload
};

struct ExtensionNode : ShortNode {
    ByteView child_item;  // 0xa0 + hash
    evmc::bytes32 child;
};

struct BranchNode : NodeBase {
    std::array<ByteView, kBranchChildren> child_items;
    ByteView value_item;

    //! \brief The hash referenced at the given slot, if the slot holds a hash reference
    std::optional<evmc::bytes32> child(size_t index) const;

    //! \brief Whether the given slot is the empty string
    bool is_nil(size_t index) const;
};

using Node = std::variant<LeafNode, ExtensionNode, BranchNode>;

//! \brief Classifies a raw RLP trie node
//! \details 17 items make a branch. 2 items make a leaf or an extension, told apart by the hex-prefix flag of the
//! compact key. The child of an extension must be a hash reference.
//! Branch child items are kept as they are: judging them is up to the consumer.
tl::expected<Node, DecodingError> decode_node(ByteView encoded) noexcept;

//! \brief Raw RLP of any node shape
ByteView node_rlp(const Node& node) noexcept;

//! \brief The hash a parent uses to reference a node
evmc::bytes32 node_hash(ByteView encoded);

//! \brief Partial path of a leaf or an extension, empty for a branch
ByteView node_path(const Node& node) noexcept;

}  // namespace witgen::trie
