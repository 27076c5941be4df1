// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "aligner.hpp"

#include <string>

#include <magic_enum.hpp>

#include <witgen/core/rlp/list.hpp>
#include <witgen/core/trie/nibbles.hpp>
#include <witgen/core/trie/node.hpp>
#include <witgen/infra/common/log.hpp>

namespace witgen::witness {

namespace {

    tl::expected<std::vector<trie::Node>, WitnessError> decode_chain(const ProofChain& chain) {
        std::vector<trie::Node> nodes;
        nodes.reserve(chain.size());
        for (const auto& encoded : chain) {
            auto node{trie::decode_node(encoded)};
            if (!node) {
                return malformed(node.error());
            }
            nodes.push_back(std::move(*node));
        }
        return nodes;
    }

    bool continues(const trie::Node& node, ByteView key, size_t position) {
        if (std::holds_alternative<trie::BranchNode>(node)) {
            return position < key.size();
        }
        if (const auto* ext{std::get_if<trie::ExtensionNode>(&node)}) {
            return key.substr(position).starts_with(ext->path);
        }
        return false;
    }

    // Key nibbles consumed by a continuing node
    size_t stride(const trie::Node& node) {
        if (const auto* ext{std::get_if<trie::ExtensionNode>(&node)}) {
            return ext->path.size();
        }
        return 1;
    }

    StepKind step_kind(const trie::Node& node) {
        return std::holds_alternative<trie::BranchNode>(node) ? StepKind::kBranch : StepKind::kExtension;
    }

    tl::expected<Terminal, WitnessError> classify_terminal(const trie::Node* node, ByteView key, size_t position) {
        Terminal terminal{.position = position};
        if (!node) {
            return terminal;
        }
        terminal.node = trie::node_rlp(*node);
        if (const auto* leaf{std::get_if<trie::LeafNode>(node)}) {
            terminal.kind = ByteView{leaf->path} == key.substr(position) ? TerminalKind::kTargetLeaf
                                                                         : TerminalKind::kForeignLeaf;
        } else if (std::holds_alternative<trie::ExtensionNode>(*node)) {
            terminal.kind = TerminalKind::kMismatchedExtension;
        } else {
            // A branch below the full key length
            return tl::unexpected{WitnessError::kMalformedNode};
        }
        return terminal;
    }

    // The shortened copy of a short node and the check that the counterpart's last branch references it
    tl::expected<DriftedNode, WitnessError> rebuild_drifted(const trie::Node& node, Side side, ByteView key,
                                                            size_t from, size_t to, ByteView parent) {
        const ByteView path{trie::node_path(node)};
        const size_t depth{to - from};
        if (path.size() < depth || path.substr(0, depth - 1) != key.substr(from, depth - 1)) {
            return tl::unexpected{WitnessError::kDriftedNodeMismatch};
        }
        const uint8_t slot{path[depth - 1]};
        if (slot == key[to - 1]) {
            return tl::unexpected{WitnessError::kDriftedNodeMismatch};
        }

        const auto parent_node{trie::decode_node(parent)};
        if (!parent_node) {
            return malformed(parent_node.error());
        }
        const auto* branch{std::get_if<trie::BranchNode>(&*parent_node)};
        if (!branch) {
            return tl::unexpected{WitnessError::kDriftedNodeMismatch};
        }
        const auto reference{branch->child(slot)};
        if (!reference) {
            return tl::unexpected{WitnessError::kDriftedNodeMismatch};
        }

        DriftedNode drifted{.side = side, .slot = slot};
        const ByteView rest{path.substr(depth)};
        ByteView second_item;
        if (const auto* leaf{std::get_if<trie::LeafNode>(&node)}) {
            second_item = leaf->value_item;
        } else {
            const auto& ext{std::get<trie::ExtensionNode>(node)};
            drifted.is_leaf = false;
            if (rest.empty()) {
                if (ext.child != *reference) {
                    return tl::unexpected{WitnessError::kDriftedNodeMismatch};
                }
                return drifted;
            }
            second_item = ext.child_item;
        }

        Bytes key_item;
        rlp::encode(key_item, trie::encode_path(rest, drifted.is_leaf));
        const std::vector<rlp::RlpByteView> items{rlp::RlpByteView{key_item}, rlp::RlpByteView{second_item}};
        rlp::encode(drifted.moved, items);
        if (trie::node_hash(drifted.moved) != *reference) {
            return tl::unexpected{WitnessError::kDriftedNodeMismatch};
        }
        return drifted;
    }

}  // namespace

ChainView AlignedPath::chain(Side side) const {
    ChainView chain;
    chain.reserve(steps_.size() + 1);
    for (const auto& step : steps_) {
        chain.push_back(side == Side::kBefore ? step.before : step.after);
    }
    const Terminal& own{terminal(side)};
    const Terminal& other{terminal(other_side(side))};
    if (own.kind != TerminalKind::kNone) {
        chain.push_back(own.node);
    } else if (other.kind != TerminalKind::kNone) {
        chain.push_back(other.node);
    }
    return chain;
}

tl::expected<AlignedPath, WitnessError> align(const ProofChain& before, const ProofChain& after, ByteView key) {
    const auto before_nodes{decode_chain(before)};
    if (!before_nodes) {
        return tl::unexpected{before_nodes.error()};
    }
    const auto after_nodes{decode_chain(after)};
    if (!after_nodes) {
        return tl::unexpected{after_nodes.error()};
    }

    AlignedPath path;
    size_t before_index{0};
    size_t after_index{0};
    size_t position{0};
    size_t exhausted_at{0};

    while (true) {
        const trie::Node* before_head{before_index < before_nodes->size() ? &(*before_nodes)[before_index] : nullptr};
        const trie::Node* after_head{after_index < after_nodes->size() ? &(*after_nodes)[after_index] : nullptr};
        const bool before_continues{path.state_ != AlignmentState::kBeforeExhausted && before_head &&
                                    continues(*before_head, key, position)};
        const bool after_continues{path.state_ != AlignmentState::kAfterExhausted && after_head &&
                                   continues(*after_head, key, position)};
        if (!before_continues && !after_continues) {
            break;
        }

        if (before_continues && after_continues) {
            const StepKind kind{step_kind(*before_head)};
            if (kind != step_kind(*after_head) ||
                trie::node_path(*before_head) != trie::node_path(*after_head)) {
                return tl::unexpected{WitnessError::kBranchDivergenceInvariantViolation};
            }
            path.steps_.push_back({.kind = kind,
                                   .before = trie::node_rlp(*before_head),
                                   .after = trie::node_rlp(*after_head),
                                   .position = position});
            position += stride(*before_head);
            ++before_index;
            ++after_index;
            continue;
        }

        const Side exhausted{before_continues ? Side::kAfter : Side::kBefore};
        if (path.state_ == AlignmentState::kInSync) {
            path.state_ = exhausted == Side::kBefore ? AlignmentState::kBeforeExhausted
                                                     : AlignmentState::kAfterExhausted;
            exhausted_at = position;
            WITGEN_TRACE_M("Chain exhausted", {"state", std::string{magic_enum::enum_name(path.state_)},
                                               "position", std::to_string(position)});
        }
        const trie::Node& real{before_continues ? *before_head : *after_head};
        const ByteView mirrored{trie::node_rlp(real)};
        path.steps_.push_back({.kind = step_kind(real),
                               .before = mirrored,
                               .after = mirrored,
                               .flags = placeholder_flag(exhausted),
                               .position = position});
        position += stride(real);
        if (before_continues) {
            ++before_index;
        } else {
            ++after_index;
        }
    }

    // Nothing may follow a terminal node
    if (before_index + 1 < before_nodes->size() || after_index + 1 < after_nodes->size()) {
        return tl::unexpected{WitnessError::kBrokenHashChain};
    }

    const auto terminal_position = [&](Side side) {
        const bool exhausted{(side == Side::kBefore && path.state_ == AlignmentState::kBeforeExhausted) ||
                             (side == Side::kAfter && path.state_ == AlignmentState::kAfterExhausted)};
        return exhausted ? exhausted_at : position;
    };
    const trie::Node* before_terminal{before_index < before_nodes->size() ? &(*before_nodes)[before_index] : nullptr};
    const trie::Node* after_terminal{after_index < after_nodes->size() ? &(*after_nodes)[after_index] : nullptr};
    const auto before_kind{classify_terminal(before_terminal, key, terminal_position(Side::kBefore))};
    if (!before_kind) {
        return tl::unexpected{before_kind.error()};
    }
    const auto after_kind{classify_terminal(after_terminal, key, terminal_position(Side::kAfter))};
    if (!after_kind) {
        return tl::unexpected{after_kind.error()};
    }
    path.terminals_ = {*before_kind, *after_kind};

    if (path.state_ != AlignmentState::kInSync) {
        const Side side{path.state_ == AlignmentState::kBeforeExhausted ? Side::kBefore : Side::kAfter};
        const Terminal& terminal{path.terminal(side)};
        const AlignedStep& last{path.steps_.back()};
        if (terminal.kind == TerminalKind::kNone || terminal.kind == TerminalKind::kTargetLeaf ||
            last.kind != StepKind::kBranch) {
            return tl::unexpected{WitnessError::kDriftedNodeMismatch};
        }
        const trie::Node& node{side == Side::kBefore ? *before_terminal : *after_terminal};
        const ByteView parent{side == Side::kBefore ? last.after : last.before};
        auto drifted{rebuild_drifted(node, side, key, exhausted_at, position, parent)};
        if (!drifted) {
            return tl::unexpected{drifted.error()};
        }
        path.drifted_ = std::move(*drifted);
    }

    WITGEN_TRACE_M("Aligned path", {"steps", std::to_string(path.steps_.size()),
                                    "before", std::string{magic_enum::enum_name(path.terminals_[0].kind)},
                                    "after", std::string{magic_enum::enum_name(path.terminals_[1].kind)}});
    return path;
}

}  // namespace witgen::witness
