// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "verifier.hpp"

#include <witgen/core/common/empty_hashes.hpp>
#include <witgen/core/trie/node.hpp>

namespace witgen::witness {

namespace {

    bool extension_matches(const trie::ExtensionNode& ext, ByteView key, size_t position) {
        return position <= key.size() && key.substr(position).starts_with(ext.path);
    }

}  // namespace

WitnessResult verify_hash_chain(const ChainView& chain, ByteView key, const std::optional<evmc::bytes32>& root) {
    if (chain.empty()) {
        if (root && *root != kEmptyRoot) {
            return tl::unexpected{WitnessError::kBrokenHashChain};
        }
        return {};
    }
    if (root && trie::node_hash(chain.front()) != *root) {
        return tl::unexpected{WitnessError::kBrokenHashChain};
    }

    size_t position{0};
    for (size_t i{0}; i + 1 < chain.size(); ++i) {
        const auto node{trie::decode_node(chain[i])};
        if (!node) {
            return malformed(node.error());
        }
        const evmc::bytes32 child_hash{trie::node_hash(chain[i + 1])};
        if (const auto* branch{std::get_if<trie::BranchNode>(&*node)}) {
            if (position >= key.size()) {
                return tl::unexpected{WitnessError::kBrokenHashChain};
            }
            const auto reference{branch->child(key[position])};
            if (!reference || *reference != child_hash) {
                return tl::unexpected{WitnessError::kBrokenHashChain};
            }
            ++position;
        } else if (const auto* ext{std::get_if<trie::ExtensionNode>(&*node)}) {
            if (!extension_matches(*ext, key, position) || ext->child != child_hash) {
                return tl::unexpected{WitnessError::kBrokenHashChain};
            }
            position += ext->path.size();
        } else {
            return tl::unexpected{WitnessError::kBrokenHashChain};
        }
    }
    return {};
}

WitnessResult verify_parallel_paths(const ChainView& before, const ChainView& after, ByteView key) {
    if (before.size() != after.size()) {
        return tl::unexpected{WitnessError::kPathDivergenceOutsideKey};
    }

    size_t position{0};
    for (size_t i{0}; i < before.size(); ++i) {
        const bool last{i + 1 == before.size()};
        const auto before_node{trie::decode_node(before[i])};
        if (!before_node) {
            return malformed(before_node.error());
        }
        const auto after_node{trie::decode_node(after[i])};
        if (!after_node) {
            return malformed(after_node.error());
        }

        const auto* before_branch{std::get_if<trie::BranchNode>(&*before_node)};
        const auto* after_branch{std::get_if<trie::BranchNode>(&*after_node)};
        const auto* before_ext{std::get_if<trie::ExtensionNode>(&*before_node)};
        const auto* after_ext{std::get_if<trie::ExtensionNode>(&*after_node)};
        if (before_branch && after_branch) {
            if (position >= key.size()) {
                return tl::unexpected{WitnessError::kPathDivergenceOutsideKey};
            }
            for (size_t slot{0}; slot < trie::kBranchChildren; ++slot) {
                if (slot != key[position] && before_branch->child_items[slot] != after_branch->child_items[slot]) {
                    return tl::unexpected{WitnessError::kPathDivergenceOutsideKey};
                }
            }
            ++position;
        } else if (before_ext && after_ext) {
            if (before_ext->compact_key != after_ext->compact_key) {
                return tl::unexpected{WitnessError::kPathDivergenceOutsideKey};
            }
            position += before_ext->path.size();
        } else if (!last) {
            return tl::unexpected{WitnessError::kPathDivergenceOutsideKey};
        }
    }
    return {};
}

WitnessResult verify_exclusion(const ChainView& chain, ByteView key) {
    size_t position{0};
    for (size_t i{0}; i < chain.size(); ++i) {
        const bool last{i + 1 == chain.size()};
        const auto node{trie::decode_node(chain[i])};
        if (!node) {
            return malformed(node.error());
        }
        if (const auto* branch{std::get_if<trie::BranchNode>(&*node)}) {
            if (position >= key.size()) {
                return tl::unexpected{WitnessError::kBrokenHashChain};
            }
            if (last && !branch->is_nil(key[position])) {
                return tl::unexpected{WitnessError::kBrokenHashChain};
            }
            ++position;
        } else if (const auto* ext{std::get_if<trie::ExtensionNode>(&*node)}) {
            if (last && extension_matches(*ext, key, position)) {
                return tl::unexpected{WitnessError::kBrokenHashChain};
            }
            position += ext->path.size();
        } else {
            const auto& leaf{std::get<trie::LeafNode>(*node)};
            if (position <= key.size() && ByteView{leaf.path} == key.substr(position)) {
                return tl::unexpected{WitnessError::kKeyPresent};
            }
            return {};
        }
    }
    return {};
}

}  // namespace witgen::witness
