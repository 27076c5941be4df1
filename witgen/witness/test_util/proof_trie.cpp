// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof_trie.hpp"

#include <array>
#include <memory>
#include <utility>
#include <vector>

#include <witgen/core/common/empty_hashes.hpp>
#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/list.hpp>
#include <witgen/core/trie/nibbles.hpp>
#include <witgen/core/trie/node.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen::test_util {

namespace {

    enum class Kind : uint8_t {
        kLeaf,
        kExtension,
        kBranch,
    };

    class Node {
      public:
        Node() = default;

        static std::unique_ptr<Node> leaf(ByteView path, Bytes value) {
            auto node{std::make_unique<Node>()};
            node->path_ = path;
            node->value_ = std::move(value);
            return node;
        }

        //! Inserts a key of the same length as every other key in the trie
        void insert(ByteView path, Bytes value) {
            const size_t common{prefix_length(path_, path)};
            WITGEN_ASSERT(common < path.size());

            switch (kind_) {
                case Kind::kBranch: {
                    auto& child{children_[path[0]]};
                    if (child) {
                        child->insert(path.substr(1), std::move(value));
                    } else {
                        child = leaf(path.substr(1), std::move(value));
                    }
                    break;
                }
                case Kind::kExtension: {
                    if (common == path_.size()) {
                        children_[0]->insert(path.substr(common), std::move(value));
                        return;
                    }
                    const Bytes this_path{path_};
                    auto this_branch{optional_extension(ByteView{this_path}.substr(common + 1), std::move(children_[0]))};
                    auto new_leaf{leaf(path.substr(common + 1), std::move(value))};
                    *this = split(ByteView{this_path}.substr(0, common), this_path[common], std::move(this_branch),
                                  path[common], std::move(new_leaf));
                    break;
                }
                case Kind::kLeaf: {
                    WITGEN_ASSERT(common < path_.size());
                    const Bytes this_path{path_};
                    auto this_leaf{leaf(ByteView{this_path}.substr(common + 1), std::move(value_))};
                    auto new_leaf{leaf(path.substr(common + 1), std::move(value))};
                    *this = split(ByteView{this_path}.substr(0, common), this_path[common], std::move(this_leaf),
                                  path[common], std::move(new_leaf));
                    break;
                }
            }
        }

        Bytes encode() const {
            std::vector<rlp::RlpBytes> items;
            switch (kind_) {
                case Kind::kLeaf: {
                    items.emplace_back(key_item(/*is_leaf=*/true));
                    Bytes value_item;
                    rlp::encode(value_item, value_);
                    items.emplace_back(std::move(value_item));
                    break;
                }
                case Kind::kExtension:
                    items.emplace_back(key_item(/*is_leaf=*/false));
                    items.emplace_back(reference(*children_[0]));
                    break;
                case Kind::kBranch:
                    for (const auto& child : children_) {
                        items.emplace_back(child ? reference(*child) : Bytes(1, rlp::kEmptyStringCode));
                    }
                    items.emplace_back(Bytes(1, rlp::kEmptyStringCode));
                    break;
            }
            Bytes out;
            rlp::encode(out, items);
            return out;
        }

        void prove(ByteView path, bool is_root, witness::ProofChain& proof) const {
            Bytes encoded{encode()};
            if (is_root || encoded.size() >= kHashLength) {
                proof.push_back(std::move(encoded));
            }
            switch (kind_) {
                case Kind::kLeaf:
                    break;
                case Kind::kExtension:
                    if (path.starts_with(ByteView{path_})) {
                        children_[0]->prove(path.substr(path_.size()), /*is_root=*/false, proof);
                    }
                    break;
                case Kind::kBranch:
                    if (!path.empty() && children_[path[0]]) {
                        children_[path[0]]->prove(path.substr(1), /*is_root=*/false, proof);
                    }
                    break;
            }
        }

      private:
        static std::unique_ptr<Node> optional_extension(ByteView path, std::unique_ptr<Node> child) {
            if (path.empty()) {
                return child;
            }
            auto ext{std::make_unique<Node>()};
            ext->kind_ = Kind::kExtension;
            ext->path_ = path;
            ext->children_[0] = std::move(child);
            return ext;
        }

        // A branch holding two children, under an extension when the common path is not empty
        static Node split(ByteView common, uint8_t index1, std::unique_ptr<Node> child1, uint8_t index2,
                          std::unique_ptr<Node> child2) {
            WITGEN_ASSERT(index1 != index2);
            auto branch{std::make_unique<Node>()};
            branch->kind_ = Kind::kBranch;
            branch->children_[index1] = std::move(child1);
            branch->children_[index2] = std::move(child2);
            auto top{optional_extension(common, std::move(branch))};
            return std::move(*top);
        }

        Bytes key_item(bool is_leaf) const {
            Bytes item;
            rlp::encode(item, trie::encode_path(path_, is_leaf));
            return item;
        }

        static Bytes reference(const Node& child) {
            Bytes encoded{child.encode()};
            if (encoded.size() < kHashLength) {
                return encoded;
            }
            Bytes item;
            rlp::encode(item, trie::node_hash(encoded));
            return item;
        }

        Kind kind_{Kind::kLeaf};
        Bytes path_;
        Bytes value_;
        std::array<std::unique_ptr<Node>, trie::kBranchChildren> children_;
    };

    std::unique_ptr<Node> build(const std::map<evmc::bytes32, Bytes>& entries) {
        std::unique_ptr<Node> root;
        for (const auto& [key, value] : entries) {
            const Bytes path{trie::unpack_nibbles(key.bytes)};
            if (!root) {
                root = Node::leaf(path, value);
            } else {
                root->insert(path, value);
            }
        }
        return root;
    }

}  // namespace

void ProofTrie::put(const evmc::bytes32& key, Bytes value) {
    if (value.empty()) {
        entries_.erase(key);
    } else {
        entries_.insert_or_assign(key, std::move(value));
    }
}

evmc::bytes32 ProofTrie::root_hash() const {
    const auto root{build(entries_)};
    if (!root) {
        return kEmptyRoot;
    }
    return keccak256_bytes32(root->encode());
}

witness::ProofChain ProofTrie::prove(const evmc::bytes32& key) const {
    witness::ProofChain proof;
    if (const auto root{build(entries_)}; root) {
        root->prove(trie::unpack_nibbles(key.bytes), /*is_root=*/true, proof);
    }
    return proof;
}

}  // namespace witgen::test_util
