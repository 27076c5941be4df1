// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "account_bridge.hpp"

#include <vector>

#include <witgen/core/rlp/list.hpp>
#include <witgen/core/trie/nibbles.hpp>
#include <witgen/core/trie/node.hpp>
#include <witgen/witness/short_node_encoder.hpp>

namespace witgen::witness {

namespace {

    tl::expected<trie::LeafNode, WitnessError> decode_leaf(ByteView leaf_rlp) {
        auto node{trie::decode_node(leaf_rlp)};
        if (!node) {
            return malformed(node.error());
        }
        auto* leaf{std::get_if<trie::LeafNode>(&*node)};
        if (!leaf) {
            return tl::unexpected{WitnessError::kMalformedNode};
        }
        return std::move(*leaf);
    }

    void write_hash_item(WitnessRow& row, size_t column, const evmc::bytes32& hash) {
        row.write(column, rlp::kHashStringCode);
        row.write(column + 1, hash.bytes);
    }

}  // namespace

tl::expected<Account, WitnessError> leaf_account(ByteView leaf_rlp) {
    const auto leaf{decode_leaf(leaf_rlp)};
    if (!leaf) {
        return tl::unexpected{leaf.error()};
    }
    Account account;
    ByteView value{leaf->value};
    if (DecodingResult res{rlp::decode(value, account)}; !res) {
        return malformed(res.error());
    }
    return account;
}

tl::expected<AccountRows, WitnessError> encode_account_leaf(ByteView leaf_rlp, Side side, uint8_t flags) {
    const bool before{side == Side::kBefore};
    AccountRows rows{WitnessRow{before ? RowType::kAccountKeyBefore : RowType::kAccountKeyAfter},
                     WitnessRow{before ? RowType::kAccountNonceBalanceBefore : RowType::kAccountNonceBalanceAfter},
                     WitnessRow{before ? RowType::kAccountStorageCodeHashBefore
                                       : RowType::kAccountStorageCodeHashAfter}};

    const auto leaf{decode_leaf(leaf_rlp)};
    if (!leaf) {
        return tl::unexpected{leaf.error()};
    }
    const auto account{leaf_account(leaf_rlp)};
    if (!account) {
        return tl::unexpected{account.error()};
    }

    WitnessRow& key_row{rows[0]};
    if (WitnessResult res{write_short_node_key(key_row, *leaf)}; !res) {
        return tl::unexpected{res.error()};
    }
    key_row.set_index(static_cast<uint8_t>(leaf->compact_key.size()));

    std::vector<rlp::RlpByteView> fields;
    ByteView account_rlp{leaf->value};
    if (DecodingResult res{rlp::decode(account_rlp, fields)}; !res) {
        return malformed(res.error());
    }
    const ByteView nonce_item{fields[0].data};
    const ByteView balance_item{fields[1].data};
    if (nonce_item.size() > kNonceFieldWidth || balance_item.size() > kBalanceFieldWidth) {
        return tl::unexpected{WitnessError::kMalformedNode};
    }
    const auto value_slot{header_slot(leaf->value_item)};
    if (!value_slot) {
        return tl::unexpected{value_slot.error()};
    }
    const auto list_slot{header_slot(leaf->value)};
    if (!list_slot) {
        return tl::unexpected{list_slot.error()};
    }
    WitnessRow& nonce_balance_row{rows[1]};
    nonce_balance_row.write(0, *value_slot);
    nonce_balance_row.write(kAccountListColumn, *list_slot);
    nonce_balance_row.write(kNonceColumn, nonce_item);
    nonce_balance_row.write(kBalanceColumn, balance_item);

    write_hash_item(rows[2], kStorageRootColumn, account->storage_root);
    write_hash_item(rows[2], kCodeHashColumn, account->code_hash);

    for (auto& row : rows) {
        row.add_flags(flags);
    }
    return rows;
}

Bytes empty_account_leaf(ByteView key, size_t position) {
    Bytes key_item;
    rlp::encode(key_item, trie::encode_path(key.substr(position), /*is_leaf=*/true));
    Bytes value_item;
    rlp::encode(value_item, Account{}.rlp());
    Bytes leaf;
    rlp::encode(leaf, std::vector<rlp::RlpBytes>{rlp::RlpBytes{key_item}, rlp::RlpBytes{value_item}});
    return leaf;
}

evmc::bytes32 storage_root_of(const ProofChain& chain) {
    return chain.empty() ? kEmptyRoot : trie::node_hash(chain.front());
}

tl::expected<WitnessRow, WitnessError> encode_storage_bridge(const Account& before, const Account& after,
                                                             const ProofChain& storage_before,
                                                             const ProofChain& storage_after) {
    const evmc::bytes32 before_root{storage_root_of(storage_before)};
    const evmc::bytes32 after_root{storage_root_of(storage_after)};
    if (before_root != before.storage_root || after_root != after.storage_root) {
        return tl::unexpected{WitnessError::kBrokenHashChain};
    }
    WitnessRow row{RowType::kStorageBridge};
    write_hash_item(row, kBeforeWindowColumn + kWindowOffset - 1, before_root);
    write_hash_item(row, kAfterWindowColumn + kWindowOffset - 1, after_root);
    return row;
}

}  // namespace witgen::witness
