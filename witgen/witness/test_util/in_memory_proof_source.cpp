// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_proof_source.hpp"

#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/encode.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen::test_util {

void InMemoryProofSource::set_account(const evmc::address& address, const Account& account) {
    accounts_.insert_or_assign(address, account);
}

void InMemoryProofSource::erase_account(const evmc::address& address) {
    accounts_.erase(address);
    storage_.erase(address);
}

void InMemoryProofSource::set_storage(const evmc::address& address, const evmc::bytes32& slot,
                                      const evmc::bytes32& value) {
    accounts_.try_emplace(address);
    if (is_zero(value)) {
        storage_[address].erase(slot);
    } else {
        storage_[address].insert_or_assign(slot, value);
    }
}

std::optional<Account> InMemoryProofSource::account(const evmc::address& address) const {
    const auto it{accounts_.find(address)};
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    Account account{it->second};
    account.storage_root = storage_root(address);
    return account;
}

evmc::bytes32 InMemoryProofSource::state_root() const {
    return state_trie().root_hash();
}

evmc::bytes32 InMemoryProofSource::storage_root(const evmc::address& address) const {
    return storage_trie(address).root_hash();
}

void InMemoryProofSource::apply(const witness::Modification& modification) {
    const evmc::address& address{modification.address};
    switch (modification.kind.value_or(witness::ModificationKind::kNonExistentAccountProbe)) {
        case witness::ModificationKind::kStorageWrite:
            set_storage(address, modification.key.value_or(evmc::bytes32{}),
                        modification.value.value_or(evmc::bytes32{}));
            break;
        case witness::ModificationKind::kNonceWrite:
            accounts_[address].nonce = modification.nonce.value_or(0);
            break;
        case witness::ModificationKind::kBalanceWrite:
            accounts_[address].balance = modification.balance.value_or(intx::uint256{0});
            break;
        case witness::ModificationKind::kCreateAccount:
            accounts_.try_emplace(address);
            break;
        case witness::ModificationKind::kDeleteAccount:
            erase_account(address);
            break;
        case witness::ModificationKind::kNonExistentAccountProbe:
            break;
    }
}

witness::ProofChain InMemoryProofSource::account_proof(const evmc::address& address) const {
    return state_trie().prove(keccak256_bytes32(address.bytes));
}

witness::ProofChain InMemoryProofSource::storage_proof(const evmc::address& address,
                                                       const evmc::bytes32& slot) const {
    return storage_trie(address).prove(keccak256_bytes32(slot.bytes));
}

ProofTrie InMemoryProofSource::state_trie() const {
    ProofTrie trie;
    for (const auto& [address, account] : accounts_) {
        Account stored{account};
        stored.storage_root = storage_root(address);
        trie.put(keccak256_bytes32(address.bytes), stored.rlp());
    }
    return trie;
}

ProofTrie InMemoryProofSource::storage_trie(const evmc::address& address) const {
    ProofTrie trie;
    const auto it{storage_.find(address)};
    if (it == storage_.end()) {
        return trie;
    }
    for (const auto& [slot, value] : it->second) {
        Bytes encoded;
        rlp::encode(encoded, zeroless_view(value.bytes));
        trie.put(keccak256_bytes32(slot.bytes), std::move(encoded));
    }
    return trie;
}

}  // namespace witgen::test_util
