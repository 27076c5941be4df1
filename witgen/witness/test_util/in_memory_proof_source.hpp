// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>

#include <evmc/evmc.hpp>

#include <witgen/core/types/account.hpp>
#include <witgen/witness/modification.hpp>
#include <witgen/witness/proof.hpp>
#include <witgen/witness/test_util/proof_trie.hpp>

namespace witgen::test_util {

//! \brief State snapshot held in memory: accounts plus their storage, proven through ProofTrie
//! \remarks Account storage roots are derived from the storage held here
class InMemoryProofSource : public witness::ProofSource {
  public:
    void set_account(const evmc::address& address, const Account& account);
    void erase_account(const evmc::address& address);

    //! \brief A zero value deletes the slot; the account is created when missing
    void set_storage(const evmc::address& address, const evmc::bytes32& slot, const evmc::bytes32& value);

    std::optional<Account> account(const evmc::address& address) const;

    evmc::bytes32 state_root() const;
    evmc::bytes32 storage_root(const evmc::address& address) const;

    //! \brief Performs the state change a modification describes
    void apply(const witness::Modification& modification);

    witness::ProofChain account_proof(const evmc::address& address) const override;
    witness::ProofChain storage_proof(const evmc::address& address, const evmc::bytes32& slot) const override;

  private:
    ProofTrie state_trie() const;
    ProofTrie storage_trie(const evmc::address& address) const;

    std::map<evmc::address, Account> accounts_;
    std::map<evmc::address, std::map<evmc::bytes32, evmc::bytes32>> storage_;
};

}  // namespace witgen::test_util
