// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>

#include <evmc/evmc.hpp>

#include <witgen/core/common/bytes.hpp>
#include <witgen/witness/proof.hpp>

namespace witgen::test_util {

//! \brief In-memory Merkle-Patricia trie over hashed keys
//! \details The node structure is rebuilt from the key set on every query.
//! Proofs list the nodes met walking down a key, skipping nodes embedded in their parent, like eth_getProof.
class ProofTrie {
  public:
    //! \param value the leaf payload, an empty value removes the key
    void put(const evmc::bytes32& key, Bytes value);
    void erase(const evmc::bytes32& key) { entries_.erase(key); }

    bool empty() const noexcept { return entries_.empty(); }

    evmc::bytes32 root_hash() const;

    witness::ProofChain prove(const evmc::bytes32& key) const;

  private:
    std::map<evmc::bytes32, Bytes> entries_;
};

}  // namespace witgen::test_util
