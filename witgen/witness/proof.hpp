// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <witgen/core/common/bytes.hpp>

namespace witgen::witness {

//! \brief Raw RLP trie nodes from the root down along one key, as returned by eth_getProof
//! \remarks An empty chain stands for an empty trie
using ProofChain = std::vector<Bytes>;

//! \brief Non-owning view of a proof chain
using ChainView = std::vector<ByteView>;

ChainView view_of(const ProofChain& chain);

//! \brief Proofs for one key taken on the state before and after a modification
struct ProofPair {
    ProofChain before;
    ProofChain after;

    friend bool operator==(const ProofPair&, const ProofPair&) = default;
};

//! \brief Source of Merkle proofs on one state snapshot
class ProofSource {
  public:
    virtual ~ProofSource() = default;

    virtual ProofChain account_proof(const evmc::address& address) const = 0;

    //! \param slot the unhashed storage key
    virtual ProofChain storage_proof(const evmc::address& address, const evmc::bytes32& slot) const = 0;
};

}  // namespace witgen::witness
