// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <witgen/witness/errors.hpp>
#include <witgen/witness/proof.hpp>

namespace witgen::witness {

//! \brief Checks that every node of a proof is referenced by its parent along the key
//! \param root when set the first node must hash to it, an empty chain standing for the empty trie
//! \return kBrokenHashChain on a wrong reference or when nodes follow a leaf or a mismatched extension
WitnessResult verify_hash_chain(const ChainView& chain, ByteView key,
                                const std::optional<evmc::bytes32>& root = std::nullopt);

//! \brief Checks that two proofs of one key walk the same shape and differ only along the key
//! \details A last pair of different shapes, or of two leaves, is not compared.
//! \return kPathDivergenceOutsideKey on different lengths, shapes, extension keys or sibling slots
WitnessResult verify_parallel_paths(const ChainView& before, const ChainView& after, ByteView key);

//! \brief Checks that a proof shows the key absent
//! \return kKeyPresent when the proof ends at the key's leaf, kBrokenHashChain when it stops short
WitnessResult verify_exclusion(const ChainView& chain, ByteView key);

}  // namespace witgen::witness
