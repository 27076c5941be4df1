// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <span>

#include <witgen/witness/aligner.hpp>
#include <witgen/witness/modification.hpp>
#include <witgen/witness/proof.hpp>
#include <witgen/witness/row.hpp>

namespace witgen::witness {

//! \brief Everything a witness is generated from
struct WitnessInput {
    Modification modification;
    ProofPair account_proof;
    std::optional<ProofPair> storage_proof;  // Set for storage writes only
};

//! \brief Gathers the proofs a modification needs from the snapshots taken before and after it
WitnessInput collect_input(const ProofSource& before, const ProofSource& after, const Modification& modification);

//! \brief Builds the witness matrix attesting one modification
//! \details Rows come root to leaf: account trie blocks, account leaf rows and drifted node,
//! then for storage writes the bridge row, storage trie blocks, storage leaf rows and drifted node.
//! No matrix is returned on error.
tl::expected<WitnessMatrix, WitnessError> generate_witness(const WitnessInput& input);

//! \brief Builds one matrix for modifications applied one after the other, their rows in input order
//! \details Each input must start from the state root the previous one ends at, else kBrokenHashChain
tl::expected<WitnessMatrix, WitnessError> generate_witness(std::span<const WitnessInput> inputs);

//! \brief Appends the branch and extension blocks of an aligned path, the mismatched extension block included
WitnessResult encode_path_blocks(const AlignedPath& path, ByteView key, WitnessMatrix& matrix);

//! \brief Appends the row of the node moved by an added or removed branch, if any
WitnessResult encode_drifted_row(const AlignedPath& path, WitnessMatrix& matrix);

}  // namespace witgen::witness
