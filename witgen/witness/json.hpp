// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include <witgen/witness/builder.hpp>
#include <witgen/witness/modification.hpp>
#include <witgen/witness/proof.hpp>
#include <witgen/witness/row.hpp>

namespace witgen::witness {

// Rows as arrays of kRowWidth numbers, the matrix as an array of rows
void to_json(nlohmann::json& json, const WitnessRow& row);
void to_json(nlohmann::json& json, const WitnessMatrix& matrix);

//! Hex strings for binary fields, kind in lower camel case ("storageWrite", ...)
void to_json(nlohmann::json& json, const Modification& modification);

//! \throws std::invalid_argument on an unknown kind or a malformed hex field
void from_json(const nlohmann::json& json, Modification& modification);

void to_json(nlohmann::json& json, const ProofPair& pair);
void from_json(const nlohmann::json& json, ProofPair& pair);

//! Fields "modification", "accountProof" and the optional "storageProof"
void to_json(nlohmann::json& json, const WitnessInput& input);
void from_json(const nlohmann::json& json, WitnessInput& input);

//! \brief Reads either one input object or a {"modifications": [input, ...]} batch
//! \throws std::invalid_argument or nlohmann::json::exception on malformed input
std::vector<WitnessInput> inputs_from_json(const nlohmann::json& json);

}  // namespace witgen::witness
