// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <evmc/evmc.hpp>

#include <witgen/core/common/bytes.hpp>
#include <witgen/core/rlp/decode.hpp>

namespace witgen {

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

//! \brief Keccak-256 of the input as evmc::bytes32
evmc::bytes32 keccak256_bytes32(ByteView data);

}  // namespace witgen

namespace witgen::rlp {

void encode(Bytes& to, const evmc::bytes32& value);
size_t length(const evmc::bytes32& value) noexcept;

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace witgen::rlp
