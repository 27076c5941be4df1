// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>

#include <witgen/core/trie/node.hpp>
#include <witgen/witness/row.hpp>

namespace witgen::witness {

inline constexpr size_t kBranchRows{trie::kBranchChildren + 1};

using BranchWindow = std::array<uint8_t, kWindowWidth>;

//! \brief Header window followed by one window per child slot
using BranchWindows = std::array<BranchWindow, kBranchRows>;

using BranchBlock = std::array<WitnessRow, kBranchRows>;

//! \brief Lays out one branch node as 17 windows
//! \details Walks the payload byte by byte: 0xa0 starts a 32-byte hash, 0x80 is a nil slot.
//! Hash slots get the marker at column 1 and the hash at columns 2..33, nil slots get 0x80 at column 2.
//! \return kMalformedNode when the bytes are not a branch, kUnexpectedBranchByte for any other child encoding
//! or a non-empty value
tl::expected<BranchWindows, WitnessError> branch_windows(ByteView encoded);

//! \brief Rows for a pair of branches sitting at the same depth
//! \param nibble the key nibble the two branches diverge at
//! \param flags placeholder bits, put on every row; the side they name must carry the counterpart's bytes
//! \return kBranchDivergenceInvariantViolation when a slot other than nibble differs between the two sides
tl::expected<BranchBlock, WitnessError> encode_branch_pair(ByteView before, ByteView after, uint8_t nibble,
                                                           uint8_t flags);

}  // namespace witgen::witness
