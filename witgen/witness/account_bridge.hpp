// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>

#include <witgen/core/types/account.hpp>
#include <witgen/witness/proof.hpp>
#include <witgen/witness/row.hpp>

namespace witgen::witness {

inline constexpr size_t kAccountRows{3};

// Nonce/balance row: value header slot, account list header slot, then fixed-width fields
inline constexpr size_t kAccountListColumn{kHeaderSlotWidth};
inline constexpr size_t kNonceColumn{kAccountListColumn + kHeaderSlotWidth};
inline constexpr size_t kNonceFieldWidth{1 + sizeof(uint64_t)};
inline constexpr size_t kBalanceColumn{kNonceColumn + kNonceFieldWidth};
inline constexpr size_t kBalanceFieldWidth{1 + kHashLength};

// Storage/code hash row: two hash items
inline constexpr size_t kStorageRootColumn{0};
inline constexpr size_t kCodeHashColumn{1 + kHashLength};

using AccountRows = std::array<WitnessRow, kAccountRows>;

//! \brief Account held by a state trie leaf
tl::expected<Account, WitnessError> leaf_account(ByteView leaf_rlp);

//! \brief Key, nonce/balance and storage root/code hash rows of a state trie leaf on one side
tl::expected<AccountRows, WitnessError> encode_account_leaf(ByteView leaf_rlp, Side side, uint8_t flags);

//! \brief A state trie leaf holding the empty account under the key nibbles left after position
Bytes empty_account_leaf(ByteView key, size_t position);

//! \brief Root of the storage trie a storage proof walks
evmc::bytes32 storage_root_of(const ProofChain& chain);

//! \brief Row linking each side's account to the root of its storage proof
//! \return kBrokenHashChain when a storage proof does not start at the storage root of its account
tl::expected<WitnessRow, WitnessError> encode_storage_bridge(const Account& before, const Account& after,
                                                             const ProofChain& storage_before,
                                                             const ProofChain& storage_after);

}  // namespace witgen::witness
