// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <witgen/core/common/bytes.hpp>
#include <witgen/witness/errors.hpp>

namespace witgen::witness {

enum class ModificationKind {
    kStorageWrite,
    kNonceWrite,
    kBalanceWrite,
    kCreateAccount,
    kDeleteAccount,
    kNonExistentAccountProbe,
};

//! \brief The single state change a witness attests to
//! \details Only the fields of the declared kind may be set:
//! key and value for kStorageWrite, nonce for kNonceWrite, balance for kBalanceWrite, none otherwise.
//! A zero value deletes the storage slot.
struct Modification {
    std::optional<ModificationKind> kind;
    evmc::address address;
    std::optional<evmc::bytes32> key;
    std::optional<evmc::bytes32> value;
    std::optional<uint64_t> nonce;
    std::optional<intx::uint256> balance;

    static Modification storage_write(const evmc::address& address, const evmc::bytes32& key,
                                      const evmc::bytes32& value);
    static Modification nonce_write(const evmc::address& address, uint64_t nonce);
    static Modification balance_write(const evmc::address& address, const intx::uint256& balance);
    static Modification create_account(const evmc::address& address);
    static Modification delete_account(const evmc::address& address);
    static Modification probe(const evmc::address& address);

    //! \return kUnsupportedModificationKind when no kind is set or fields of another kind are set
    WitnessResult validate() const noexcept;

    bool is_storage_write() const noexcept { return kind == ModificationKind::kStorageWrite; }

    //! \brief Expanded nibbles of keccak(address)
    Bytes account_path() const;

    //! \brief Expanded nibbles of keccak(key)
    //! \pre is_storage_write()
    Bytes storage_path() const;

    friend bool operator==(const Modification&, const Modification&) = default;

    std::string to_string() const;
};

}  // namespace witgen::witness
