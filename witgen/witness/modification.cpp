// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "modification.hpp"

#include <sstream>

#include <magic_enum.hpp>

#include <witgen/core/common/util.hpp>
#include <witgen/core/trie/nibbles.hpp>
#include <witgen/core/types/address.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen::witness {

Modification Modification::storage_write(const evmc::address& address, const evmc::bytes32& key,
                                         const evmc::bytes32& value) {
    return {.kind = ModificationKind::kStorageWrite, .address = address, .key = key, .value = value};
}

Modification Modification::nonce_write(const evmc::address& address, uint64_t nonce) {
    return {.kind = ModificationKind::kNonceWrite, .address = address, .nonce = nonce};
}

Modification Modification::balance_write(const evmc::address& address, const intx::uint256& balance) {
    return {.kind = ModificationKind::kBalanceWrite, .address = address, .balance = balance};
}

Modification Modification::create_account(const evmc::address& address) {
    return {.kind = ModificationKind::kCreateAccount, .address = address};
}

Modification Modification::delete_account(const evmc::address& address) {
    return {.kind = ModificationKind::kDeleteAccount, .address = address};
}

Modification Modification::probe(const evmc::address& address) {
    return {.kind = ModificationKind::kNonExistentAccountProbe, .address = address};
}

WitnessResult Modification::validate() const noexcept {
    if (!kind) {
        return tl::unexpected{WitnessError::kUnsupportedModificationKind};
    }
    bool fields_match{false};
    switch (*kind) {
        case ModificationKind::kStorageWrite:
            fields_match = key && value && !nonce && !balance;
            break;
        case ModificationKind::kNonceWrite:
            fields_match = !key && !value && nonce && !balance;
            break;
        case ModificationKind::kBalanceWrite:
            fields_match = !key && !value && !nonce && balance;
            break;
        case ModificationKind::kCreateAccount:
        case ModificationKind::kDeleteAccount:
        case ModificationKind::kNonExistentAccountProbe:
            fields_match = !key && !value && !nonce && !balance;
            break;
    }
    if (!fields_match) {
        return tl::unexpected{WitnessError::kUnsupportedModificationKind};
    }
    return {};
}

Bytes Modification::account_path() const {
    return trie::unpack_nibbles(keccak256_bytes32(address.bytes).bytes);
}

Bytes Modification::storage_path() const {
    WITGEN_ASSERT(key.has_value());
    return trie::unpack_nibbles(keccak256_bytes32(key->bytes).bytes);
}

std::string Modification::to_string() const {
    std::stringstream out;
    out << (kind ? magic_enum::enum_name(*kind) : "kUnset") << " address: " << address_to_hex(address);
    if (key) {
        out << " key: " << to_hex(*key, /*with_prefix=*/true);
    }
    if (value) {
        out << " value: " << to_hex(*value, /*with_prefix=*/true);
    }
    if (nonce) {
        out << " nonce: " << *nonce;
    }
    if (balance) {
        out << " balance: 0x" << intx::hex(*balance);
    }
    return out.str();
}

}  // namespace witgen::witness
