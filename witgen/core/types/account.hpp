// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <intx/intx.hpp>

#include <witgen/core/common/bytes.hpp>
#include <witgen/core/common/empty_hashes.hpp>
#include <witgen/core/rlp/decode.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen {

//! \brief An account as stored in a leaf of the state trie
//! \remarks Yellow Paper, Section 4.1
struct Account {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 storage_root{kEmptyRoot};
    evmc::bytes32 code_hash{kEmptyHash};

    //! \brief Serialize the account into its Recursive-Length Prefix (RLP) representation
    Bytes rlp() const;

    //! \brief Whether this is the account a missing state trie leaf stands for
    bool is_empty() const;

    friend bool operator==(const Account&, const Account&) = default;

    std::string to_string() const;
};

namespace rlp {
    size_t length(const Account& account) noexcept;
    DecodingResult decode(ByteView& from, Account& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace witgen
