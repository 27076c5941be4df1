// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <sstream>

#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/list.hpp>
#include <witgen/core/rlp/encode.hpp>

namespace witgen {

namespace rlp {

    static Header account_header(const Account& account) noexcept {
        Header h{true, 0};
        h.payload_length += length(account.nonce);
        h.payload_length += length(account.balance);
        h.payload_length += kHashLength + 1;
        h.payload_length += kHashLength + 1;
        return h;
    }

    size_t length(const Account& account) noexcept {
        const Header h{account_header(account)};
        return length_of_length(h.payload_length) + h.payload_length;
    }

    DecodingResult decode(ByteView& from, Account& to, Leftover mode) noexcept {
        std::vector<RlpByteView> fields;
        if (DecodingResult res{decode(from, fields, mode)}; !res) {
            return res;
        }
        if (fields.size() != 4) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        ByteView nonce{fields[0].data};
        ByteView balance{fields[1].data};
        ByteView storage_root{fields[2].data};
        ByteView code_hash{fields[3].data};
        if (DecodingResult res{decode(nonce, to.nonce)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(balance, to.balance)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(storage_root, to.storage_root)}; !res) {
            return res;
        }
        return decode(code_hash, to.code_hash);
    }

}  // namespace rlp

Bytes Account::rlp() const {
    Bytes to;
    rlp::encode_header(to, rlp::account_header(*this));
    rlp::encode(to, nonce);
    rlp::encode(to, balance);
    rlp::encode(to, storage_root);
    rlp::encode(to, code_hash);
    return to;
}

bool Account::is_empty() const {
    return *this == Account{};
}

std::string Account::to_string() const {
    const auto& account = *this;
    std::stringstream out;

    out << "nonce: " << account.nonce;
    out << " balance: "
        << "0x" << intx::hex(account.balance);
    out << " storage_root: 0x" << to_hex(account.storage_root);
    out << " code_hash: 0x" << to_hex(account.code_hash);
    return out.str();
}

}  // namespace witgen
