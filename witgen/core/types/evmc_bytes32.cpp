// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/encode.hpp>

namespace witgen {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return witgen::to_hex(ByteView{value.bytes}, with_prefix);
}

evmc::bytes32 keccak256_bytes32(ByteView data) {
    return std::bit_cast<evmc_bytes32>(keccak256(data));
}

}  // namespace witgen

namespace witgen::rlp {

void encode(Bytes& to, const evmc::bytes32& value) {
    witgen::rlp::encode(to, ByteView{value.bytes});
}

size_t length(const evmc::bytes32& value) noexcept {
    return witgen::rlp::length(ByteView{value.bytes});
}

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode) noexcept {
    return witgen::rlp::decode(from, to.bytes, mode);
}

}  // namespace witgen::rlp
