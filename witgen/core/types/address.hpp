// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <witgen/core/common/bytes.hpp>

namespace witgen {

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

// Parses a 0x-prefixed (or bare) hex encoding of exactly 20 bytes.
std::optional<evmc::address> hex_to_address(std::string_view hex);

std::string address_to_hex(const evmc::address& address);

}  // namespace witgen

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
