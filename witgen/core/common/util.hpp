// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <intx/intx.hpp>

#include <witgen/core/common/base.hpp>
#include <witgen/core/common/bytes.hpp>

namespace witgen {

//! \brief Strips leftmost zeroed bytes from byte sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Cuts the input to the given length, adding an ellipsis when something was cut
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Parses a hex string, with or without 0x prefix; an odd number of digits gets a leading zero nibble
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// The length of the longest common prefix of a and b.
size_t prefix_length(ByteView a, ByteView b);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

}  // namespace witgen
