// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <intx/intx.hpp>

#include <witgen/core/common/assert.hpp>

#define WITGEN_THREAD_LOCAL thread_local

namespace witgen {

using namespace std::string_view_literals;

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256> || std::same_as<T, intx::uint512>;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// A secure trie key (keccak-256 of a slot or an address) expands to this many nibbles
inline constexpr size_t kKeyNibbles{2 * kHashLength};

}  // namespace witgen
