// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <witgen/core/common/base.hpp>
#include <witgen/core/common/bytes.hpp>
#include <witgen/core/common/decoding_result.hpp>

namespace witgen::trie {

//! \brief Transforms a string of Nibbles into a string of Bytes
//! \def A Nibble's value is [0..16)
Bytes pack_nibbles(ByteView unpacked);

//! \brief Transforms a string of bytes into a string of Nibbles
//! \def A Nibble's value is [0..16)
Bytes unpack_nibbles(ByteView data);

//! \brief A partial path as stored in leaf and extension nodes
struct CompactPath {
    Bytes nibbles;
    bool is_leaf{false};

    bool odd() const noexcept { return (nibbles.size() & 1) != 0; }
};

//! \brief Hex-prefix (compact) encoding of a nibble path
//! \details First nibble of the output is the flag: 0/1 even/odd extension, 2/3 even/odd leaf.
//! An even path gets a zero pad nibble after the flag, an odd path carries its first nibble there.
//! \see Yellow Paper, Appendix C
Bytes encode_path(ByteView nibbles, bool is_leaf);

//! \brief Inverse of encode_path
//! \return kInvalidHexPrefix for an empty input, a flag above 3 or a non-zero pad nibble
tl::expected<CompactPath, DecodingError> decode_path(ByteView compact) noexcept;

}  // namespace witgen::trie
