// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <witgen/core/common/base.hpp>
#include <witgen/core/common/bytes.hpp>
#include <witgen/core/common/decoding_result.hpp>
#include <witgen/core/rlp/decode.hpp>
#include <witgen/core/rlp/encode.hpp>

namespace witgen::rlp {

/**
 * RlpBytes represents a raw RLP-encoded list item.
 * Trie nodes mix hash references, nil markers and embedded values in one list:
 * each item is encoded separately and then assembled into the list.
 */
struct RlpBytes {
    Bytes data;
    explicit RlpBytes(Bytes data1) : data(std::move(data1)) {}
};

//! see RlpBytes
struct RlpByteView {
    ByteView data;
    explicit RlpByteView(ByteView data1) : data(data1) {}
};

//! \brief Wraps already encoded items into a list
void encode(Bytes& to, const std::vector<RlpByteView>& items);
void encode(Bytes& to, const std::vector<RlpBytes>& items);

/**
 * Splits an RLP list into its items without decoding them.
 * The resulting RlpByteView-s refer to the encoded items, headers included,
 * so rlp::decode(to[i].data, ...) decodes them fully.
 */
DecodingResult decode(ByteView& from, std::vector<RlpByteView>& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace witgen::rlp
