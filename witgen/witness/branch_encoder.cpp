// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "branch_encoder.hpp"

#include <algorithm>

#include <witgen/core/rlp/encode.hpp>

namespace witgen::witness {

tl::expected<BranchWindows, WitnessError> branch_windows(ByteView encoded) {
    const auto node{trie::decode_node(encoded)};
    if (!node) {
        return malformed(node.error());
    }
    const auto* branch{std::get_if<trie::BranchNode>(&*node)};
    if (!branch) {
        return tl::unexpected{WitnessError::kMalformedNode};
    }

    BranchWindows windows{};
    const auto slot{header_slot(encoded)};
    if (!slot) {
        return tl::unexpected{slot.error()};
    }
    std::copy(slot->begin(), slot->end(), windows[0].begin());

    ByteView payload{encoded.substr(branch->header_length)};
    size_t child{0};
    size_t carry{0};
    size_t pos{0};
    for (; pos < payload.size() && child < trie::kBranchChildren; ++pos) {
        const uint8_t b{payload[pos]};
        BranchWindow& window{windows[child + 1]};
        if (carry > 0) {
            window[kWindowWidth - carry] = b;
            if (--carry == 0) {
                ++child;
            }
        } else if (b == rlp::kHashStringCode) {
            window[kWindowOffset - 1] = b;
            carry = kHashLength;
        } else if (b == rlp::kEmptyStringCode) {
            window[kWindowOffset] = b;
            ++child;
        } else {
            return tl::unexpected{WitnessError::kUnexpectedBranchByte};
        }
    }

    // Value item
    if (child != trie::kBranchChildren || pos + 1 != payload.size() || payload[pos] != rlp::kEmptyStringCode) {
        return tl::unexpected{WitnessError::kUnexpectedBranchByte};
    }
    return windows;
}

tl::expected<BranchBlock, WitnessError> encode_branch_pair(ByteView before, ByteView after, uint8_t nibble,
                                                           uint8_t flags) {
    WITGEN_ASSERT(nibble < trie::kBranchChildren);

    const auto before_windows{branch_windows(before)};
    if (!before_windows) {
        return tl::unexpected{before_windows.error()};
    }
    const auto after_windows{branch_windows(after)};
    if (!after_windows) {
        return tl::unexpected{after_windows.error()};
    }

    BranchBlock block{};
    for (size_t i{0}; i < kBranchRows; ++i) {
        WitnessRow& row{block[i]};
        const bool is_child{i > 0};
        if (is_child && i - 1 != nibble && (*before_windows)[i] != (*after_windows)[i]) {
            return tl::unexpected{WitnessError::kBranchDivergenceInvariantViolation};
        }
        row.set_type(is_child ? RowType::kBranchChild : RowType::kBranchInit);
        row.write(kBeforeWindowColumn, (*before_windows)[i]);
        row.write(kAfterWindowColumn, (*after_windows)[i]);
        row.set_index(is_child ? static_cast<uint8_t>(i - 1) : nibble);
        row.add_flags(flags);
        if (is_child && i - 1 == nibble) {
            row.add_flags(kFlagModifiedSlot);
        }
    }
    return block;
}

}  // namespace witgen::witness
