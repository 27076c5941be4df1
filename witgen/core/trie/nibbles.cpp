// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "nibbles.hpp"

namespace witgen::trie {

Bytes pack_nibbles(ByteView unpacked) {
    if (unpacked.empty()) {
        return {};
    }

    size_t pos{unpacked.size() & 1};
    Bytes out((unpacked.size() + pos) / 2, '\0');
    auto out_it{out.begin()};
    while (unpacked.size() > pos) {
        *out_it++ = static_cast<uint8_t>((unpacked[0] << 4) + unpacked[1]);
        unpacked.remove_prefix(2);
    }
    if (pos) {
        *out_it = static_cast<uint8_t>(unpacked[0] << 4);
        unpacked.remove_prefix(1);
    }

    return out;
}

Bytes unpack_nibbles(ByteView data) {
    Bytes out(2 * data.size(), '\0');
    size_t offset{0};
    for (const auto& b : data) {
        out[offset] = b >> 4;
        out[offset + 1] = b & 0x0F;
        offset += 2;
    }
    return out;
}

Bytes encode_path(ByteView nibbles, bool is_leaf) {
    const bool odd{(nibbles.size() & 1) != 0};
    const uint8_t flag{static_cast<uint8_t>((is_leaf ? 2 : 0) + (odd ? 1 : 0))};

    Bytes out;
    out.reserve(nibbles.size() / 2 + 1);
    if (odd) {
        out.push_back(static_cast<uint8_t>((flag << 4) | nibbles[0]));
        nibbles.remove_prefix(1);
    } else {
        out.push_back(static_cast<uint8_t>(flag << 4));
    }
    for (size_t i{0}; i < nibbles.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibbles[i] << 4) | nibbles[i + 1]));
    }
    return out;
}

tl::expected<CompactPath, DecodingError> decode_path(ByteView compact) noexcept {
    if (compact.empty()) {
        return tl::unexpected{DecodingError::kInvalidHexPrefix};
    }
    const uint8_t flag{static_cast<uint8_t>(compact[0] >> 4)};
    if (flag > 3) {
        return tl::unexpected{DecodingError::kInvalidHexPrefix};
    }
    const bool odd{(flag & 1) != 0};
    if (!odd && (compact[0] & 0x0F) != 0) {
        return tl::unexpected{DecodingError::kInvalidHexPrefix};
    }

    CompactPath path{.nibbles = {}, .is_leaf = flag >= 2};
    path.nibbles.reserve(2 * compact.size());
    if (odd) {
        path.nibbles.push_back(compact[0] & 0x0F);
    }
    path.nibbles.append(unpack_nibbles(compact.substr(1)));
    return path;
}

}  // namespace witgen::trie
