// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "list.hpp"

namespace witgen::rlp {

void encode(Bytes& to, const std::vector<RlpByteView>& items) {
    Header header{.list = true, .payload_length = 0};
    for (const auto& item : items) {
        header.payload_length += item.data.size();
    }
    to.reserve(to.size() + length_of_length(header.payload_length) + header.payload_length);
    encode_header(to, header);
    for (const auto& item : items) {
        to.append(item.data);
    }
}

void encode(Bytes& to, const std::vector<RlpBytes>& items) {
    std::vector<RlpByteView> views;
    views.reserve(items.size());
    for (const auto& item : items) {
        views.emplace_back(item.data);
    }
    encode(to, views);
}

DecodingResult decode(ByteView& from, std::vector<RlpByteView>& to, Leftover mode) noexcept {
    const auto header{decode_header(from)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (!header->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }

    to.clear();
    ByteView payload{from.substr(0, header->payload_length)};
    while (!payload.empty()) {
        ByteView rest{payload};
        const auto item_header{decode_header(rest)};
        if (!item_header) {
            return tl::unexpected{item_header.error()};
        }
        const size_t item_length{payload.size() - rest.size() + item_header->payload_length};
        to.emplace_back(payload.substr(0, item_length));
        payload.remove_prefix(item_length);
    }

    from.remove_prefix(header->payload_length);
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

}  // namespace witgen::rlp
