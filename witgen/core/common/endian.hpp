// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
See https://en.wikipedia.org/wiki/Endianness
*/

#include <cstdint>
#include <cstring>

#include <intx/intx.hpp>

#include <witgen/core/common/base.hpp>
#include <witgen/core/common/bytes.hpp>
#include <witgen/core/common/decoding_result.hpp>

namespace witgen::endian {

// Similar to boost::endian::store_big_u64
const auto store_big_u64 = intx::be::unsafe::store<uint64_t>;  // NOLINT(readability-identifier-naming)

//! \brief Big endian form of the value with the leading zero bytes stripped
//! \remarks The view points into a thread-local buffer overwritten by the next call
ByteView to_big_compact(uint64_t value);

//! \copydoc to_big_compact(uint64_t)
ByteView to_big_compact(const intx::uint256& value);

//! \brief Parses an unsigned integer from its compact big endian form
//! \return kOverflow when the input is wider than T, kLeadingZero when it is not compact
template <UnsignedIntegral T>
static DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }

    out = 0;
    if (data.empty()) {
        return {};
    }

    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }

    auto* ptr{reinterpret_cast<uint8_t*>(&out)};
    std::memcpy(ptr + (sizeof(T) - data.size()), &data[0], data.size());

    out = intx::to_big_endian(out);
    return {};
}

}  // namespace witgen::endian
