// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <witgen/core/common/decoding_result.hpp>

namespace witgen::witness {

// Error codes for witness generation and proof verification
enum class [[nodiscard]] WitnessError {
    kMalformedNode,                       // Unparsable RLP or wrong element count
    kUnexpectedBranchByte,                // Byte outside {hash marker, nil marker} in a branch
    kBranchDivergenceInvariantViolation,  // Aligned branches differ outside the key nibble
    kBrokenHashChain,                     // Parent does not reference the hash of its child
    kPathDivergenceOutsideKey,            // Parallel proofs differ outside the key path
    kUnsupportedModificationKind,         // Modification kind unset or contradictory fields
    kDriftedNodeMismatch,                 // Node moved by a new or collapsed branch is not where expected
    kModificationMismatch,                // After state does not reflect the declared modification
    kKeyPresent,                          // Exclusion proof reaches the key's leaf
};

using WitnessResult = tl::expected<void, WitnessError>;

std::string_view to_string(WitnessError error) noexcept;

//! \brief Node decoding failures all surface as malformed nodes
inline tl::unexpected<WitnessError> malformed(DecodingError) noexcept {
    return tl::unexpected{WitnessError::kMalformedNode};
}

class WitnessException : public std::runtime_error {
  public:
    explicit WitnessException(WitnessError err, const std::string& message = "");

    WitnessError err() const noexcept { return err_; }

  private:
    WitnessError err_;
};

template <class T>
inline void success_or_throw(const tl::expected<T, WitnessError>& res, const std::string& error_message = "") {
    if (!res) {
        throw WitnessException(res.error(), error_message);
    }
}

template <class T>
inline T unwrap_or_throw(tl::expected<T, WitnessError> res, const std::string& error_message = "") {
    success_or_throw(res, error_message);
    return std::move(*res);
}

}  // namespace witgen::witness
