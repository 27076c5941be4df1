// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

namespace witgen::witness {

std::string_view to_string(WitnessError error) noexcept {
    return magic_enum::enum_name(error);
}

WitnessException::WitnessException(WitnessError err, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Witness error : " + std::string{magic_enum::enum_name(err)}
                          : message},
      err_{err} {}

}  // namespace witgen::witness
