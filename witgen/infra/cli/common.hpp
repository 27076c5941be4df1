// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>

#include <CLI/CLI.hpp>

#include <witgen/infra/common/log.hpp>

namespace witgen::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up the mandatory option for an existing input file
void add_option_input_file(CLI::App& cli, std::filesystem::path& input_file);

//! \brief Set up the option for an output file, standard output when unset
void add_option_output_file(CLI::App& cli, std::optional<std::filesystem::path>& output_file);

}  // namespace witgen::cmd::common
