// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace witgen::cmd::common {

static void parse(CLI::App& cli, std::vector<std::string> args) {
    std::reverse(args.begin(), args.end());
    cli.parse(args);
}

TEST_CASE("add_logging_options", "[infra][cli]") {
    CLI::App cli{"test"};
    log::Settings settings;
    add_logging_options(cli, settings);

    SECTION("defaults") {
        parse(cli, {});
        CHECK(settings.log_verbosity == log::Level::kInfo);
        CHECK_FALSE(settings.log_std_out);
        CHECK(settings.log_file.empty());
    }

    SECTION("verbosity by name") {
        parse(cli, {"--log.verbosity", "TRACE", "--log.stdout", "--log.file", "out.log"});
        CHECK(settings.log_verbosity == log::Level::kTrace);
        CHECK(settings.log_std_out);
        CHECK(settings.log_file == "out.log");
    }

    SECTION("verbosity by number") {
        parse(cli, {"--log.verbosity", "2"});
        CHECK(settings.log_verbosity == log::Level::kError);
    }

    SECTION("unknown verbosity") {
        CHECK_THROWS(parse(cli, {"--log.verbosity", "loud"}));
    }
}

TEST_CASE("add_option_input_file", "[infra][cli]") {
    CLI::App cli{"test"};
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;
    add_option_input_file(cli, input);
    add_option_output_file(cli, output);

    SECTION("required") {
        CHECK_THROWS_AS(parse(cli, {}), CLI::RequiredError);
    }

    SECTION("must exist") {
        CHECK_THROWS_AS(parse(cli, {"--input", "/nonexistent/witgen/input.json"}), CLI::ValidationError);
    }

    SECTION("existing file") {
        const auto path{std::filesystem::temp_directory_path() / "witgen_cli_test.json"};
        std::ofstream{path} << "{}";
        parse(cli, {"--input", path.string()});
        CHECK(input == path);
        CHECK_FALSE(output);

        CLI::App cli2{"test"};
        add_option_input_file(cli2, input);
        add_option_output_file(cli2, output);
        parse(cli2, {"--input", path.string(), "--output", "matrix.json"});
        REQUIRE(output);
        CHECK(*output == "matrix.json");
    }
}

}  // namespace witgen::cmd::common
