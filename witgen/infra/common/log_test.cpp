// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <witgen/infra/test_util/log.hpp>

namespace witgen::log {

//! LogBuffer exposing its buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

template <Level level>
static void check_log_empty() {
    LogBufferForTest<level> log_buffer;
    log_buffer << "test";
    CHECK(log_buffer.content().empty());
}

template <Level level>
static void check_log_not_empty() {
    LogBufferForTest<level> log_buffer;
    log_buffer << "test";
    CHECK(absl::StrContains(log_buffer.content(), "test"));
}

static std::string prettified_key_value(const std::string& key, const std::string& value) {
    std::string kv_pair{kColorGreen};
    kv_pair.append(key);
    kv_pair.append(kColorReset);
    kv_pair.append("=");
    kv_pair.append(kColorWhite);
    kv_pair.append(value);
    return kv_pair;
}

TEST_CASE("LogBuffer", "[infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    init(Settings{.log_verbosity = Level::kInfo});

    SECTION("nothing stored above configured verbosity") {
        check_log_empty<Level::kDebug>();
        check_log_empty<Level::kTrace>();

        test_util::SetLogVerbosityGuard guard{Level::kWarning};
        check_log_empty<Level::kInfo>();
    }

    SECTION("content stored up to configured verbosity") {
        check_log_not_empty<Level::kInfo>();
        check_log_not_empty<Level::kWarning>();
        check_log_not_empty<Level::kError>();
        check_log_not_empty<Level::kCritical>();
        check_log_not_empty<Level::kNone>();
    }

    SECTION("level tag") {
        LogBufferForTest<Level::kWarning> log_buffer;
        CHECK(absl::StrContains(log_buffer.content(), "WARN"));
        CHECK_FALSE(absl::StrContains(log_buffer.content(), " WARN"));
    }

    SECTION("key value arguments") {
        LogBufferForTest<Level::kInfo> log_buffer{"aligned", {"rows", "42", "state", "kInSync"}};
        CHECK(absl::StrContains(log_buffer.content(), "aligned"));
        CHECK(absl::StrContains(log_buffer.content(), prettified_key_value("rows", "42")));
        CHECK(absl::StrContains(log_buffer.content(), prettified_key_value("state", "kInSync")));

        LogBufferForTest<Level::kInfo> accumulated;
        accumulated << "aligned" << Args{"rows", "42"};
        CHECK(absl::StrContains(accumulated.content(), prettified_key_value("rows", "42")));
    }

    SECTION("flush strips colors off non-terminal output") {
        string_cerr.str("");
        init(Settings{.log_nocolor = true, .log_verbosity = Level::kInfo});
        { LogBufferForTest<Level::kInfo>{"flushed", {"key", "value"}}; }
        const auto output{string_cerr.str()};
        CHECK(absl::StrContains(output, "flushed"));
        CHECK(absl::StrContains(output, "key=value"));
        CHECK_FALSE(absl::StrContains(output, kColorGreen));
    }

    SECTION("tee file") {
        const auto path{std::filesystem::temp_directory_path() / "witgen_log_test.log"};
        std::filesystem::remove(path);
        init(Settings{.log_verbosity = Level::kInfo, .log_file = path.string()});
        { LogBufferForTest<Level::kInfo>{"to file", {}}; }
        std::ifstream in{path};
        const std::string written{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        CHECK(absl::StrContains(written, "to file"));
        init(Settings{.log_verbosity = Level::kInfo});
    }

    SECTION("macros skip disabled levels") {
        string_cerr.str("");
        WITGEN_TRACE << "hidden trace";
        WITGEN_INFO << "visible info";
        CHECK_FALSE(absl::StrContains(string_cerr.str(), "hidden trace"));
        CHECK(absl::StrContains(string_cerr.str(), "visible info"));
    }
}

TEST_CASE("Log file that cannot be opened", "[infra][log]") {
    const auto missing_dir{std::filesystem::temp_directory_path() / "witgen_no_such_dir"};
    std::filesystem::remove_all(missing_dir);
    CHECK_THROWS_AS(init(Settings{.log_file = (missing_dir / "witgen.log").string()}), std::runtime_error);
    CHECK_NOTHROW(init(Settings{}));
}

}  // namespace witgen::log
