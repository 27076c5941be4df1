// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <witgen/infra/common/terminal.hpp>

namespace witgen::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread ids in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and in tests
void set_verbosity(Level level);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
//! \remarks Lets callers skip building expensive log lines
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error when the file cannot be opened
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append("", args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(32) << std::setfill(' ') << msg;
        bool key{true};
        for (const auto& arg : args) {
            ss_ << (key ? kColorGreen : kColorWhite) << arg << kColorReset << (key ? "=" : " ");
            key = !key;
        }
    }
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace witgen::log

#define WITGEN_LOGBUFFER(level_, ...)           \
    if (!witgen::log::test_verbosity(level_)) { \
    } else                                      \
        witgen::log::LogBuffer<level_>(__VA_ARGS__)

#define WITGEN_TRACE_M(...) WITGEN_LOGBUFFER(witgen::log::Level::kTrace, __VA_ARGS__)
#define WITGEN_DEBUG_M(...) WITGEN_LOGBUFFER(witgen::log::Level::kDebug, __VA_ARGS__)
#define WITGEN_INFO_M(...) WITGEN_LOGBUFFER(witgen::log::Level::kInfo, __VA_ARGS__)
#define WITGEN_WARN_M(...) WITGEN_LOGBUFFER(witgen::log::Level::kWarning, __VA_ARGS__)
#define WITGEN_ERROR_M(...) WITGEN_LOGBUFFER(witgen::log::Level::kError, __VA_ARGS__)
#define WITGEN_CRIT_M(...) WITGEN_LOGBUFFER(witgen::log::Level::kCritical, __VA_ARGS__)
#define WITGEN_LOG_M(...) WITGEN_LOGBUFFER(witgen::log::Level::kNone, __VA_ARGS__)

#define WITGEN_TRACE WITGEN_TRACE_M()
#define WITGEN_DEBUG WITGEN_DEBUG_M()
#define WITGEN_INFO WITGEN_INFO_M()
#define WITGEN_WARN WITGEN_WARN_M()
#define WITGEN_ERROR WITGEN_ERROR_M()
#define WITGEN_CRIT WITGEN_CRIT_M()
#define WITGEN_LOG WITGEN_LOG_M()
