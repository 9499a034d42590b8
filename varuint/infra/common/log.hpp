// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <varuint/core/common/bytes.hpp>

namespace varuint::log {

//! \brief Severity of a log line, from always printed to most verbose
enum class Level {
    kNone,      // Unconditional line, e.g. version banner
    kCritical,  // Unrecoverable failure
    kError,     // Failed operation
    kWarning,   // Unexpected but tolerated condition
    kInfo,      // Regular operation
    kDebug,     // Diagnostics, e.g. port failures
    kTrace      // Per call details
};

//! \brief Logging configuration, applied once by init()
struct Settings {
    bool log_std_out{false};  // std::cout instead of std::cerr
    bool log_utc{true};       // UTC timestamps, otherwise local time
    bool log_timezone{true};  // append the timezone name to timestamps
    bool log_nocolor{false};  // no ANSI colors, also forced for non-TTY output and tee files
    bool log_trim{false};     // 4-letter bracketed level tags
    Level log_verbosity{Level::kNone};
    std::string log_file;     // tee every printed line into this file, appending
    size_t log_hex_max{64};   // hex digits printed by hex() before abridging
};

//! \brief Applies the settings, closing any previous tee file when Settings::log_file is empty
//! \throws std::runtime_error if Settings::log_file cannot be opened
//! \note Not thread safe: call it before logging from multiple threads
void init(const Settings& settings = {});

//! \brief The settings in force, as adjusted by init()
const Settings& get_settings();

Level get_verbosity();
void set_verbosity(Level level);

//! \brief Whether a line at the given level would be printed
bool test_verbosity(Level level);

//! \brief Tees the output into a file
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! \brief Hex digits of a byte string for log lines, abridged to Settings::log_hex_max digits
std::string hex(ByteView bytes);

//! Alternating keys and values printed after the message
using Args = std::vector<std::string>;

//! \brief Accumulates one log line and prints it on destruction
class LineBuffer {
  public:
    explicit LineBuffer(Level level);
    LineBuffer(Level level, std::string_view msg, const Args& args);
    ~LineBuffer() { flush(); }

    LineBuffer(const LineBuffer&) = delete;
    LineBuffer& operator=(const LineBuffer&) = delete;

    template <class T>
    LineBuffer& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    LineBuffer& operator<<(const Args& args) {
        if (should_print_) append_args(args);
        return *this;
    }

  protected:
    void append_args(const Args& args);
    void flush();

    const bool should_print_;
    std::ostringstream ss_;
};

template <Level level>
class LogBuffer : public LineBuffer {
  public:
    LogBuffer() : LineBuffer(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : LineBuffer(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace varuint::log

// The streamed expression is not evaluated at all when the level is filtered out
#define VARUINT_LOGBUFFER(level_, ...)           \
    if (!varuint::log::test_verbosity(level_)) { \
    } else                                       \
        varuint::log::LogBuffer<level_>(__VA_ARGS__)

#define VARUINT_TRACE_M(...) VARUINT_LOGBUFFER(varuint::log::Level::kTrace, __VA_ARGS__)
#define VARUINT_DEBUG_M(...) VARUINT_LOGBUFFER(varuint::log::Level::kDebug, __VA_ARGS__)
#define VARUINT_INFO_M(...) VARUINT_LOGBUFFER(varuint::log::Level::kInfo, __VA_ARGS__)
#define VARUINT_WARN_M(...) VARUINT_LOGBUFFER(varuint::log::Level::kWarning, __VA_ARGS__)
#define VARUINT_ERROR_M(...) VARUINT_LOGBUFFER(varuint::log::Level::kError, __VA_ARGS__)
#define VARUINT_CRIT_M(...) VARUINT_LOGBUFFER(varuint::log::Level::kCritical, __VA_ARGS__)
#define VARUINT_LOG_M(...) VARUINT_LOGBUFFER(varuint::log::Level::kNone, __VA_ARGS__)

#define VARUINT_TRACE VARUINT_TRACE_M()
#define VARUINT_DEBUG VARUINT_DEBUG_M()
#define VARUINT_INFO VARUINT_INFO_M()
#define VARUINT_WARN VARUINT_WARN_M()
#define VARUINT_ERROR VARUINT_ERROR_M()
#define VARUINT_CRIT VARUINT_CRIT_M()
#define VARUINT_LOG VARUINT_LOG_M()
