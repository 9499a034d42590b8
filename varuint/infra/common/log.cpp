// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <varuint/core/common/util.hpp>
#include <varuint/infra/common/terminal.hpp>

namespace varuint::log {

namespace {

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    // Indexed by Level
    constexpr std::array<LevelStyle, 7> kLevelStyles{{
        {"     ", kColorReset},
        {" CRIT", kBackgroundRed},
        {"ERROR", kColorRed},
        {" WARN", kColorOrangeHigh},
        {" INFO", kColorGreen},
        {"DEBUG", kBackgroundPurple},
        {"TRACE", kColorCoal},
    }};

    constexpr int kMessageWidth{40};

    struct Output {
        Settings settings;
        bool terminal{false};
        std::unique_ptr<std::ofstream> tee;
        std::mutex mutex;
    };

    Output& output() {
        static Output instance;
        return instance;
    }

    std::string without_colors(const std::string& line) {
        static const std::regex kEscapeSequence{"\x1b\\[[0-9;]+m"};
        return std::regex_replace(line, kEscapeSequence, "");
    }

    std::string timestamp(const Settings& settings) {
        const absl::TimeZone tz{settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
        std::string ts{absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz)};
        if (settings.log_timezone) {
            ts += " " + tz.name();
        }
        return ts;
    }

}  // namespace

void init(const Settings& settings) {
    Output& out{output()};
    out.settings = settings;
    if (!settings.log_file.empty()) {
        tee_file(settings.log_file);
        out.settings.log_nocolor = true;
    } else {
        std::scoped_lock lock{out.mutex};
        out.tee.reset();
    }
    out.terminal = settings.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    if (!out.terminal) {
        out.settings.log_nocolor = true;
    }
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    std::scoped_lock lock{output().mutex};
    output().tee = std::move(file);
}

const Settings& get_settings() { return output().settings; }

Level get_verbosity() { return output().settings.log_verbosity; }

void set_verbosity(Level level) { output().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= output().settings.log_verbosity; }

std::string hex(ByteView bytes) {
    return abridge(to_hex(bytes), output().settings.log_hex_max);
}

LineBuffer::LineBuffer(Level level) : should_print_{test_verbosity(level)} {
    if (!should_print_) return;

    const Settings& settings{output().settings};
    const LevelStyle& style{kLevelStyles[static_cast<size_t>(level)]};
    if (settings.log_trim) {
        ss_ << "[" << style.color << absl::StripAsciiWhitespace(style.tag).substr(0, 4) << kColorReset << "] ";
    } else {
        ss_ << " " << style.color << style.tag << kColorReset << " ";
    }
    ss_ << kColorWhite << "[" << timestamp(settings) << "] " << kColorReset;
}

LineBuffer::LineBuffer(Level level, std::string_view msg, const Args& args) : LineBuffer(level) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(kMessageWidth) << msg;
    append_args(args);
}

void LineBuffer::append_args(const Args& args) {
    for (size_t i{0}; i < args.size(); i += 2) {
        ss_ << " " << kColorGreen << args[i] << kColorReset << "=";
        if (i + 1 < args.size()) {
            ss_ << kColorWhite << args[i + 1] << kColorReset;
        }
    }
}

void LineBuffer::flush() {
    if (!should_print_) return;

    Output& out{output()};
    std::string line{ss_.str()};
    if (out.settings.log_nocolor) {
        line = without_colors(line);
    }

    std::scoped_lock lock{out.mutex};
    (out.settings.log_std_out ? std::cout : std::cerr) << line << '\n';
    if (out.tee) {
        *out.tee << (out.settings.log_nocolor ? line : without_colors(line)) << '\n';
    }
}

}  // namespace varuint::log
