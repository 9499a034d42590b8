// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <ostream>
#include <sstream>
#include <string>

#include <varuint/infra/common/log.hpp>

namespace varuint::test_util {

//! Restores the log verbosity on scope exit, so that tests can run in any order
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level new_level) : saved_level_{log::get_verbosity()} {
        log::set_verbosity(new_level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(saved_level_); }

  private:
    log::Level saved_level_;
};

//! Redirects `target` into the buffer of `replacement` until scope exit
class StreamSwap {
  public:
    StreamSwap(std::ostream& target, std::ostream& replacement) : target_{target}, saved_{target.rdbuf()} {
        target.rdbuf(replacement.rdbuf());
    }
    ~StreamSwap() { target_.rdbuf(saved_); }

  private:
    std::ostream& target_;
    std::streambuf* saved_;
};

//! Collects uncolored log lines printed on std::cerr at the given verbosity
//! \remarks The log settings in force before are restored on scope exit
class LogCapture {
  public:
    explicit LogCapture(log::Level level) {
        log::init(log::Settings{.log_nocolor = true, .log_verbosity = level});
    }
    ~LogCapture() { log::init(saved_settings_); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string str() const { return captured_.str(); }

  private:
    log::Settings saved_settings_{log::get_settings()};
    std::stringstream captured_;
    StreamSwap cerr_swap_{std::cerr, captured_};
};

}  // namespace varuint::test_util
