// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace varuint {

//! Prints the failed condition with its source location to std::cerr and aborts
[[noreturn]] void on_assertion_failure(const char* condition, const char* file, int line, const char* function);

}  // namespace varuint

// Invariant checks of the codec which must hold in release builds too, hence independent of NDEBUG.
// Input validation never goes through here: malformed input is reported through DecodingError.
#define VARUINT_ASSERT(condition)                                                           \
    do {                                                                                    \
        if (!(condition)) [[unlikely]] {                                                    \
            ::varuint::on_assertion_failure(#condition, __FILE__, __LINE__, __func__);      \
        }                                                                                   \
    } while (false)
