// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace varuint {

// Error codes for varint decoding
enum class [[nodiscard]] DecodingError {
    kInputTooShort,        // input ended before the length announced by the header byte
    kInputTooLong,         // trailing bytes left while Leftover::kProhibit
    kUnsupportedEncoding,  // reserved header byte 0xFF (future 128-bit class)
    kOverflow,             // value does not fit the requested integer type
    kIoFailure,            // the byte source failed
};

// TODO(C++23) Switch to std::expected
using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace varuint
