// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace varuint {

// Error codes for varint encoding
enum class [[nodiscard]] EncodingError {
    kIoFailure,
};

using EncodingResult = tl::expected<void, EncodingError>;

}  // namespace varuint
