// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

// Varuint decoding functions.
// The header byte alone tells the length of the whole Encoded Form, so no lookahead is needed.

#pragma once

#include <limits>
#include <type_traits>

#include <varuint/core/common/base.hpp>
#include <varuint/core/common/bytes.hpp>
#include <varuint/core/common/decoding_result.hpp>
#include <varuint/core/codec/length_class.hpp>
#include <varuint/core/codec/zigzag.hpp>

namespace varuint::codec {

// Whether to allow or prohibit trailing characters in an input after decoding.
// If prohibited and the input does contain extra characters, decode() returns DecodingError::kInputTooLong.
enum class Leftover {
    kProhibit,
    kAllow,
};

//! \brief Total length of the Encoded Form starting at the front of `from`; nothing is consumed
//! \return kInputTooShort for an empty input, kUnsupportedEncoding for the reserved header
tl::expected<size_t, DecodingError> decode_header(ByteView from) noexcept;

//! \brief Reconstructs the value of a complete Encoded Form
//! \remarks `encoded` must hold exactly the number of bytes announced by its header byte
uint64_t load_value(ByteView encoded) noexcept;

//! \brief Consumes one Encoded Form from the front of `from`
//! \remarks On failure neither `from` nor `to` are modified
DecodingResult decode(ByteView& from, uint64_t& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode_signed(ByteView& from, int64_t& to, Leftover mode = Leftover::kProhibit) noexcept;

//! \brief Decodes into a narrower unsigned type, kOverflow if the value does not fit
template <NarrowUnsigned T>
DecodingResult decode(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    ByteView view{from};
    uint64_t wide{0};
    if (DecodingResult res{decode(view, wide, mode)}; !res) {
        return res;
    }
    if (wide > std::numeric_limits<T>::max()) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = static_cast<T>(wide);
    from = view;
    return {};
}

//! \brief Decodes into a narrower signed type, kOverflow if the zigzag value does not fit its unsigned counterpart
template <NarrowSigned T>
DecodingResult decode_signed(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    using U = std::make_unsigned_t<T>;
    ByteView view{from};
    uint64_t wide{0};
    if (DecodingResult res{decode(view, wide, mode)}; !res) {
        return res;
    }
    if (wide > std::numeric_limits<U>::max()) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = zigzag_decode(static_cast<U>(wide));
    from = view;
    return {};
}

}  // namespace varuint::codec
