// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

// Varuint encoding and decoding over byte stream ports.
// The wire format is the same as the one produced by encode.hpp.

#pragma once

#include <limits>
#include <type_traits>

#include <tl/expected.hpp>

#include <varuint/core/common/base.hpp>
#include <varuint/core/common/decoding_result.hpp>
#include <varuint/core/common/encoding_result.hpp>
#include <varuint/core/codec/ports.hpp>
#include <varuint/core/codec/zigzag.hpp>

namespace varuint::codec {

//! \brief Writes the Encoded Form of n with a single sink write
//! \return the number of bytes written, i.e. length(n)
tl::expected<size_t, EncodingError> encode(ByteSink& sink, uint64_t n);

tl::expected<size_t, EncodingError> encode_signed(ByteSink& sink, int64_t n);

template <NarrowUnsigned T>
tl::expected<size_t, EncodingError> encode(ByteSink& sink, T n) {
    return encode(sink, static_cast<uint64_t>(n));
}

template <NarrowSigned T>
tl::expected<size_t, EncodingError> encode_signed(ByteSink& sink, T n) {
    return encode_signed(sink, static_cast<int64_t>(n));
}

//! \brief Reads exactly one Encoded Form from the source
//! \details End of data anywhere inside the Encoded Form, the header byte included, yields kInputTooShort;
//! a failing source yields kIoFailure and a 0xFF header kUnsupportedEncoding, in which case nothing past
//! the header byte has been read.
tl::expected<uint64_t, DecodingError> decode(ByteSource& source);

tl::expected<int64_t, DecodingError> decode_signed(ByteSource& source);

//! \brief Reads one value into a narrower unsigned type, e.g. decode<uint16_t>(source)
template <NarrowUnsigned T>
tl::expected<T, DecodingError> decode(ByteSource& source) {
    const auto wide{decode(source)};
    if (!wide) {
        return tl::unexpected{wide.error()};
    }
    if (*wide > std::numeric_limits<T>::max()) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    return static_cast<T>(*wide);
}

template <NarrowSigned T>
tl::expected<T, DecodingError> decode_signed(ByteSource& source) {
    using U = std::make_unsigned_t<T>;
    const auto wide{decode(source)};
    if (!wide) {
        return tl::unexpected{wide.error()};
    }
    if (*wide > std::numeric_limits<U>::max()) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    return static_cast<T>(zigzag_decode(static_cast<U>(*wide)));
}

}  // namespace varuint::codec
