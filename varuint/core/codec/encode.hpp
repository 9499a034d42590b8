// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

// Varuint encoding functions.
// Every value is written in the shortest of the nine length classes, see length_class.hpp.

#pragma once

#include <varuint/core/common/base.hpp>
#include <varuint/core/common/bytes.hpp>
#include <varuint/core/codec/length_class.hpp>
#include <varuint/core/codec/zigzag.hpp>

namespace varuint::codec {

//! \brief Number of bytes encode() produces for n, in [1, 9]
constexpr size_t length(uint64_t n) noexcept {
    return length_class(n).total_length;
}

template <NarrowUnsigned T>
constexpr size_t length(T n) noexcept {
    return length(static_cast<uint64_t>(n));
}

constexpr size_t length_signed(int64_t n) noexcept {
    return length(zigzag_encode(n));
}

template <NarrowSigned T>
constexpr size_t length_signed(T n) noexcept {
    return length_signed(static_cast<int64_t>(n));
}

//! \brief Writes the Encoded Form of n at the beginning of `to`
//! \return the number of bytes written, i.e. length(n)
size_t encode(ByteSpan<kMaxEncodedLength> to, uint64_t n) noexcept;

//! \brief Appends the Encoded Form of n to `to`
void encode(Bytes& to, uint64_t n);

template <NarrowUnsigned T>
void encode(Bytes& to, T n) {
    encode(to, static_cast<uint64_t>(n));
}

//! \brief Appends the Encoded Form of zigzag_encode(n) to `to`
void encode_signed(Bytes& to, int64_t n);

template <NarrowSigned T>
void encode_signed(Bytes& to, T n) {
    encode_signed(to, static_cast<int64_t>(n));
}

}  // namespace varuint::codec
