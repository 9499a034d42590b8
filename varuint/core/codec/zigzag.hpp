// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

// ZigZag mapping of signed integers onto unsigned ones as per
// https://protobuf.dev/programming-guides/encoding/#signed-ints
// 0 -> 0, -1 -> 1, 1 -> 2, -2 -> 3, 2 -> 4, ...

#pragma once

#include <cstdint>
#include <limits>
#include <type_traits>

#include <varuint/core/common/base.hpp>

namespace varuint::codec {

template <SignedIntegral T>
constexpr std::make_unsigned_t<T> zigzag_encode(T n) noexcept {
    using U = std::make_unsigned_t<T>;
    // n >> digits is an arithmetic shift: all ones for negative n, zero otherwise
    return static_cast<U>(static_cast<U>(static_cast<U>(n) << 1) ^ static_cast<U>(n >> std::numeric_limits<T>::digits));
}

template <UnsignedIntegral U>
constexpr std::make_signed_t<U> zigzag_decode(U v) noexcept {
    using T = std::make_signed_t<U>;
    return static_cast<T>(static_cast<U>(v >> 1) ^ static_cast<U>(U{0} - (v & 1u)));
}

static_assert(zigzag_encode(int64_t{0}) == 0);
static_assert(zigzag_encode(int64_t{-1}) == 1);
static_assert(zigzag_encode(int64_t{1}) == 2);
static_assert(zigzag_encode(std::numeric_limits<int64_t>::min()) == std::numeric_limits<uint64_t>::max());
static_assert(zigzag_decode(std::numeric_limits<uint64_t>::max()) == std::numeric_limits<int64_t>::min());

}  // namespace varuint::codec
