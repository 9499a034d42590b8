// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic concepts.

#include <concepts>
#include <cstddef>
#include <cstdint>

#include <varuint/core/common/assert.hpp>

namespace varuint {

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> && !std::same_as<T, bool>;

template <class T>
concept SignedIntegral = std::signed_integral<T>;

//! Any integer type the codec accepts
template <class T>
concept Integral = UnsignedIntegral<T> || SignedIntegral<T>;

//! Unsigned types narrower than (or aliasing the width of) uint64_t, routed through the 64-bit codec
template <class T>
concept NarrowUnsigned = UnsignedIntegral<T> && sizeof(T) <= sizeof(uint64_t) && !std::same_as<T, uint64_t>;

//! Signed types routed through the 64-bit signed codec
template <class T>
concept NarrowSigned = SignedIntegral<T> && sizeof(T) <= sizeof(int64_t) && !std::same_as<T, int64_t>;

}  // namespace varuint
