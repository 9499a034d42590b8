// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

// Packed sequences of varuints.
// Encoded Forms are self-delimiting, so items are simply concatenated: there is no list header.

#pragma once

#include <numeric>
#include <span>
#include <vector>

#include <varuint/core/common/base.hpp>
#include <varuint/core/common/bytes.hpp>
#include <varuint/core/common/decoding_result.hpp>
#include <varuint/core/codec/decode.hpp>
#include <varuint/core/codec/encode.hpp>

namespace varuint::codec {

// Single item overloads dispatching on signedness

template <UnsignedIntegral T>
constexpr size_t item_length(T x) noexcept {
    return length(x);
}

template <SignedIntegral T>
constexpr size_t item_length(T x) noexcept {
    return length_signed(x);
}

template <UnsignedIntegral T>
void encode_item(Bytes& to, T x) {
    encode(to, x);
}

template <SignedIntegral T>
void encode_item(Bytes& to, T x) {
    encode_signed(to, x);
}

template <UnsignedIntegral T>
DecodingResult decode_item(ByteView& from, T& x) noexcept {
    return decode(from, x, Leftover::kAllow);
}

template <SignedIntegral T>
DecodingResult decode_item(ByteView& from, T& x) noexcept {
    return decode_signed(from, x, Leftover::kAllow);
}

// std::span overloads

template <Integral T>
size_t length(std::span<const T> v) noexcept {
    return std::accumulate(v.begin(), v.end(), size_t{0}, [](size_t sum, T x) { return sum + item_length(x); });
}

template <Integral T>
void encode(Bytes& to, std::span<const T> v) {
    to.reserve(to.size() + length(v));
    for (const T x : v) {
        encode_item(to, x);
    }
}

// std::vector overloads

template <Integral T>
size_t length(const std::vector<T>& v) noexcept {
    return length(std::span<const T>{v.data(), v.size()});
}

template <Integral T>
void encode(Bytes& to, const std::vector<T>& v) {
    encode(to, std::span<const T>{v.data(), v.size()});
}

//! \brief Decodes items until `from` is exhausted
//! \remarks On failure `to` holds the items decoded so far and `from` starts at the offending item
template <Integral T>
DecodingResult decode(ByteView& from, std::vector<T>& to) {
    to.clear();
    while (!from.empty()) {
        T x{};
        if (DecodingResult res{decode_item(from, x)}; !res) {
            return res;
        }
        to.push_back(x);
    }
    return {};
}

// variadic overloads, leftovers are left in `from`

template <Integral Arg1>
DecodingResult decode_items(ByteView& from, Arg1& arg1) noexcept {
    return decode_item(from, arg1);
}

template <Integral Arg1, Integral Arg2, Integral... Args>
DecodingResult decode_items(ByteView& from, Arg1& arg1, Arg2& arg2, Args&... args) noexcept {
    if (DecodingResult res{decode_item(from, arg1)}; !res) {
        return res;
    }
    return decode_items(from, arg2, args...);
}

template <Integral Arg1>
void encode_items(Bytes& to, Arg1 arg1) {
    encode_item(to, arg1);
}

template <Integral Arg1, Integral Arg2, Integral... Args>
void encode_items(Bytes& to, Arg1 arg1, Arg2 arg2, Args... args) {
    encode_item(to, arg1);
    encode_items(to, arg2, args...);
}

}  // namespace varuint::codec
