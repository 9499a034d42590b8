// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include <evmc/bytes.hpp>

namespace varuint {

//! Owning byte string, the usual destination of encode()
using Bytes = evmc::bytes;

//! Non-owning byte string, the usual source of decode()
class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;

    // NOLINTBEGIN(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const evmc::bytes_view& other) noexcept : evmc::bytes_view{other} {}
    ByteView(const Bytes& bytes) noexcept : evmc::bytes_view{bytes.data(), bytes.size()} {}
    template <size_t N>
    constexpr ByteView(const uint8_t (&buf)[N]) noexcept : evmc::bytes_view{buf, N} {}
    template <size_t Extent>
    constexpr ByteView(std::span<const uint8_t, Extent> span) noexcept : evmc::bytes_view{span.data(), span.size()} {}
    // NOLINTEND(google-explicit-constructor, hicpp-explicit-conversions)

    constexpr ByteView(const uint8_t* data, size_type size) noexcept : evmc::bytes_view{data, size} {}
};

//! Mutable fixed or dynamic size output window, e.g. ByteSpan<9> for one Encoded Form
template <size_t Extent = std::dynamic_extent>
using ByteSpan = std::span<uint8_t, Extent>;

inline const char* byte_ptr_cast(const uint8_t* ptr) { return reinterpret_cast<const char*>(ptr); }
inline const uint8_t* byte_ptr_cast(const char* ptr) { return reinterpret_cast<const uint8_t*>(ptr); }

inline ByteView string_view_to_byte_view(std::string_view v) { return {byte_ptr_cast(v.data()), v.size()}; }

}  // namespace varuint
