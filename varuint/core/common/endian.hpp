// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <intx/intx.hpp>

#include <varuint/core/common/base.hpp>
#include <varuint/core/common/bytes.hpp>

namespace varuint::endian {

// Fixed width big endian loads and stores on unaligned buffers, like boost::endian::load_big_u16 and friends.
// The 3 byte class payload is a u16, wider payloads go through a u64.
// NOLINTBEGIN(readability-identifier-naming)
const auto load_big_u16 = intx::be::unsafe::load<uint16_t>;
const auto store_big_u16 = intx::be::unsafe::store<uint16_t>;
const auto load_big_u64 = intx::be::unsafe::load<uint64_t>;
const auto store_big_u64 = intx::be::unsafe::store<uint64_t>;
// NOLINTEND(readability-identifier-naming)

//! \brief Stores the `size` least significant bytes of value in big endian order
//! \param [out] out : destination, must hold at least `size` bytes
//! \param [in] value : the value to be stored
//! \param [in] size : number of low order bytes to keep, in [0, 8]
//! \remarks Unlike a "compact" form, leading zero bytes are kept: the width is fixed by the caller
void store_big_trailing(uint8_t* out, uint64_t value, size_t size) noexcept;

//! \brief Parses an unsigned integer from a fixed width big endian byte form
//! \param [in] data : at most 8 bytes, most significant first
//! \return The value with native endianness; 0 for an empty view
uint64_t load_big_trailing(ByteView data) noexcept;

}  // namespace varuint::endian
