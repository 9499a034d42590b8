// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

// Length classes of the varuint wire format.
// Loosely based on https://sqlite.org/src4/doc/trunk/www/varint.wiki
// with the header byte 0xFF set aside for a future 128-bit class.
//
//   header     total  value
//   0..240     1      header
//   241..247   2      240 + 256 * (header - 241) + b1
//   248        3      2032 + 256 * b1 + b2
//   249..254   4..9   b1..bN as a big endian integer of (total - 1) bytes
//   255        -      reserved

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace varuint::codec {

struct LengthClass {
    uint8_t first_header{0};
    uint8_t last_header{0};
    size_t total_length{0};
    uint64_t min_value{0};
    uint64_t max_value{0};
};

inline constexpr size_t kMaxEncodedLength{9};

inline constexpr uint8_t kMaxSingleByteValue{240};
inline constexpr uint8_t kTwoByteFirstHeader{241};
inline constexpr uint8_t kThreeByteHeader{248};
inline constexpr uint8_t kReservedHeader{0xFF};

// Values subtracted before folding into the header/payload of the 2 and 3 byte classes
inline constexpr uint64_t kTwoByteOffset{240};
inline constexpr uint64_t kThreeByteOffset{2032};

inline constexpr std::array<LengthClass, kMaxEncodedLength> kLengthClasses{{
    {0, 240, 1, 0, 240},
    {241, 247, 2, 241, 2'031},
    {248, 248, 3, 2'032, 67'567},
    {249, 249, 4, 67'568, 0xFF'FFFF},
    {250, 250, 5, 0x100'0000, 0xFFFF'FFFF},
    {251, 251, 6, 0x1'0000'0000, 0xFF'FFFF'FFFF},
    {252, 252, 7, 0x100'0000'0000, 0xFFFF'FFFF'FFFF},
    {253, 253, 8, 0x1'0000'0000'0000, 0xFF'FFFF'FFFF'FFFF},
    {254, 254, 9, 0x100'0000'0000'0000, std::numeric_limits<uint64_t>::max()},
}};

//! \brief The unique length class whose value range contains n
constexpr const LengthClass& length_class(uint64_t n) noexcept {
    for (const LengthClass& c : kLengthClasses) {
        if (n <= c.max_value) {
            return c;
        }
    }
    return kLengthClasses.back();  // unreachable, the last class ends at uint64 max
}

//! \brief Total length of the Encoded Form announced by a header byte
//! \return std::nullopt for the reserved header
constexpr std::optional<size_t> length_of_header(uint8_t header) noexcept {
    if (header == kReservedHeader) {
        return std::nullopt;
    }
    for (const LengthClass& c : kLengthClasses) {
        if (header <= c.last_header) {
            return c.total_length;
        }
    }
    return std::nullopt;
}

namespace detail {

    constexpr bool length_classes_partition_domain() noexcept {
        if (kLengthClasses.front().min_value != 0 || kLengthClasses.front().first_header != 0) {
            return false;
        }
        for (size_t i{1}; i < kLengthClasses.size(); ++i) {
            const LengthClass& prev{kLengthClasses[i - 1]};
            const LengthClass& cur{kLengthClasses[i]};
            if (cur.min_value != prev.max_value + 1 || cur.first_header != prev.last_header + 1 ||
                cur.total_length != prev.total_length + 1) {
                return false;
            }
        }
        return kLengthClasses.back().max_value == std::numeric_limits<uint64_t>::max() &&
               kLengthClasses.back().last_header + 1 == kReservedHeader;
    }

}  // namespace detail

static_assert(detail::length_classes_partition_domain());
static_assert(length_class(kTwoByteOffset + 1).first_header == kTwoByteFirstHeader);
static_assert(length_class(kThreeByteOffset).first_header == kThreeByteHeader);

}  // namespace varuint::codec
