// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

#include <varuint/core/common/endian.hpp>

namespace varuint::codec {

size_t encode(ByteSpan<kMaxEncodedLength> to, uint64_t n) noexcept {
    const LengthClass& lc{length_class(n)};
    switch (lc.total_length) {
        case 1:
            to[0] = static_cast<uint8_t>(n);
            break;
        case 2: {
            const uint64_t folded{n - kTwoByteOffset};
            to[0] = static_cast<uint8_t>(kTwoByteFirstHeader + folded / 256);
            to[1] = static_cast<uint8_t>(folded % 256);
            break;
        }
        case 3:
            to[0] = kThreeByteHeader;
            endian::store_big_u16(&to[1], static_cast<uint16_t>(n - kThreeByteOffset));
            break;
        default:
            VARUINT_ASSERT(lc.total_length <= kMaxEncodedLength);
            to[0] = lc.first_header;
            endian::store_big_trailing(&to[1], n, lc.total_length - 1);
            break;
    }
    return lc.total_length;
}

void encode(Bytes& to, uint64_t n) {
    uint8_t buf[kMaxEncodedLength];
    const size_t len{encode(ByteSpan<kMaxEncodedLength>{buf}, n)};
    to.append(buf, len);
}

void encode_signed(Bytes& to, int64_t n) {
    encode(to, zigzag_encode(n));
}

}  // namespace varuint::codec
