// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <varuint/core/common/assert.hpp>
#include <varuint/core/common/endian.hpp>

namespace varuint::codec {

tl::expected<size_t, DecodingError> decode_header(ByteView from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const std::optional<size_t> len{length_of_header(from[0])};
    if (!len) {
        return tl::unexpected{DecodingError::kUnsupportedEncoding};
    }
    return *len;
}

uint64_t load_value(ByteView encoded) noexcept {
    VARUINT_ASSERT(!encoded.empty() && length_of_header(encoded[0]) == encoded.size());
    const uint8_t header{encoded[0]};
    switch (encoded.size()) {
        case 1:
            return header;
        case 2:
            return kTwoByteOffset + 256 * static_cast<uint64_t>(header - kTwoByteFirstHeader) + encoded[1];
        case 3:
            return kThreeByteOffset + endian::load_big_u16(&encoded[1]);
        default:
            return endian::load_big_trailing(encoded.substr(1));
    }
}

DecodingResult decode(ByteView& from, uint64_t& to, Leftover mode) noexcept {
    const auto len{decode_header(from)};
    if (!len) {
        return tl::unexpected{len.error()};
    }
    if (from.size() < *len) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    if (mode != Leftover::kAllow && from.size() > *len) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    to = load_value(from.substr(0, *len));
    from.remove_prefix(*len);
    return {};
}

DecodingResult decode_signed(ByteView& from, int64_t& to, Leftover mode) noexcept {
    uint64_t zigzag{0};
    if (DecodingResult res{decode(from, zigzag, mode)}; !res) {
        return res;
    }
    to = zigzag_decode(zigzag);
    return {};
}

}  // namespace varuint::codec
