// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "stream.hpp"

#include <varuint/core/codec/decode.hpp>
#include <varuint/core/codec/encode.hpp>

namespace varuint::codec {

static DecodingError to_decoding_error(StreamError err) {
    switch (err) {
        case StreamError::kEndOfData:
            return DecodingError::kInputTooShort;
        case StreamError::kIoFailure:
            return DecodingError::kIoFailure;
    }
    return DecodingError::kIoFailure;
}

tl::expected<size_t, EncodingError> encode(ByteSink& sink, uint64_t n) {
    uint8_t buf[kMaxEncodedLength];
    const size_t len{encode(ByteSpan<kMaxEncodedLength>{buf}, n)};
    if (EncodingResult res{sink.write(ByteView{buf, len})}; !res) {
        return tl::unexpected{res.error()};
    }
    return len;
}

tl::expected<size_t, EncodingError> encode_signed(ByteSink& sink, int64_t n) {
    return encode(sink, zigzag_encode(n));
}

tl::expected<uint64_t, DecodingError> decode(ByteSource& source) {
    uint8_t buf[kMaxEncodedLength];

    const auto header{source.read()};
    if (!header) {
        return tl::unexpected{to_decoding_error(header.error())};
    }
    buf[0] = *header;

    const std::optional<size_t> len{length_of_header(buf[0])};
    if (!len) {
        return tl::unexpected{DecodingError::kUnsupportedEncoding};
    }
    for (size_t i{1}; i < *len; ++i) {
        const auto b{source.read()};
        if (!b) {
            return tl::unexpected{to_decoding_error(b.error())};
        }
        buf[i] = *b;
    }
    return load_value(ByteView{buf, *len});
}

tl::expected<int64_t, DecodingError> decode_signed(ByteSource& source) {
    const auto zigzag{decode(source)};
    if (!zigzag) {
        return tl::unexpected{zigzag.error()};
    }
    return zigzag_decode(*zigzag);
}

}  // namespace varuint::codec
