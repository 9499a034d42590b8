// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "stream_ports.hpp"

#include <varuint/infra/common/log.hpp>

namespace varuint {

EncodingResult OStreamSink::write(ByteView data) {
    os_.write(byte_ptr_cast(data.data()), static_cast<std::streamsize>(data.size()));
    if (!os_) {
        VARUINT_DEBUG << "OStreamSink::write failed bytes: " << log::hex(data);
        return tl::unexpected{EncodingError::kIoFailure};
    }
    return {};
}

tl::expected<uint8_t, codec::StreamError> IStreamSource::read() {
    const auto c{is_.get()};
    if (c == std::istream::traits_type::eof()) {
        if (is_.bad()) {
            VARUINT_DEBUG << "IStreamSource::read stream is bad";
            return tl::unexpected{codec::StreamError::kIoFailure};
        }
        if (is_.eof()) {
            return tl::unexpected{codec::StreamError::kEndOfData};
        }
        VARUINT_DEBUG << "IStreamSource::read stream failed";
        return tl::unexpected{codec::StreamError::kIoFailure};
    }
    return static_cast<uint8_t>(c);
}

}  // namespace varuint
