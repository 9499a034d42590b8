// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "ports.hpp"

namespace varuint::codec {

EncodingResult BytesSink::write(ByteView data) {
    out_.append(data);
    return {};
}

tl::expected<uint8_t, StreamError> ByteViewSource::read() {
    if (data_.empty()) {
        return tl::unexpected{StreamError::kEndOfData};
    }
    const uint8_t b{data_[0]};
    data_.remove_prefix(1);
    return b;
}

}  // namespace varuint::codec
