// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

#include <varuint/core/common/bytes.hpp>
#include <varuint/core/common/encoding_result.hpp>

namespace varuint::codec {

enum class [[nodiscard]] StreamError {
    kEndOfData,  // orderly end of the underlying data
    kIoFailure,  // the underlying transport is unusable
};

//! \brief Destination of encoded bytes
//! \details Implementations own buffering, cancellation and timeouts; the codec never retries a failed write
class ByteSink {
  public:
    virtual ~ByteSink() = default;

    //! Writes all of `data` or fails with EncodingError::kIoFailure
    virtual EncodingResult write(ByteView data) = 0;
};

//! \brief Origin of encoded bytes, pulled one at a time
class ByteSource {
  public:
    virtual ~ByteSource() = default;

    virtual tl::expected<uint8_t, StreamError> read() = 0;
};

//! Appends to a caller owned Bytes, never fails
class BytesSink : public ByteSink {
  public:
    explicit BytesSink(Bytes& out) : out_{out} {}

    EncodingResult write(ByteView data) override;

  private:
    Bytes& out_;
};

//! Consumes a ByteView front to back, kEndOfData once empty
class ByteViewSource : public ByteSource {
  public:
    explicit ByteViewSource(ByteView data) : data_{data} {}

    tl::expected<uint8_t, StreamError> read() override;

    ByteView remaining() const noexcept { return data_; }

  private:
    ByteView data_;
};

}  // namespace varuint::codec
