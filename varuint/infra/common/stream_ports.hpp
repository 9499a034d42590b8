// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <istream>
#include <ostream>

#include <varuint/core/codec/ports.hpp>

namespace varuint {

//! \brief ByteSink writing into a std::ostream
//! \details A stream left in bad or fail state after the write is reported as EncodingError::kIoFailure
class OStreamSink : public codec::ByteSink {
  public:
    explicit OStreamSink(std::ostream& os) : os_{os} {}

    EncodingResult write(ByteView data) override;

  private:
    std::ostream& os_;
};

//! \brief ByteSource reading from a std::istream one byte at a time
class IStreamSource : public codec::ByteSource {
  public:
    explicit IStreamSource(std::istream& is) : is_{is} {}

    tl::expected<uint8_t, codec::StreamError> read() override;

  private:
    std::istream& is_;
};

}  // namespace varuint
