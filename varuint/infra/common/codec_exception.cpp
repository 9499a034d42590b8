// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "codec_exception.hpp"

#include <magic_enum.hpp>

namespace varuint {

DecodingException::DecodingException(DecodingError err, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Decoding error : " + std::string{magic_enum::enum_name(err)}
                          : message},
      err_{err} {}

EncodingException::EncodingException(EncodingError err, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Encoding error : " + std::string{magic_enum::enum_name(err)}
                          : message},
      err_{err} {}

}  // namespace varuint
