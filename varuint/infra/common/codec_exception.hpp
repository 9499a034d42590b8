// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <varuint/core/common/decoding_result.hpp>
#include <varuint/core/common/encoding_result.hpp>

namespace varuint {

class DecodingException : public std::runtime_error {
  public:
    explicit DecodingException(DecodingError err, const std::string& message = "");

    DecodingError err() const noexcept { return err_; }

  private:
    DecodingError err_;
};

class EncodingException : public std::runtime_error {
  public:
    explicit EncodingException(EncodingError err, const std::string& message = "");

    EncodingError err() const noexcept { return err_; }

  private:
    EncodingError err_;
};

template <class T>
inline void success_or_throw(const tl::expected<T, DecodingError>& res, const std::string& error_message = "") {
    if (!res) {
        throw DecodingException(res.error(), error_message);
    }
}

template <class T>
inline void success_or_throw(const tl::expected<T, EncodingError>& res, const std::string& error_message = "") {
    if (!res) {
        throw EncodingException(res.error(), error_message);
    }
}

template <class T, class E>
inline T unwrap_or_throw(tl::expected<T, E> res, const std::string& error_message = "") {
    success_or_throw(res, error_message);
    return std::move(*res);
}

}  // namespace varuint
