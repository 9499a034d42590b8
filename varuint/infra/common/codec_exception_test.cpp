// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "codec_exception.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <varuint/core/codec/decode.hpp>
#include <varuint/core/common/util.hpp>

namespace varuint {

TEST_CASE("DecodingException") {
    const DecodingException ex{DecodingError::kUnsupportedEncoding};
    CHECK(ex.err() == DecodingError::kUnsupportedEncoding);
    CHECK(std::string{ex.what()} == "Decoding error : kUnsupportedEncoding");

    const DecodingException custom{DecodingError::kInputTooShort, "truncated"};
    CHECK(custom.err() == DecodingError::kInputTooShort);
    CHECK(std::string{custom.what()} == "truncated");
}

TEST_CASE("EncodingException") {
    const EncodingException ex{EncodingError::kIoFailure};
    CHECK(ex.err() == EncodingError::kIoFailure);
    CHECK(std::string{ex.what()} == "Encoding error : kIoFailure");
}

TEST_CASE("success_or_throw") {
    SECTION("decode") {
        const Bytes encoded{*from_hex("ff")};
        ByteView view{encoded};
        uint64_t value{0};
        CHECK_THROWS_AS(success_or_throw(codec::decode(view, value)), DecodingException);

        const Bytes valid{*from_hex("f13c")};
        view = valid;
        CHECK_NOTHROW(success_or_throw(codec::decode(view, value)));
        CHECK(value == 300);
    }

    SECTION("encode") {
        const EncodingResult failure{tl::unexpected{EncodingError::kIoFailure}};
        CHECK_THROWS_AS(success_or_throw(failure), EncodingException);
        CHECK_NOTHROW(success_or_throw(EncodingResult{}));
    }
}

TEST_CASE("unwrap_or_throw") {
    const tl::expected<uint64_t, DecodingError> ok{2032};
    CHECK(unwrap_or_throw(ok) == 2032);

    const tl::expected<uint64_t, DecodingError> ko{tl::unexpected{DecodingError::kOverflow}};
    CHECK_THROWS_AS(unwrap_or_throw(ko), DecodingException);

    const tl::expected<size_t, EncodingError> written{tl::unexpected{EncodingError::kIoFailure}};
    CHECK_THROWS_AS(unwrap_or_throw(written, "sink closed"), EncodingException);
}

}  // namespace varuint
