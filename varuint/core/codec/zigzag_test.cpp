// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "zigzag.hpp"

#include <set>

#include <catch2/catch_test_macros.hpp>

#include <varuint/core/common/random_number.hpp>

namespace varuint::codec {

TEST_CASE("ZigZag mapping") {
    CHECK(zigzag_encode(int64_t{0}) == 0u);
    CHECK(zigzag_encode(int64_t{-1}) == 1u);
    CHECK(zigzag_encode(int64_t{1}) == 2u);
    CHECK(zigzag_encode(int64_t{-2}) == 3u);
    CHECK(zigzag_encode(int64_t{2}) == 4u);
    CHECK(zigzag_encode(std::numeric_limits<int64_t>::max()) == std::numeric_limits<uint64_t>::max() - 1);
    CHECK(zigzag_encode(std::numeric_limits<int64_t>::min()) == std::numeric_limits<uint64_t>::max());

    CHECK(zigzag_decode(uint64_t{0}) == 0);
    CHECK(zigzag_decode(uint64_t{1}) == -1);
    CHECK(zigzag_decode(uint64_t{2}) == 1);
    CHECK(zigzag_decode(uint64_t{3}) == -2);
    CHECK(zigzag_decode(std::numeric_limits<uint64_t>::max() - 1) == std::numeric_limits<int64_t>::max());
}

TEST_CASE("ZigZag round trip") {
    SECTION("extremes") {
        for (const int64_t n : {int64_t{0}, int64_t{-1}, int64_t{1}, std::numeric_limits<int64_t>::min(),
                                std::numeric_limits<int64_t>::max()}) {
            CHECK(zigzag_decode(zigzag_encode(n)) == n);
        }
    }

    SECTION("random sample is injective") {
        RandomNumber random_number(0, std::numeric_limits<uint64_t>::max(), 0x5eed);
        std::set<int64_t> inputs;
        std::set<uint64_t> outputs;
        for (int i = 0; i < 1000; ++i) {
            const auto n{static_cast<int64_t>(random_number.generate_one())};
            inputs.insert(n);
            outputs.insert(zigzag_encode(n));
            CHECK(zigzag_decode(zigzag_encode(n)) == n);
        }
        CHECK(inputs.size() == outputs.size());
    }

    SECTION("every 8-bit value") {
        for (int i{std::numeric_limits<int8_t>::min()}; i <= std::numeric_limits<int8_t>::max(); ++i) {
            const auto n{static_cast<int8_t>(i)};
            CHECK(zigzag_decode(zigzag_encode(n)) == n);
            CHECK(zigzag_encode(n) == zigzag_encode(int64_t{n}));
        }
    }

    SECTION("narrow widths agree with 64 bits") {
        CHECK(zigzag_encode(std::numeric_limits<int32_t>::min()) == 0xffffffffu);
        CHECK(zigzag_encode(std::numeric_limits<int32_t>::max()) == 0xfffffffeu);
        CHECK(zigzag_encode(int64_t{std::numeric_limits<int32_t>::min()}) == 0xffffffffu);
        CHECK(zigzag_decode(uint16_t{0xffff}) == std::numeric_limits<int16_t>::min());
    }
}

}  // namespace varuint::codec
