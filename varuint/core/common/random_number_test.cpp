// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "random_number.hpp"

#include <catch2/catch_test_macros.hpp>

namespace varuint {

TEST_CASE("random numbers") {
    uint64_t a = 0;
    uint64_t b = 3;
    RandomNumber random_number(a, b);

    for (int i = 0; i < 100; ++i) {
        auto a_number = random_number.generate_one();
        REQUIRE((a <= a_number && a_number <= b));
    }
}

TEST_CASE("seeded random numbers repeat") {
    RandomNumber first(0, std::numeric_limits<uint64_t>::max(), 42);
    RandomNumber second(0, std::numeric_limits<uint64_t>::max(), 42);

    for (int i = 0; i < 10; ++i) {
        CHECK(first.generate_one() == second.generate_one());
    }
}

}  // namespace varuint
