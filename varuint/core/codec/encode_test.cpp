// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

#include <catch2/catch_test_macros.hpp>

#include <varuint/core/common/util.hpp>

namespace varuint::codec {

template <class T>
static std::string encoded(T n) {
    Bytes out;
    encode(out, n);
    return to_hex(out);
}

template <class T>
static std::string encoded_signed(T n) {
    Bytes out;
    encode_signed(out, n);
    return to_hex(out);
}

TEST_CASE("Varuint length") {
    CHECK(length(0u) == 1);
    CHECK(length(240u) == 1);
    CHECK(length(241u) == 2);
    CHECK(length(2031u) == 2);
    CHECK(length(2032u) == 3);
    CHECK(length(67567u) == 3);
    CHECK(length(67568u) == 4);
    CHECK(length(16777215u) == 4);
    CHECK(length(16777216u) == 5);
    CHECK(length(4294967295u) == 5);
    CHECK(length(4294967296ull) == 6);
    CHECK(length(1099511627775ull) == 6);
    CHECK(length(1099511627776ull) == 7);
    CHECK(length(281474976710655ull) == 7);
    CHECK(length(281474976710656ull) == 8);
    CHECK(length(72057594037927935ull) == 8);
    CHECK(length(72057594037927936ull) == 9);
    CHECK(length(std::numeric_limits<uint64_t>::max()) == 9);

    CHECK(length(uint8_t{255}) == 2);
    CHECK(length(uint16_t{65535}) == 3);

    static_assert(length(uint64_t{240}) == 1);
    static_assert(length(uint64_t{241}) == 2);
}

TEST_CASE("Varint length") {
    CHECK(length_signed(0) == 1);
    CHECK(length_signed(-1) == 1);
    CHECK(length_signed(1) == 1);
    CHECK(length_signed(-120) == 1);
    CHECK(length_signed(120) == 1);
    CHECK(length_signed(-121) == 2);
    CHECK(length_signed(-2031 / 2) == 2);
    CHECK(length_signed(2031 / 2) == 2);
    CHECK(length_signed(-67567 / 2) == 3);
    CHECK(length_signed(67567 / 2) == 3);
    CHECK(length_signed(-16777215 / 2) == 4);
    CHECK(length_signed(16777215 / 2) == 4);
    CHECK(length_signed(int64_t{-4294967295} / 2) == 5);
    CHECK(length_signed(int64_t{4294967295} / 2) == 5);
    CHECK(length_signed(int64_t{-1099511627775} / 2) == 6);
    CHECK(length_signed(int64_t{1099511627775} / 2) == 6);
    CHECK(length_signed(int64_t{-281474976710655} / 2) == 7);
    CHECK(length_signed(int64_t{281474976710655} / 2) == 7);
    CHECK(length_signed(int64_t{-72057594037927935} / 2) == 8);
    CHECK(length_signed(int64_t{72057594037927935} / 2) == 8);
    CHECK(length_signed(std::numeric_limits<int64_t>::min()) == 9);
    CHECK(length_signed(std::numeric_limits<int64_t>::max()) == 9);

    CHECK(length_signed(int8_t{-128}) == 2);
    CHECK(length_signed(int16_t{-32768}) == 3);
}

TEST_CASE("Varuint encoding") {
    SECTION("single byte") {
        CHECK(encoded(uint64_t{0}) == "00");
        CHECK(encoded(uint64_t{1}) == "01");
        CHECK(encoded(uint64_t{240}) == "f0");
    }

    SECTION("header folded classes") {
        CHECK(encoded(uint64_t{241}) == "f101");
        CHECK(encoded(uint64_t{500}) == "f204");
        CHECK(encoded(uint64_t{2031}) == "f7ff");
        CHECK(encoded(uint64_t{2032}) == "f80000");
        CHECK(encoded(uint64_t{2033}) == "f80001");
        CHECK(encoded(uint64_t{67567}) == "f8ffff");
    }

    SECTION("raw big endian classes") {
        CHECK(encoded(uint64_t{67568}) == "f90107f0");
        CHECK(encoded(uint64_t{16777215}) == "f9ffffff");
        CHECK(encoded(uint64_t{16777216}) == "fa01000000");
        CHECK(encoded(uint64_t{4294967295}) == "faffffffff");
        CHECK(encoded(uint64_t{4294967296}) == "fb0100000000");
        CHECK(encoded(uint64_t{1099511627775}) == "fbffffffffff");
        CHECK(encoded(uint64_t{1099511627776}) == "fc010000000000");
        CHECK(encoded(uint64_t{281474976710655}) == "fcffffffffffff");
        CHECK(encoded(uint64_t{281474976710656}) == "fd01000000000000");
        CHECK(encoded(uint64_t{72057594037927935}) == "fdffffffffffffff");
        CHECK(encoded(uint64_t{72057594037927936}) == "fe0100000000000000");
        CHECK(encoded(uint64_t{0x0123456789abcdef}) == "fe0123456789abcdef");
        CHECK(encoded(std::numeric_limits<uint64_t>::max()) == "feffffffffffffffff");
    }

    SECTION("narrow types share the wire format") {
        CHECK(encoded(uint8_t{240}) == "f0");
        CHECK(encoded(uint8_t{255}) == "f10f");
        CHECK(encoded(uint16_t{2032}) == "f80000");
        CHECK(encoded(uint16_t{65535}) == "f8f80f");
        CHECK(encoded(uint32_t{4294967295}) == "faffffffff");
    }

    SECTION("appends to existing content") {
        Bytes out{*from_hex("aa")};
        encode(out, uint64_t{241});
        CHECK(to_hex(out) == "aaf101");
    }
}

TEST_CASE("Varuint encoding into a fixed buffer") {
    uint8_t buf[kMaxEncodedLength]{};
    CHECK(encode(buf, uint64_t{7}) == 1);
    CHECK(buf[0] == 7);

    CHECK(encode(buf, uint64_t{2031}) == 2);
    CHECK(to_hex(ByteView{buf, 2}) == "f7ff");

    CHECK(encode(buf, std::numeric_limits<uint64_t>::max()) == kMaxEncodedLength);
    CHECK(to_hex(ByteView{buf}) == "feffffffffffffffff");
}

TEST_CASE("Varint encoding") {
    CHECK(encoded_signed(int64_t{0}) == "00");
    CHECK(encoded_signed(int64_t{-1}) == "01");
    CHECK(encoded_signed(int64_t{1}) == "02");
    CHECK(encoded_signed(int64_t{-2}) == "03");
    CHECK(encoded_signed(int64_t{120}) == "f0");
    CHECK(encoded_signed(int64_t{-121}) == "f101");
    CHECK(encoded_signed(std::numeric_limits<int64_t>::max()) == "fefffffffffffffffe");
    CHECK(encoded_signed(std::numeric_limits<int64_t>::min()) == "feffffffffffffffff");

    SECTION("signed value and its zigzag image encode identically") {
        for (const int64_t n : {int64_t{0}, int64_t{-7}, int64_t{1000}, int64_t{-100000}, int64_t{1} << 40}) {
            CHECK(encoded_signed(n) == encoded(zigzag_encode(n)));
        }
    }

    SECTION("narrow types share the wire format") {
        CHECK(encoded_signed(int8_t{-1}) == "01");
        CHECK(encoded_signed(int8_t{-128}) == "f10f");
        CHECK(encoded_signed(int32_t{-121}) == "f101");
    }
}

}  // namespace varuint::codec
