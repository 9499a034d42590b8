// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

#include <cstring>

namespace varuint::endian {

void store_big_trailing(uint8_t* out, uint64_t value, size_t size) noexcept {
    VARUINT_ASSERT(size <= sizeof(uint64_t));
    uint8_t full_be[sizeof(uint64_t)];
    store_big_u64(&full_be[0], value);
    std::memcpy(out, &full_be[sizeof(uint64_t) - size], size);
}

uint64_t load_big_trailing(ByteView data) noexcept {
    VARUINT_ASSERT(data.size() <= sizeof(uint64_t));
    if (data.empty()) {
        return 0;
    }
    uint8_t full_be[sizeof(uint64_t)]{};
    std::memcpy(&full_be[sizeof(uint64_t) - data.size()], data.data(), data.size());
    return load_big_u64(&full_be[0]);
}

}  // namespace varuint::endian
