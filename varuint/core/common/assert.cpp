// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace varuint {

void on_assertion_failure(const char* condition, const char* file, int line, const char* function) {
    std::cerr << "VARUINT_ASSERT(" << condition << ") failed in " << function << " at " << file << ":" << line
              << std::endl;
    std::abort();
}

}  // namespace varuint
