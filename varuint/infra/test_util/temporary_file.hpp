// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <varuint/core/common/random_number.hpp>

namespace varuint::test_util {

//! Empty file with a unique name in the OS temporary directory, removed on scope exit
class TemporaryFile {
  public:
    TemporaryFile() : path_{unique_path()} { std::ofstream{path_}; }
    ~TemporaryFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    std::string read() const {
        std::ifstream in{path_};
        std::stringstream content;
        content << in.rdbuf();
        return content.str();
    }

  private:
    static std::filesystem::path unique_path() {
        RandomNumber random_number;
        return std::filesystem::temp_directory_path() / ("varuint_" + std::to_string(random_number.generate_one()));
    }

    std::filesystem::path path_;
};

}  // namespace varuint::test_util
