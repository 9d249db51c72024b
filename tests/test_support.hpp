#pragma once

// Test support helpers.
//
// Tests keep using assert(expr), but the macro is replaced by an always-on
// check so NDEBUG builds still fail fast with a message on stderr.

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <string>
#include <unistd.h>

namespace cmdrun_test {

inline void fail(const char* expr, const char* file, int line) {
    std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
    std::exit(1);
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() /
                (name + "_" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace cmdrun_test

#ifndef CMDRUN_TEST_ASSERT
#define CMDRUN_TEST_ASSERT(expr) \
    (static_cast<bool>(expr) ? (void)0 : ::cmdrun_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) CMDRUN_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) CMDRUN_TEST_ASSERT(expr)
#endif
