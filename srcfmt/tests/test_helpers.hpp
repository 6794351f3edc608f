//! # Shared Test Helpers
//!
//! Scratch directories and fake collaborators standing in for the external
//! formatting engine.

#pragma once

#include "common.hpp"
#include "format/engine.hpp"
#include "format/formatter.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <gtest/gtest.h>
#include <random>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace srcfmt::test {

/// Creates a unique directory under the system temp directory.
inline fs::path make_scratch_dir(const std::string& prefix) {
    std::random_device rd;
    std::ostringstream name;
    name << prefix << "_" << std::hex << rd() << rd();
    fs::path dir = fs::temp_directory_path() / name.str();
    fs::create_directories(dir);
    return dir;
}

inline void write_bytes(const fs::path& path, const std::string& bytes) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    out << bytes;
}

inline std::string read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

#ifndef _WIN32
/// Writes an executable script behaving like a parsing formatter binary:
/// `--version` succeeds, input containing "SYNTAX ERROR" exits 1 with a
/// diagnostic on stderr, anything else comes back with tabs as spaces.
inline fs::path write_formatter_script(const fs::path& path) {
    write_bytes(path, "#!/bin/sh\n"
                      "if [ \"$1\" = \"--version\" ]; then\n"
                      "    echo 'formatter-script 1.0'\n"
                      "    exit 0\n"
                      "fi\n"
                      "input=$(mktemp)\n"
                      "cat > \"$input\"\n"
                      "if grep -q 'SYNTAX ERROR' \"$input\"; then\n"
                      "    echo '<stdin>:1:11: error: ; expected' >&2\n"
                      "    rm -f \"$input\"\n"
                      "    exit 1\n"
                      "fi\n"
                      "tr '\\t' ' ' < \"$input\"\n"
                      "rm -f \"$input\"\n");
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    return path;
}
#endif

/// Fixture owning a scratch directory removed after each test.
class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = make_scratch_dir("srcfmt_test");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

/// Formatter applicable to one extension. Applies `transform` to the text,
/// or fails when the text contains `fail_marker`.
class FakeFormatter : public format::FormatterCapability {
public:
    FakeFormatter(std::string name, std::string extension,
                  std::function<std::string(std::string_view)> transform = {})
        : name_(std::move(name)), extension_(std::move(extension)),
          transform_(std::move(transform)) {}

    std::string_view name() const override {
        return name_;
    }

    std::string_view short_description() const override {
        return "fake formatter";
    }

    bool is_applicable(const fs::path& path) const override {
        return path.extension() == extension_;
    }

    Result<std::string, FormatError> format(std::string_view text,
                                            const config::FormatterConfiguration&) const override {
        ++calls;
        if (!fail_marker.empty() && text.find(fail_marker) != std::string_view::npos) {
            return FormatError{name_, "syntax error"};
        }
        if (transform_) {
            return transform_(text);
        }
        return std::string(text);
    }

    std::string fail_marker;
    mutable std::atomic<int> calls{0};

private:
    std::string name_;
    std::string extension_;
    std::function<std::string(std::string_view)> transform_;
};

/// Engine that records the last request and returns a canned answer.
class FakeEngine : public format::FormattingEngine {
public:
    std::string_view name() const override {
        return "fake-engine";
    }

    bool available() const override {
        return true;
    }

    Result<std::string, format::EngineFailure>
    reformat(std::string_view text, const format::EngineRequest& request) const override {
        last_request = request;
        if (!failure.empty()) {
            return format::EngineFailure{failure};
        }
        return "formatted:" + std::string(text);
    }

    std::string failure;
    mutable format::EngineRequest last_request{};
};

} // namespace srcfmt::test
