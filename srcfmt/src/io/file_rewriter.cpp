//! # Atomic File Rewriter
//!
//! Implements `FileRewriter::rewrite()`. On POSIX the temporary file is
//! created exclusively with `open(O_EXCL)` and fsync'ed before the rename;
//! on Windows it goes through `std::ofstream` and `std::filesystem::rename`,
//! which replaces the destination with MoveFileEx.

#include "io/file_rewriter.hpp"

#include "io/file_io.hpp"
#include "log/log.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <fstream>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace srcfmt::io {

/// Bytes of the original name kept in a temporary name; with the
/// ".", ".srcfmt-<16 hex>.tmp" affixes it stays under 255 bytes.
constexpr size_t TEMP_NAME_KEEP = 64;

fs::path make_temp_path(const fs::path& path) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::string base = path.filename().string();
    if (base.size() > TEMP_NAME_KEEP) {
        base.resize(TEMP_NAME_KEEP);
    }
    std::ostringstream name;
    name << "." << base << ".srcfmt-" << std::hex << std::setw(16) << std::setfill('0') << rng()
         << ".tmp";
    return path.parent_path() / name.str();
}

static void discard_temp(const fs::path& temp) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        SRCFMT_LOG_WARN("rewrite", "Could not remove temporary file " << temp << ": "
                                                                       << ec.message());
    }
}

Result<bool, IoError> create_new_file(const fs::path& path, std::string_view bytes) {
#ifdef _WIN32
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return IoError{path.string(), "file already exists"};
    }
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        return IoError{path.string(), "cannot create file"};
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        out.close();
        discard_temp(path);
        return IoError{path.string(), "write failed"};
    }
    return true;
#else
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return IoError{path.string(), std::string("cannot create file: ") + std::strerror(errno)};
    }

    auto fail = [&](const char* what) -> IoError {
        std::string msg = std::string(what) + ": " + std::strerror(errno);
        ::close(fd);
        discard_temp(path);
        return IoError{path.string(), msg};
    };

    const char* data = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return fail("write failed");
        }
        data += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        return fail("fsync failed");
    }
    if (::close(fd) != 0) {
        std::string msg = std::string("close failed: ") + std::strerror(errno);
        discard_temp(path);
        return IoError{path.string(), msg};
    }
    return true;
#endif
}

Result<bool, IoError> FileRewriter::rewrite(const fs::path& path, std::string_view new_bytes) const {
    auto current = read_file_bytes(path);
    if (is_err(current)) {
        return unwrap_err(current);
    }
    if (unwrap(current) == new_bytes) {
        SRCFMT_LOG_TRACE("rewrite", "Unchanged " << path);
        return false;
    }

    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (ec) {
        return IoError{path.string(), "cannot stat: " + ec.message()};
    }

    fs::path temp = make_temp_path(path);
    auto written = create_new_file(temp, new_bytes);
    if (is_err(written)) {
        return unwrap_err(written);
    }

    fs::permissions(temp, perms, fs::perm_options::replace, ec);
    if (ec) {
        discard_temp(temp);
        return IoError{temp.string(), "cannot copy permissions: " + ec.message()};
    }

    if (before_commit_ && !before_commit_(path, temp)) {
        discard_temp(temp);
        return IoError{path.string(), "replace abandoned before commit"};
    }

    fs::rename(temp, path, ec);
    if (ec) {
        discard_temp(temp);
        return IoError{path.string(), "cannot replace file: " + ec.message()};
    }

    SRCFMT_LOG_TRACE("rewrite", "Replaced " << path << " (" << new_bytes.size() << " bytes)");
    return true;
}

} // namespace srcfmt::io
