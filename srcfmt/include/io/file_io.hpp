//! # File I/O Helpers
//!
//! Byte-exact file reads. Files are always opened in binary mode so that
//! line endings and encodings reach the pipeline untouched.

#ifndef SRCFMT_IO_FILE_IO_HPP
#define SRCFMT_IO_FILE_IO_HPP

#include "common.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace srcfmt::io {

/// Reads the whole file as raw bytes.
Result<std::string, IoError> read_file_bytes(const fs::path& path);

} // namespace srcfmt::io

#endif // SRCFMT_IO_FILE_IO_HPP
