//! # Atomic File Rewriter
//!
//! Persists pipeline output back to disk only when it differs from what is
//! currently there, using a write-to-temporary-then-rename discipline.
//!
//! ## Replace Protocol
//!
//! ```text
//! rewrite(path, bytes)
//!   ├─ read current bytes ── identical? → return false (no write)
//!   ├─ create .<name>.srcfmt-<random>.tmp in the same directory
//!   ├─ write bytes, flush to storage, copy permission bits
//!   ├─ before-commit hook (may abandon the replace)
//!   └─ rename temp over original → return true
//! ```
//!
//! Until the rename the original file is untouched, so an interruption at
//! any earlier point leaves it intact. Any failure removes the temporary
//! this process created.

#ifndef SRCFMT_IO_FILE_REWRITER_HPP
#define SRCFMT_IO_FILE_REWRITER_HPP

#include "common.hpp"

#include <filesystem>
#include <functional>
#include <string_view>

namespace fs = std::filesystem;

namespace srcfmt::io {

class FileRewriter {
public:
    /// Runs after the temporary file is complete, before it replaces the
    /// original. Returning false abandons the replace.
    using CommitHook = std::function<bool(const fs::path& original, const fs::path& temp)>;

    FileRewriter() = default;
    explicit FileRewriter(CommitHook before_commit) : before_commit_(std::move(before_commit)) {}

    /// Replaces `path` with `new_bytes` if they differ from the file's
    /// current content. Returns whether the file was replaced.
    Result<bool, IoError> rewrite(const fs::path& path, std::string_view new_bytes) const;

private:
    CommitHook before_commit_;
};

/// Returns the temporary-file name used next to `path` (random suffix).
/// Long file names are shortened so the result stays a valid name.
fs::path make_temp_path(const fs::path& path);

/// Creates `path` holding `bytes` and flushes it to storage. Fails without
/// touching anything when `path` already exists; a file created here is
/// removed again if writing it fails.
Result<bool, IoError> create_new_file(const fs::path& path, std::string_view bytes);

} // namespace srcfmt::io

#endif // SRCFMT_IO_FILE_REWRITER_HPP
