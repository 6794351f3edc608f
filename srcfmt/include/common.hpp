//! # Common Definitions
//!
//! This module provides the types shared by every srcfmt component: version
//! constants, the `Result` alias and the two error channels used by the
//! formatting run.
//!
//! ## Error Channels
//!
//! | Type         | Scope      | Effect                                       |
//! |--------------|------------|----------------------------------------------|
//! | `FatalError` | Whole run  | Aborts before any file is touched            |
//! | `FileError`  | One file   | File left unmodified, recorded in the summary |
//!
//! ## Design Philosophy
//!
//! - **No Exceptions across modules**: errors are returned via `Result<T, E>`
//! - **Shared Immutable State**: `Rc<const T>` for configuration and formatters

#ifndef SRCFMT_COMMON_HPP
#define SRCFMT_COMMON_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace srcfmt {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<LineSeparator, FatalError> sep = parse_line_separator("crlf");
/// if (is_ok(sep)) {
///     use(unwrap(sep));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Fatal Errors
// ============================================================================

/// Category of an error that stops the run before any file is modified.
enum class FatalKind {
    InvalidArgument,    ///< Bad flag value (e.g. `--linesep tab`, unknown charset)
    MissingPath,        ///< No traversal root given
    UnreadableResource, ///< Profile or header file cannot be read
    InvalidPath         ///< Root is neither a regular file nor a directory
};

/// Startup or path-resolution failure.
struct FatalError {
    FatalKind kind;
    std::string message;
};

inline const char* fatal_kind_name(FatalKind kind) {
    switch (kind) {
    case FatalKind::InvalidArgument:
        return "invalid argument";
    case FatalKind::MissingPath:
        return "missing path";
    case FatalKind::UnreadableResource:
        return "unreadable resource";
    case FatalKind::InvalidPath:
        return "invalid path";
    }
    return "fatal";
}

// ============================================================================
// Exit Codes
// ============================================================================

namespace exit_code {
constexpr int SUCCESS = 0;
constexpr int FILE_FAILURES = 1; ///< Per-file failures, or files to format under --check
constexpr int INVALID_ARGUMENT = 2;
constexpr int FATAL = 3; ///< Unreadable resource or invalid traversal root
constexpr int INTERRUPTED = 130;
constexpr int MISSING_PATH = 255;
} // namespace exit_code

/// Process exit status for a fatal error.
inline int exit_code_for(FatalKind kind) {
    switch (kind) {
    case FatalKind::InvalidArgument:
        return exit_code::INVALID_ARGUMENT;
    case FatalKind::MissingPath:
        return exit_code::MISSING_PATH;
    case FatalKind::UnreadableResource:
    case FatalKind::InvalidPath:
        return exit_code::FATAL;
    }
    return exit_code::FATAL;
}

// ============================================================================
// Per-File Errors
// ============================================================================

/// Raised when bytes are not valid in the configured charset.
struct EncodingError {
    std::string charset;
    size_t offset = 0; ///< Byte offset of the first offending sequence
    std::string message;
};

/// Raised by a formatter that cannot process the content.
struct FormatError {
    std::string formatter; ///< Name of the formatter that failed
    std::string message;
};

/// Raised on any filesystem failure while reading or replacing a file.
struct IoError {
    std::string path;
    std::string message;
};

/// Category of a recoverable, per-file failure.
enum class FileErrorKind { Encoding, Format, Io };

/// A per-file failure attached to that file's outcome.
struct FileError {
    FileErrorKind kind;
    std::string message;

    static FileError from(const EncodingError& e) {
        return {FileErrorKind::Encoding,
                "cannot convert " + e.charset + " at byte " + std::to_string(e.offset) + ": " +
                    e.message};
    }
    static FileError from(const FormatError& e) {
        return {FileErrorKind::Format, e.formatter + ": " + e.message};
    }
    static FileError from(const IoError& e) {
        return {FileErrorKind::Io, e.path + ": " + e.message};
    }
};

// ============================================================================
// Shared Pointer Alias
// ============================================================================

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace srcfmt

#endif // SRCFMT_COMMON_HPP
