//! # Charset Conversion
//!
//! Converts file bytes between a named charset and the UTF-8 text that
//! formatters work on. Built on the POSIX `iconv` API with no
//! transliteration, so any byte sequence that is not valid in the source
//! charset is reported instead of silently replaced.
//!
//! ## Functions
//!
//! | Function         | Description                              |
//! |------------------|------------------------------------------|
//! | `is_supported()` | Whether the converter knows a charset    |
//! | `decode()`       | charset bytes -> UTF-8                   |
//! | `encode()`       | UTF-8 -> charset bytes                   |

#ifndef SRCFMT_CHARSET_CHARSET_HPP
#define SRCFMT_CHARSET_CHARSET_HPP

#include "common.hpp"

#include <string>
#include <string_view>

namespace srcfmt::charset {

/// Charset used when none is configured.
constexpr const char* DEFAULT_CHARSET = "UTF-8";

/// Returns true when conversions from and to `charset` can be opened.
bool is_supported(const std::string& charset);

/// Decodes `bytes` from `charset` into UTF-8.
Result<std::string, EncodingError> decode(std::string_view bytes, const std::string& charset);

/// Encodes UTF-8 `text` into `charset`.
Result<std::string, EncodingError> encode(std::string_view text, const std::string& charset);

} // namespace srcfmt::charset

#endif // SRCFMT_CHARSET_CHARSET_HPP
