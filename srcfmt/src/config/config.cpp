//! # Configuration Resolution
//!
//! Implements `resolve_configuration()`: validates flag values, locates the
//! formatter profile and loads the header file, producing one immutable
//! `FormatterConfiguration` for the whole run.

#include "config/config.hpp"

#include "io/file_io.hpp"
#include "log/log.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace srcfmt::config {

// ============================================================================
// Line Separators
// ============================================================================

std::string_view line_separator_text(LineSeparator sep) {
    switch (sep) {
    case LineSeparator::LF:
        return "\n";
    case LineSeparator::CR:
        return "\r";
    case LineSeparator::CRLF:
        return "\r\n";
    }
    return "\n";
}

const char* line_separator_name(LineSeparator sep) {
    switch (sep) {
    case LineSeparator::LF:
        return "lf";
    case LineSeparator::CR:
        return "cr";
    case LineSeparator::CRLF:
        return "crlf";
    }
    return "lf";
}

Result<LineSeparator, FatalError> parse_line_separator(std::string_view value) {
    if (value == "lf")
        return LineSeparator::LF;
    if (value == "cr")
        return LineSeparator::CR;
    if (value == "crlf")
        return LineSeparator::CRLF;
    return FatalError{FatalKind::InvalidArgument,
                      "linesep : must be one of ['lf', 'cr', 'crlf'], got '" + std::string(value) +
                          "'"};
}

// ============================================================================
// Paths
// ============================================================================

fs::path default_profile_path() {
#ifdef _WIN32
    char* home = nullptr;
    size_t len = 0;
    if (_dupenv_s(&home, &len, "USERPROFILE") == 0 && home) {
        fs::path result = fs::path(home) / "formatter-profile.yml";
        free(home);
        return result;
    }
    return fs::path("C:") / "formatter-profile.yml";
#else
    const char* home = std::getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    return fs::path(home) / "formatter-profile.yml";
#endif
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

Result<fs::path, FatalError> path_from_url(std::string_view url) {
    if (url.empty()) {
        return FatalError{FatalKind::InvalidArgument, "empty path"};
    }

    constexpr std::string_view file_scheme = "file://";
    if (!url.starts_with(file_scheme)) {
        if (url.find("://") != std::string_view::npos) {
            return FatalError{FatalKind::UnreadableResource,
                              "unsupported URL scheme: " + std::string(url)};
        }
        return fs::path(std::string(url));
    }

    // file:///abs/path or file://localhost/abs/path, percent-escapes decoded
    auto rest = url.substr(file_scheme.size());
    if (rest.starts_with("localhost/")) {
        rest.remove_prefix(std::string_view("localhost").size());
    }

    std::string decoded;
    decoded.reserve(rest.size());
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == '%' && i + 2 < rest.size()) {
            int hi = hex_value(rest[i + 1]);
            int lo = hex_value(rest[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        decoded += rest[i];
    }

#ifdef _WIN32
    // file:///C:/dir -> C:/dir
    if (decoded.size() >= 3 && decoded[0] == '/' && decoded[2] == ':') {
        decoded.erase(0, 1);
    }
#endif

    if (decoded.empty()) {
        return FatalError{FatalKind::InvalidArgument, "URL has no path: " + std::string(url)};
    }
    return fs::path(decoded);
}

// ============================================================================
// Header Text
// ============================================================================

std::string normalize_header(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }

    // Drop trailing whitespace-only lines and the final newline
    size_t end = out.size();
    while (end > 0) {
        size_t line_start = out.rfind('\n', end - 1);
        line_start = line_start == std::string::npos ? 0 : line_start + 1;
        bool blank = true;
        for (size_t i = line_start; i < end; ++i) {
            if (!std::isspace(static_cast<unsigned char>(out[i]))) {
                blank = false;
                break;
            }
        }
        if (!blank) {
            break;
        }
        end = line_start == 0 ? 0 : line_start - 1;
    }
    out.resize(end);
    return out;
}

// ============================================================================
// Resolution
// ============================================================================

/// Picks the profile: explicit flag, then the per-user file, then none.
static Result<std::optional<fs::path>, FatalError>
resolve_profile(const ConfigRequest& request, const ProfileLocator& locate_profile) {
    if (request.conf) {
        auto path = path_from_url(*request.conf);
        if (is_err(path)) {
            return unwrap_err(path);
        }
        std::error_code ec;
        if (!fs::is_regular_file(unwrap(path), ec)) {
            return FatalError{FatalKind::UnreadableResource,
                              "cannot read profile: " + unwrap(path).string()};
        }
        SRCFMT_LOG_INFO("config", "Using command line configuration at " << unwrap(path));
        return std::optional<fs::path>(unwrap(path));
    }

    fs::path home_profile = locate_profile ? locate_profile() : fs::path();
    std::error_code ec;
    if (!home_profile.empty() && fs::is_regular_file(home_profile, ec)) {
        SRCFMT_LOG_INFO("config", "Using home directory configuration at " << home_profile);
        return std::optional<fs::path>(home_profile);
    }

    SRCFMT_LOG_INFO("config", "No command line configuration parameter found, nor home "
                              "directory configuration of "
                                  << home_profile << ". Using engine default formatting");
    return std::optional<fs::path>();
}

Result<Rc<const FormatterConfiguration>, FatalError>
resolve_configuration(const ConfigRequest& request, const ProfileLocator& locate_profile) {
    FormatterConfiguration config;

    // Flag values are validated before anything is read from disk.
    if (request.line_separator) {
        auto sep = parse_line_separator(*request.line_separator);
        if (is_err(sep)) {
            return unwrap_err(sep);
        }
        config.line_separator = unwrap(sep);
    }

    if (request.encoding) {
        if (!charset::is_supported(*request.encoding)) {
            return FatalError{FatalKind::InvalidArgument,
                              "encoding : unsupported charset '" + *request.encoding + "'"};
        }
        config.encoding = *request.encoding;
    }

    if (request.level) {
        if (request.level->empty()) {
            return FatalError{FatalKind::InvalidArgument, "level : must not be empty"};
        }
        config.source_level = *request.level;
    }

    auto profile = resolve_profile(request, locate_profile);
    if (is_err(profile)) {
        return unwrap_err(profile);
    }
    config.profile = unwrap(profile);

    if (request.header_file) {
        auto path = path_from_url(*request.header_file);
        if (is_err(path)) {
            return unwrap_err(path);
        }
        auto bytes = io::read_file_bytes(unwrap(path));
        if (is_err(bytes)) {
            return FatalError{FatalKind::UnreadableResource,
                              "cannot read header: " + unwrap_err(bytes).message};
        }
        auto text = charset::decode(unwrap(bytes), config.encoding);
        if (is_err(text)) {
            return FatalError{FatalKind::UnreadableResource,
                              "header " + unwrap(path).string() +
                                  " is not valid " + config.encoding};
        }
        std::string header = normalize_header(unwrap(text));
        if (header.empty()) {
            SRCFMT_LOG_WARN("config", "Header file " << unwrap(path) << " is empty, ignoring it");
        } else {
            config.header = std::move(header);
        }
    }

    SRCFMT_LOG_DEBUG("config", "encoding=" << config.encoding << " linesep="
                                           << line_separator_name(config.line_separator)
                                           << " level=" << config.source_level.value_or("-")
                                           << " header=" << (config.header ? "yes" : "no"));

    return make_rc<const FormatterConfiguration>(std::move(config));
}

} // namespace srcfmt::config
