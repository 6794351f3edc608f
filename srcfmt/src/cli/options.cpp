#include "options.hpp"

#include "log/log.hpp"
#include "traversal/traversal.hpp"

#include <charconv>
#include <string_view>

namespace srcfmt::cli {

namespace {

struct ValueFlag {
    std::string_view short_name;
    std::string_view long_name;
    std::optional<std::string> config::ConfigRequest::*field;
};

const ValueFlag CONFIG_FLAGS[] = {
    {"-c", "--conf", &config::ConfigRequest::conf},
    {"-l", "--level", &config::ConfigRequest::level},
    {"-H", "--header", &config::ConfigRequest::header_file},
    {"-e", "--encoding", &config::ConfigRequest::encoding},
    {"-s", "--linesep", &config::ConfigRequest::line_separator},
};

FatalError invalid(std::string message) {
    return FatalError{FatalKind::InvalidArgument, std::move(message)};
}

/// Matches `arg` against a value flag. On a match, stores the value (inline
/// after '=' or the next argument) in `value` and advances `i` as needed.
/// Returns nullopt when `arg` is not this flag.
std::optional<Result<bool, FatalError>> take_value(std::string_view arg, std::string_view short_name,
                                                   std::string_view long_name, int& i, int argc,
                                                   char* argv[], std::string& value) {
    if (arg.starts_with(long_name) && arg.size() > long_name.size() &&
        arg[long_name.size()] == '=') {
        value = std::string(arg.substr(long_name.size() + 1));
        return Result<bool, FatalError>{true};
    }
    if (arg != short_name && arg != long_name) {
        return std::nullopt;
    }
    if (i + 1 >= argc) {
        return Result<bool, FatalError>{invalid("option " + std::string(arg) + " requires a value")};
    }
    value = argv[++i];
    return Result<bool, FatalError>{true};
}

Result<int, FatalError> parse_jobs(const std::string& value) {
    int jobs = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
    if (ec != std::errc() || ptr != value.data() + value.size() || jobs < 0) {
        return invalid("jobs : expected a non-negative integer, got '" + value + "'");
    }
    if (jobs > traversal::MAX_JOBS) {
        return invalid("jobs : at most " + std::to_string(traversal::MAX_JOBS) + ", got " + value);
    }
    return jobs;
}

} // namespace

Result<CliOptions, FatalError> parse_args(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            options.help = true;
            continue;
        }
        if (arg == "-V" || arg == "--version") {
            options.version = true;
            continue;
        }
        if (arg == "--check") {
            options.check = true;
            continue;
        }

        std::string value;
        bool matched = false;
        for (const auto& flag : CONFIG_FLAGS) {
            auto taken = take_value(arg, flag.short_name, flag.long_name, i, argc, argv, value);
            if (!taken) {
                continue;
            }
            if (is_err(*taken)) {
                return unwrap_err(*taken);
            }
            (options.config.*flag.field) = value;
            matched = true;
            break;
        }
        if (matched) {
            continue;
        }

        if (auto taken = take_value(arg, "-j", "--jobs", i, argc, argv, value)) {
            if (is_err(*taken)) {
                return unwrap_err(*taken);
            }
            auto jobs = parse_jobs(value);
            if (is_err(jobs)) {
                return unwrap_err(jobs);
            }
            options.jobs = unwrap(jobs);
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            return invalid("unknown option " + std::string(arg));
        }

        options.path = std::string(arg);
    }

    return options;
}

} // namespace srcfmt::cli
