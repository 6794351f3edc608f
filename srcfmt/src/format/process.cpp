#include "process.hpp"

#include "io/file_io.hpp"
#include "log/log.hpp"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace srcfmt::format {

std::string shell_quote(const std::string& arg) {
#ifdef _WIN32
    return "\"" + arg + "\"";
#else
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
#endif
}

auto run_capture(const std::string& cmd) -> std::pair<std::string, int> {
    std::string output;
    int exit_code = -1;

#ifdef _WIN32
    FILE* pipe = _popen(cmd.c_str(), "rb");
#else
    FILE* pipe = popen(cmd.c_str(), "r");
#endif
    if (!pipe) {
        return {output, exit_code};
    }

    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }

#ifdef _WIN32
    exit_code = _pclose(pipe);
#else
    int status = pclose(pipe);
    exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
    return {output, exit_code};
}

std::optional<std::string> probe_version(const std::string& binary) {
    std::string cmd = shell_quote(binary) + " --version 2>&1";
    auto [out, rc] = run_capture(cmd);
    if (rc != 0) {
        return std::nullopt;
    }
    return out.substr(0, out.find('\n'));
}

static fs::path scratch_file(std::string_view suffix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream name;
    name << "srcfmt-engine-" << std::hex << std::setw(16) << std::setfill('0') << rng() << suffix;
    return fs::temp_directory_path() / name.str();
}

Result<ProcessOutput, EngineFailure> run_with_input(const std::string& command,
                                                    std::string_view text) {
    fs::path input = scratch_file(".in");
    fs::path errors = scratch_file(".err");
    {
        std::ofstream out(input, std::ios::out | std::ios::binary | std::ios::trunc);
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!out) {
            std::error_code ec;
            fs::remove(input, ec);
            return EngineFailure{"cannot write engine input " + input.string()};
        }
    }

    std::string cmd = command + " < " + shell_quote(input.string()) + " 2> " +
                      shell_quote(errors.string());
    SRCFMT_LOG_TRACE("engine", cmd);

    auto [output, rc] = run_capture(cmd);

    std::string diagnostics;
    if (auto err = io::read_file_bytes(errors); is_ok(err)) {
        diagnostics = std::move(unwrap(err));
    }
    std::error_code ec;
    fs::remove(input, ec);
    fs::remove(errors, ec);

    while (!diagnostics.empty() && (diagnostics.back() == '\n' || diagnostics.back() == '\r')) {
        diagnostics.pop_back();
    }
    return ProcessOutput{std::move(output), std::move(diagnostics), rc};
}

} // namespace srcfmt::format
