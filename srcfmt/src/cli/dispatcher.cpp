//! # CLI Dispatcher
//!
//! ```text
//! srcfmt_main()
//!   ├─ Logger::init(parse_log_options())
//!   ├─ parse_args()        error → exit 2
//!   ├─ --help, -h          → print_usage()
//!   ├─ --version, -V       → print_version()
//!   ├─ no path             → usage on stderr, exit 255
//!   └─ run_format()
//! ```

#include "commands/cmd_format.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "format/engine.hpp"
#include "log/log.hpp"
#include "options.hpp"
#include "utils.hpp"

#include <iostream>

namespace srcfmt::cli {

int srcfmt_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto java_engine = make_rc<const format::GoogleJavaFormatEngine>();
    auto cpp_engine = make_rc<const format::ClangFormatEngine>();
    FormatCommand command;
    command.formatters = format::default_formatters(java_engine, cpp_engine);

    auto parsed = parse_args(argc, argv);
    if (is_err(parsed)) {
        const auto& error = unwrap_err(parsed);
        SRCFMT_LOG_ERROR("fmt", fatal_kind_name(error.kind) << ": " << error.message);
        std::cerr << "Try 'srcfmt --help' for more information.\n";
        return exit_code_for(error.kind);
    }
    const auto& options = unwrap(parsed);

    if (options.help) {
        print_usage(std::cout, command.formatters);
        return exit_code::SUCCESS;
    }
    if (options.version) {
        print_version(std::cout);
        return exit_code::SUCCESS;
    }
    if (!options.path) {
        std::cerr << "Missing file or directory parameter.\n\n";
        print_usage(std::cerr, command.formatters);
        return exit_code::MISSING_PATH;
    }

    if (!java_engine->available()) {
        SRCFMT_LOG_WARN("engine", java_engine->name()
                                      << " not found (" << java_engine->binary()
                                      << "); Java files will fail to format");
    }
    if (!cpp_engine->available()) {
        SRCFMT_LOG_WARN("engine", cpp_engine->name() << " not found (" << cpp_engine->binary()
                                                     << "); C/C++ files will fail to format");
    }

    int code = run_format(options, command, std::cout);
    log::Logger::instance().flush();
    return code;
}

} // namespace srcfmt::cli
