//! # Format Command
//!
//! ```text
//! run_format()
//!   ├─ resolve_configuration()   fatal → exit 2 / 3
//!   ├─ InterruptGuard            SIGINT → cancel flag
//!   ├─ TraversalEngine::visit()  fatal → exit 3
//!   └─ print_summary()           → RunSummary::exit_code()
//! ```

#include "cmd_format.hpp"

#include "../utils.hpp"
#include "log/log.hpp"
#include "traversal/traversal.hpp"

#include <atomic>
#include <csignal>
#include <thread>

namespace srcfmt::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int /*signal*/) {
    g_interrupted.store(true);
}

/// Routes SIGINT to `g_interrupted` for the lifetime of the guard.
class InterruptGuard {
public:
    InterruptGuard() {
        g_interrupted.store(false);
        previous_ = std::signal(SIGINT, on_interrupt);
    }
    ~InterruptGuard() {
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    void (*previous_)(int) = SIG_DFL;
};

int report_fatal(const FatalError& error) {
    SRCFMT_LOG_ERROR("fmt", fatal_kind_name(error.kind) << ": " << error.message);
    return exit_code_for(error.kind);
}

int resolve_jobs(int requested) {
    if (requested > 0) {
        return requested;
    }
    unsigned int cores = std::thread::hardware_concurrency();
    return cores == 0 ? 1 : static_cast<int>(cores);
}

} // namespace

int run_format(const CliOptions& options, const FormatCommand& command, std::ostream& out) {
    if (!options.path) {
        return report_fatal({FatalKind::MissingPath, "missing file or directory parameter"});
    }

    auto resolved = config::resolve_configuration(options.config, command.locate_profile);
    if (is_err(resolved)) {
        return report_fatal(unwrap_err(resolved));
    }
    const auto& config = unwrap(resolved);

    for (const auto& formatter : command.formatters) {
        SRCFMT_LOG_DEBUG("fmt", "Registered formatter " << formatter->name() << " ("
                                                        << formatter->short_description() << ")");
    }

    InterruptGuard guard;

    traversal::TraversalOptions traversal_options;
    traversal_options.jobs = resolve_jobs(options.jobs);
    traversal_options.check_only = options.check;
    traversal_options.cancel = &g_interrupted;

    traversal::TraversalEngine engine(traversal_options, command.rewriter);
    auto visited = engine.visit(*options.path, command.formatters, *config);
    if (is_err(visited)) {
        return report_fatal(unwrap_err(visited));
    }

    const auto& summary = unwrap(visited);
    print_summary(out, summary);
    if (summary.cancelled) {
        SRCFMT_LOG_WARN("fmt", "Interrupted; remaining files were left untouched");
    }
    return summary.exit_code();
}

} // namespace srcfmt::cli
