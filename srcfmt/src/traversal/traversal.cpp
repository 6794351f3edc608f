//! # Traversal Engine
//!
//! Implements tree walking, per-file processing and the worker pool.
//!
//! ## Per-File Flow
//!
//! ```text
//! applicable formatters? --no--> Skipped
//!        |
//!   read bytes -> FormatterPipeline::apply -> FileRewriter::rewrite
//!        |                 |                          |
//!      Failed            Failed              Changed / Unchanged / Failed
//! ```
//!
//! Every failure stays attached to its file; the walk always continues.

#include "traversal/traversal.hpp"

#include "io/file_io.hpp"
#include "log/log.hpp"
#include "pipeline/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>

namespace srcfmt::traversal {

const char* file_status_name(FileStatus status) {
    switch (status) {
    case FileStatus::Unchanged:
        return "unchanged";
    case FileStatus::Changed:
        return "changed";
    case FileStatus::Skipped:
        return "skipped";
    case FileStatus::Failed:
        return "failed";
    }
    return "unknown";
}

// ============================================================================
// RunSummary
// ============================================================================

void RunSummary::record(FileOutcome outcome, bool file) {
    if (file) {
        ++visited;
    }
    switch (outcome.status) {
    case FileStatus::Unchanged:
        ++unchanged;
        break;
    case FileStatus::Changed:
        ++changed;
        break;
    case FileStatus::Skipped:
        ++skipped;
        break;
    case FileStatus::Failed:
        ++failed;
        break;
    }
    outcomes.push_back(std::move(outcome));
}

int RunSummary::exit_code() const {
    if (cancelled) {
        return exit_code::INTERRUPTED;
    }
    if (failed > 0 || (check_only && changed > 0)) {
        return exit_code::FILE_FAILURES;
    }
    return exit_code::SUCCESS;
}

// ============================================================================
// TaskQueue
// ============================================================================

void TaskQueue::push(fs::path path) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(path));
    cv_.notify_one();
}

std::optional<fs::path> TaskQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue_.empty() || closed_; });
    }

    if (queue_.empty()) {
        return std::nullopt;
    }

    fs::path path = std::move(queue_.front());
    queue_.pop();
    return path;
}

void TaskQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

bool TaskQueue::is_closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool TaskQueue::is_empty() {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t TaskQueue::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// Per-File Processing
// ============================================================================

static FileOutcome failed(const fs::path& path, FileError error) {
    SRCFMT_LOG_ERROR("fmt", path.string() << ": " << error.message);
    return {path, FileStatus::Failed, std::move(error)};
}

FileOutcome TraversalEngine::process_file(const fs::path& path,
                                          const format::FormatterList& formatters,
                                          const config::FormatterConfiguration& config) const {
    auto applicable = format::applicable_formatters(formatters, path);
    if (applicable.empty()) {
        SRCFMT_LOG_DEBUG("walk", "Skipping " << path.string() << " (no applicable formatter)");
        return {path, FileStatus::Skipped, std::nullopt};
    }

    auto bytes = io::read_file_bytes(path);
    if (is_err(bytes)) {
        return failed(path, FileError::from(unwrap_err(bytes)));
    }
    FileTask task{path, std::move(unwrap(bytes)), config.encoding};

    pipeline::FormatterPipeline pipeline(config);
    auto output = pipeline.apply(task.original_bytes, applicable);
    if (is_err(output)) {
        return failed(path, std::move(unwrap_err(output)));
    }

    if (options_.check_only) {
        if (unwrap(output) == task.original_bytes) {
            return {path, FileStatus::Unchanged, std::nullopt};
        }
        SRCFMT_LOG_INFO("fmt", "Would reformat " << path.string());
        return {path, FileStatus::Changed, std::nullopt};
    }

    auto changed = rewriter_.rewrite(path, unwrap(output));
    if (is_err(changed)) {
        return failed(path, FileError::from(unwrap_err(changed)));
    }
    if (unwrap(changed)) {
        SRCFMT_LOG_INFO("fmt", "Formatted " << path.string());
        return {path, FileStatus::Changed, std::nullopt};
    }
    SRCFMT_LOG_DEBUG("fmt", "Unchanged " << path.string());
    return {path, FileStatus::Unchanged, std::nullopt};
}

// ============================================================================
// Walking
// ============================================================================

template <typename OnFile>
bool TraversalEngine::walk(const fs::path& root, RunSummary& summary, std::mutex& summary_mutex,
                           OnFile&& on_file) const {
    std::vector<fs::path> pending{root};

    auto record_dir_error = [&](const fs::path& dir, const std::error_code& ec) {
        SRCFMT_LOG_ERROR("walk", "Cannot read directory " << dir.string() << ": " << ec.message());
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.record({dir, FileStatus::Failed, FileError{FileErrorKind::Io,
                                                           dir.string() + ": " + ec.message()}},
                       false);
    };

    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            record_dir_error(dir, ec);
            continue;
        }

        std::vector<fs::directory_entry> entries;
        for (fs::directory_iterator end; it != end;) {
            entries.push_back(*it);
            if (it.increment(ec); ec) {
                break;
            }
        }
        if (ec) {
            record_dir_error(dir, ec);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.path() < b.path(); });

        // Subdirectories are pushed in reverse so they pop in name order.
        std::vector<fs::path> subdirs;
        for (const auto& entry : entries) {
            if (cancelled()) {
                return false;
            }

            auto status = entry.symlink_status(ec);
            if (ec) {
                record_dir_error(entry.path(), ec);
                continue;
            }

            if (fs::is_symlink(status)) {
                if (fs::is_directory(entry.status(ec))) {
                    SRCFMT_LOG_DEBUG("walk", "Not following directory link " << entry.path().string());
                    continue;
                }
                SRCFMT_LOG_DEBUG("walk", "Skipping symbolic link " << entry.path().string());
                std::lock_guard<std::mutex> lock(summary_mutex);
                summary.record({entry.path(), FileStatus::Skipped, std::nullopt});
                continue;
            }

            if (fs::is_directory(status)) {
                subdirs.push_back(entry.path());
            } else if (fs::is_regular_file(status)) {
                on_file(entry.path());
            } else {
                SRCFMT_LOG_DEBUG("walk", "Ignoring special file " << entry.path().string());
            }
        }
        pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
    }
    return true;
}

void TraversalEngine::visit_sequential(const fs::path& root, const format::FormatterList& formatters,
                                       const config::FormatterConfiguration& config,
                                       RunSummary& summary) const {
    std::mutex summary_mutex;
    bool completed = walk(root, summary, summary_mutex, [&](const fs::path& path) {
        summary.record(process_file(path, formatters, config));
    });
    summary.cancelled = !completed;
}

void TraversalEngine::visit_parallel(const fs::path& root, const format::FormatterList& formatters,
                                     const config::FormatterConfiguration& config,
                                     RunSummary& summary) const {
    TaskQueue queue;
    std::mutex summary_mutex;

    auto worker = [&]() {
        while (true) {
            if (cancelled()) {
                break;
            }
            auto path = queue.pop(100);
            if (!path) {
                if (queue.is_closed() && queue.is_empty()) {
                    break;
                }
                continue;
            }
            FileOutcome outcome = process_file(*path, formatters, config);
            std::lock_guard<std::mutex> lock(summary_mutex);
            summary.record(std::move(outcome));
        }
    };

    int jobs = std::min(options_.jobs, MAX_JOBS);
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(jobs));
    for (int i = 0; i < jobs; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& e) {
            SRCFMT_LOG_WARN("walk", "Started " << workers.size() << " of " << jobs
                                               << " workers: " << e.what());
            break;
        }
    }
    if (workers.empty()) {
        visit_sequential(root, formatters, config, summary);
        return;
    }

    bool completed = walk(root, summary, summary_mutex,
                          [&](const fs::path& path) { queue.push(path); });
    queue.close();

    for (auto& thread : workers) {
        thread.join();
    }

    // Files still queued when the flag was raised are abandoned.
    summary.cancelled = !completed || cancelled();

    std::sort(summary.outcomes.begin(), summary.outcomes.end(),
              [](const FileOutcome& a, const FileOutcome& b) { return a.path < b.path; });
}

// ============================================================================
// Entry Point
// ============================================================================

Result<RunSummary, FatalError> TraversalEngine::visit(const fs::path& root,
                                                      const format::FormatterList& formatters,
                                                      const config::FormatterConfiguration& config) const {
    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !(fs::is_regular_file(status) || fs::is_directory(status))) {
        return FatalError{FatalKind::InvalidPath,
                          root.string() + ": unsupported path (neither a file nor a directory)"};
    }

    fs::path start = root;
    if (fs::is_symlink(fs::symlink_status(root, ec))) {
        start = fs::canonical(root, ec);
        if (ec) {
            return FatalError{FatalKind::InvalidPath,
                              root.string() + ": cannot resolve link: " + ec.message()};
        }
        SRCFMT_LOG_DEBUG("walk", "Resolved " << root.string() << " to " << start.string());
    }

    RunSummary summary;
    summary.check_only = options_.check_only;

    if (fs::is_regular_file(status)) {
        if (cancelled()) {
            summary.cancelled = true;
            return summary;
        }
        summary.record(process_file(start, formatters, config));
        return summary;
    }

    SRCFMT_LOG_DEBUG("walk", "Walking " << start.string() << " with " << std::max(options_.jobs, 1)
                                        << " job(s)");
    if (options_.jobs > 1) {
        visit_parallel(start, formatters, config, summary);
    } else {
        visit_sequential(start, formatters, config, summary);
    }
    return summary;
}

} // namespace srcfmt::traversal
