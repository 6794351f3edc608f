//! # Traversal Engine
//!
//! Applies the registered formatters to a single file or to every regular
//! file below a directory, rewriting changed files in place.
//!
//! ## Components
//!
//! | Type              | Description                                  |
//! |-------------------|----------------------------------------------|
//! | `FileTask`        | One file's bytes, alive while it is processed|
//! | `FileOutcome`     | Status and optional error of one file        |
//! | `RunSummary`      | Aggregated counts and outcomes of a run      |
//! | `TaskQueue`       | Thread-safe queue feeding the worker pool    |
//! | `TraversalEngine` | Walks the tree and processes each file       |
//!
//! ## Walking
//!
//! Directories are walked depth-first with entries sorted by name. Directory
//! symlinks are never followed, so link cycles cannot recurse. Symlinked
//! files are skipped so the atomic rename never replaces a link with a copy.
//!
//! ## Workers
//!
//! With `jobs > 1` the walker feeds a `TaskQueue` consumed by `jobs` worker
//! threads. Files share only the read-only configuration and formatter list.

#ifndef SRCFMT_TRAVERSAL_TRAVERSAL_HPP
#define SRCFMT_TRAVERSAL_TRAVERSAL_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "format/formatter.hpp"
#include "io/file_rewriter.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace srcfmt::traversal {

/// A visited file. Created per file and dropped once the file is done.
struct FileTask {
    fs::path path;
    std::string original_bytes;
    std::string encoding;
};

enum class FileStatus {
    Unchanged, ///< Pipeline output equals the bytes on disk
    Changed,   ///< Rewritten (or would be, in check mode)
    Skipped,   ///< No applicable formatter, or a symlink
    Failed     ///< Per-file error, file left untouched
};

const char* file_status_name(FileStatus status);

struct FileOutcome {
    fs::path path;
    FileStatus status;
    std::optional<FileError> error;
};

/// Result of a run.
struct RunSummary {
    size_t visited = 0;
    size_t changed = 0;
    size_t unchanged = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<FileOutcome> outcomes;
    bool cancelled = false;
    bool check_only = false;

    /// Adds an outcome and updates the counters. Failed directories are
    /// recorded with `file == false` and do not count as visited.
    void record(FileOutcome outcome, bool file = true);

    /// 0 on success, 1 when any file failed (or needs formatting under
    /// `check_only`), 130 when the run was cancelled.
    int exit_code() const;
};

/// Upper bound on worker threads.
constexpr int MAX_JOBS = 256;

struct TraversalOptions {
    /// Worker threads. `<= 1` processes files sequentially.
    int jobs = 1;
    /// Compute outcomes without writing any file.
    bool check_only = false;
    /// Checked before each file; once set no further file is started.
    const std::atomic<bool>* cancel = nullptr;
};

// ============================================================================
// Task Queue
// ============================================================================

/// Thread-safe work queue for the worker pool.
class TaskQueue {
public:
    TaskQueue() : closed_(false) {}

    void push(fs::path path);

    /// Pops a path, waiting up to `timeout_ms`. Returns nullopt if the
    /// queue is still empty afterwards.
    std::optional<fs::path> pop(int timeout_ms = 100);

    /// Signals that no more paths will be pushed and wakes all waiters.
    void close();

    bool is_closed();
    bool is_empty();
    size_t size();

private:
    std::queue<fs::path> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_;
};

// ============================================================================
// Traversal Engine
// ============================================================================

class TraversalEngine {
public:
    explicit TraversalEngine(TraversalOptions options = {}, io::FileRewriter rewriter = {})
        : options_(options), rewriter_(std::move(rewriter)) {}

    /// Processes `root`. Fails with `InvalidPath` before touching anything
    /// when `root` is neither a regular file nor a directory.
    Result<RunSummary, FatalError> visit(const fs::path& root,
                                         const format::FormatterList& formatters,
                                         const config::FormatterConfiguration& config) const;

    /// Runs one regular file through the pipeline and the rewriter.
    FileOutcome process_file(const fs::path& path, const format::FormatterList& formatters,
                             const config::FormatterConfiguration& config) const;

    const TraversalOptions& options() const {
        return options_;
    }

private:
    bool cancelled() const {
        return options_.cancel && options_.cancel->load();
    }

    /// Walks `root`, handing every regular file to `on_file`. Returns false
    /// when the walk stopped on cancellation.
    template <typename OnFile>
    bool walk(const fs::path& root, RunSummary& summary, std::mutex& summary_mutex,
              OnFile&& on_file) const;

    void visit_sequential(const fs::path& root, const format::FormatterList& formatters,
                          const config::FormatterConfiguration& config, RunSummary& summary) const;

    void visit_parallel(const fs::path& root, const format::FormatterList& formatters,
                        const config::FormatterConfiguration& config, RunSummary& summary) const;

    TraversalOptions options_;
    io::FileRewriter rewriter_;
};

} // namespace srcfmt::traversal

#endif // SRCFMT_TRAVERSAL_TRAVERSAL_HPP
