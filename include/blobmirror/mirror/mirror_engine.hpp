#pragma once

#include "blobmirror/mirror/path_sanitizer.hpp"
#include "blobmirror/storage/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace blobmirror {

class MetricsExporter;

/// Process exit statuses. Per-object failures never change the status.
enum class ExitStatus : int {
    Success = 0,
    UnexpectedError = 1,          // Unclassified top-level failure, listing failures
    MissingOutputDir = 2,         // No output directory argument / bad command line
    MissingConnectionString = 3,
    MissingContainer = 4,
    OutputIsFile = 5,             // Output root exists and is not a directory
};

inline int to_exit_code(ExitStatus status) { return static_cast<int>(status); }

enum class RunState {
    Initializing,
    ValidatingOutputRoot,
    Enumerating,
    Completed,
    Failed
};

const char* to_string(RunState state);

enum class ObjectStatus {
    Downloaded,
    Skipped,      // Name sanitized to nothing
    Failed
};

enum class FailureKind {
    None,
    AlreadyExists,  // Destination present (earlier run or name collision)
    Transport,      // Network error or non-2xx service reply
    Filesystem,     // Directory creation or file creation failed
    Unexpected      // Any other exception while handling the object
};

const char* to_string(FailureKind kind);

/// Message when `output_root` exists but is not a directory, nullopt otherwise.
std::optional<std::string> output_root_conflict(const std::filesystem::path& output_root);

// Outcome of processing one listed object
struct ObjectOutcome {
    std::string name;
    std::string relative_path;    // Empty when skipped
    ObjectStatus status = ObjectStatus::Skipped;
    FailureKind failure = FailureKind::None;
    std::string message;
    uint64_t bytes = 0;

    bool failed() const { return status == ObjectStatus::Failed; }
};

// Aggregate of one mirror run
struct MirrorRunResult {
    uint64_t listed = 0;
    uint64_t downloaded = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;
    uint64_t bytes_downloaded = 0;
    std::vector<ObjectOutcome> failures;
    std::string fatal_error;      // Set when the run ended in RunState::Failed
};

struct MirrorOptions {
    std::ostream* report = &std::cout;   // Progress and per-object outcomes
    bool verbose = false;                // Also report skipped names
    MetricsExporter* metrics = nullptr;  // Not owned, may be null
};

/// Mirrors every object of a lister into a local directory tree.
///
/// Objects are processed strictly one at a time in listing order. Existing
/// files are never overwritten; a failure on one object is recorded and the
/// run continues with the next one.
class MirrorEngine {
public:
    explicit MirrorEngine(MirrorOptions options = {});

    /// Validate/create `output_root`, then download every listed object below it.
    /// Returns Success once the listing is exhausted, regardless of per-object failures.
    ExitStatus run(const std::filesystem::path& output_root,
                   ObjectLister& lister,
                   ObjectFetcher& fetcher);

    /// Handle one object below an existing, absolute output root. Never throws.
    ObjectOutcome process_object(const std::filesystem::path& output_root,
                                 const RemoteObject& object,
                                 ObjectFetcher& fetcher);

    RunState state() const { return state_; }
    const MirrorRunResult& result() const { return result_; }

private:
    // `relative` receives the sanitized path as soon as it is known
    ObjectOutcome evaluate_and_fetch(const std::filesystem::path& output_root,
                                     const RemoteObject& object,
                                     ObjectFetcher& fetcher,
                                     std::string& relative);
    void record(const ObjectOutcome& outcome);
    ExitStatus fail(ExitStatus status, const std::string& message);
    void report_summary();

    MirrorOptions options_;
    RunState state_ = RunState::Initializing;
    MirrorRunResult result_;
    bool progress_line_open_ = false;
};

} // namespace blobmirror
