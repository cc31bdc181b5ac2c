#include "blobmirror/mirror/mirror_engine.hpp"
#include "blobmirror/metrics.hpp"

#include <memory>
#include <optional>
#include <system_error>

namespace blobmirror {

namespace fs = std::filesystem;

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Initializing: return "initializing";
        case RunState::ValidatingOutputRoot: return "validating_output_root";
        case RunState::Enumerating: return "enumerating";
        case RunState::Completed: return "completed";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::AlreadyExists: return "already_exists";
        case FailureKind::Transport: return "transport";
        case FailureKind::Filesystem: return "filesystem";
        case FailureKind::Unexpected: return "unexpected";
    }
    return "unknown";
}

std::optional<std::string> output_root_conflict(const fs::path& output_root) {
    std::error_code ec;
    auto status = fs::status(output_root, ec);
    if (fs::exists(status) && !fs::is_directory(status)) {
        return "output path must not be a file: " + output_root.string();
    }
    return std::nullopt;
}

namespace {

ObjectOutcome make_failure(const RemoteObject& object, const std::string& relative_path,
                           FailureKind kind, const std::string& message) {
    ObjectOutcome outcome;
    outcome.name = object.name;
    outcome.relative_path = relative_path;
    outcome.status = ObjectStatus::Failed;
    outcome.failure = kind;
    outcome.message = message;
    return outcome;
}

}  // namespace

MirrorEngine::MirrorEngine(MirrorOptions options)
    : options_(options) {}

ExitStatus MirrorEngine::run(const fs::path& output_root,
                             ObjectLister& lister,
                             ObjectFetcher& fetcher) {
    state_ = RunState::Initializing;
    result_ = MirrorRunResult{};
    auto& out = *options_.report;

    state_ = RunState::ValidatingOutputRoot;

    std::error_code ec;
    fs::path root = fs::absolute(output_root, ec);
    if (ec) {
        return fail(ExitStatus::UnexpectedError,
                    "cannot resolve output path " + output_root.string() + ": " + ec.message());
    }
    root = root.lexically_normal();

    if (auto conflict = output_root_conflict(root)) {
        return fail(ExitStatus::OutputIsFile, *conflict);
    }

    if (!fs::is_directory(root, ec)) {
        fs::create_directories(root, ec);
        if (ec) {
            return fail(ExitStatus::UnexpectedError,
                        "cannot create output directory " + root.string() + ": " + ec.message());
        }
    }

    state_ = RunState::Enumerating;

    std::unique_ptr<ObjectCursor> cursor;
    try {
        cursor = lister.list();
    } catch (const std::exception& e) {
        return fail(ExitStatus::UnexpectedError, std::string("cannot list objects: ") + e.what());
    }

    while (true) {
        std::optional<RemoteObject> object;
        try {
            object = cursor->next();
        } catch (const std::exception& e) {
            return fail(ExitStatus::UnexpectedError, std::string("listing failed: ") + e.what());
        }
        if (!object) break;

        ++result_.listed;
        if (options_.metrics) options_.metrics->objects_listed().Increment();

        record(process_object(root, *object, fetcher));
    }

    state_ = RunState::Completed;
    report_summary();
    out.flush();
    return ExitStatus::Success;
}

ObjectOutcome MirrorEngine::process_object(const fs::path& output_root,
                                           const RemoteObject& object,
                                           ObjectFetcher& fetcher) {
    auto& out = *options_.report;
    std::string relative;
    try {
        return evaluate_and_fetch(output_root, object, fetcher, relative);
    } catch (const std::exception& e) {
        auto outcome = make_failure(object, relative, FailureKind::Unexpected, e.what());
        if (progress_line_open_) {
            out << "FAILED [" << to_string(outcome.failure) << "] '" << outcome.message
                << "'" << std::endl;
        } else {
            out << "FAILED [" << to_string(outcome.failure) << "] '" << object.name
                << "': " << outcome.message << std::endl;
        }
        progress_line_open_ = false;
        return outcome;
    }
}

ObjectOutcome MirrorEngine::evaluate_and_fetch(const fs::path& output_root,
                                               const RemoteObject& object,
                                               ObjectFetcher& fetcher,
                                               std::string& relative) {
    auto& out = *options_.report;

    auto sanitized = sanitize_blob_name(object.name);
    if (!sanitized) {
        if (options_.verbose) {
            out << "Skipping '" << object.name << "' (no usable path)" << std::endl;
        }
        ObjectOutcome outcome;
        outcome.name = object.name;
        outcome.status = ObjectStatus::Skipped;
        return outcome;
    }

    relative = sanitized->str();
    fs::path target = sanitized->resolve(output_root);

    auto report_failure = [&](FailureKind kind, const std::string& message) {
        out << "FAILED [" << to_string(kind) << "] '" << object.name << "': "
            << message << std::endl;
        return make_failure(object, relative, kind, message);
    };

    // Never overwrite: a file, directory or dangling link already there is a failure
    std::error_code ec;
    auto target_status = fs::symlink_status(target, ec);
    if (fs::exists(target_status)) {
        return report_failure(FailureKind::AlreadyExists, "'" + relative + "' already exists");
    }

    fs::path parent = target.parent_path();
    if (!fs::is_directory(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            return report_failure(FailureKind::Filesystem,
                                  "cannot create directory for '" + relative + "': " + ec.message());
        }
    }

    out << "Downloading '" << object.name << "' ... " << std::flush;
    progress_line_open_ = true;

    FetchResult fetched;
    {
        std::optional<ScopedTimer> timer;
        if (options_.metrics) timer.emplace(options_.metrics->download_duration());
        fetched = fetcher.fetch(object.name, target);
    }

    if (!fetched.success) {
        FailureKind kind = FailureKind::Transport;
        if (!fetched.is_network_error && fetched.status_code == 0) {
            // No service reply: the local file could not be created or written
            kind = fs::exists(fs::symlink_status(target, ec)) ? FailureKind::AlreadyExists
                                                              : FailureKind::Filesystem;
        }
        out << "FAILED [" << to_string(kind) << "] '" << fetched.error_message << "'" << std::endl;
        progress_line_open_ = false;
        return make_failure(object, relative, kind, fetched.error_message);
    }

    out << "OK (" << fetched.bytes_written << " bytes)" << std::endl;
    progress_line_open_ = false;

    ObjectOutcome outcome;
    outcome.name = object.name;
    outcome.relative_path = relative;
    outcome.status = ObjectStatus::Downloaded;
    outcome.bytes = fetched.bytes_written;
    return outcome;
}

void MirrorEngine::record(const ObjectOutcome& outcome) {
    auto* metrics = options_.metrics;
    switch (outcome.status) {
        case ObjectStatus::Downloaded:
            ++result_.downloaded;
            result_.bytes_downloaded += outcome.bytes;
            if (metrics) {
                metrics->objects_downloaded().Increment();
                metrics->download_bytes_total().Increment(static_cast<double>(outcome.bytes));
            }
            break;
        case ObjectStatus::Skipped:
            ++result_.skipped;
            if (metrics) metrics->objects_skipped().Increment();
            break;
        case ObjectStatus::Failed:
            ++result_.failed;
            result_.failures.push_back(outcome);
            if (metrics) {
                if (outcome.failure == FailureKind::AlreadyExists) {
                    metrics->objects_exists().Increment();
                } else {
                    metrics->objects_failed().Increment();
                }
            }
            break;
    }
}

ExitStatus MirrorEngine::fail(ExitStatus status, const std::string& message) {
    state_ = RunState::Failed;
    result_.fatal_error = message;
    if (options_.metrics) options_.metrics->run_failed().Set(1);
    *options_.report << "ERROR: " << message << std::endl;
    return status;
}

void MirrorEngine::report_summary() {
    *options_.report << "Mirrored " << result_.listed << " objects: "
                     << result_.downloaded << " downloaded, "
                     << result_.skipped << " skipped, "
                     << result_.failed << " failed ("
                     << result_.bytes_downloaded << " bytes)" << std::endl;
}

} // namespace blobmirror
