#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace blobmirror {

// An object as reported by a container listing
struct RemoteObject {
    std::string name;
    uint64_t size = 0;
    std::string etag;
    std::string content_type;
};

// Result of fetching one object into a local file
struct FetchResult {
    bool success = false;
    uint64_t bytes_written = 0;
    int status_code = 0;            // Service status, 0 if no response was received
    bool is_network_error = false;  // Connection/transfer failure rather than a service reply
    std::string error_message;
};

// Fatal storage condition: the listing cannot start or cannot continue.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

// Single-pass, pull-based sequence of remote objects.
// The next page is only requested from the service once the current one is consumed.
class ObjectCursor {
public:
    virtual ~ObjectCursor() = default;

    // Next object, or nullopt once the listing is exhausted.
    // Throws StorageError if the service cannot be queried.
    virtual std::optional<RemoteObject> next() = 0;
};

// Capability: enumerate the objects of a container
class ObjectLister {
public:
    virtual ~ObjectLister() = default;

    // Start a new listing. May throw StorageError (e.g. credentials rejected).
    virtual std::unique_ptr<ObjectCursor> list() = 0;
};

// Capability: write one object's content to a local file
class ObjectFetcher {
public:
    virtual ~ObjectFetcher() = default;

    // Stream object `name` into `destination`, which must not exist yet.
    // Transport failures are reported in the result, not thrown.
    virtual FetchResult fetch(const std::string& name,
                              const std::filesystem::path& destination) = 0;
};

} // namespace blobmirror
