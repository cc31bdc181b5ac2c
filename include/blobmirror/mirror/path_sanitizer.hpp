#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blobmirror {

/// Filesystem-safe relative path derived from a blob name.
///
/// Always holds at least one segment. Segments never contain a separator,
/// a control character or one of <>:"\|?*, never start or end with
/// whitespace, and are never "." or "..".
class SanitizedPath {
public:
    explicit SanitizedPath(std::vector<std::string> segments);

    const std::vector<std::string>& segments() const { return segments_; }

    /// Segments joined with '/'.
    const std::string& str() const { return joined_; }

    /// Resolve below `root` with path joining, one segment at a time.
    std::filesystem::path resolve(const std::filesystem::path& root) const;

    bool operator==(const SanitizedPath& other) const { return segments_ == other.segments_; }

private:
    std::vector<std::string> segments_;
    std::string joined_;
};

/// True for characters that are replaced with '_' in path segments.
bool is_illegal_filename_char(char c);

/// Clean a single path segment: trim, substitute illegal characters, trim again.
/// Dot-only segments have every dot substituted. May return an empty string.
std::string sanitize_segment(const std::string& segment);

/// Map a blob name to a relative path. Returns nullopt when every segment is
/// empty after cleanup; such objects are skipped, not failed.
std::optional<SanitizedPath> sanitize_blob_name(const std::string& name);

} // namespace blobmirror
