#include "blobmirror/mirror/path_sanitizer.hpp"

#include <cstring>

namespace blobmirror {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

}  // namespace

SanitizedPath::SanitizedPath(std::vector<std::string> segments)
    : segments_(std::move(segments)) {
    for (const auto& segment : segments_) {
        if (!joined_.empty()) joined_ += '/';
        joined_ += segment;
    }
}

std::filesystem::path SanitizedPath::resolve(const std::filesystem::path& root) const {
    std::filesystem::path result = root;
    for (const auto& segment : segments_) {
        result /= segment;
    }
    return result;
}

bool is_illegal_filename_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F) return true;
    return std::strchr("<>:\"/\\|?*", c) != nullptr;
}

std::string sanitize_segment(const std::string& segment) {
    std::string part = trim(segment);

    std::string cleaned;
    cleaned.reserve(part.size());
    for (char c : part) {
        cleaned += is_illegal_filename_char(c) ? '_' : c;
    }

    // "." and ".." would address the current or parent directory
    if (!cleaned.empty() && cleaned.find_first_not_of('.') == std::string::npos) {
        cleaned.assign(cleaned.size(), '_');
    }

    return trim(cleaned);
}

std::optional<SanitizedPath> sanitize_blob_name(const std::string& name) {
    std::vector<std::string> segments;

    size_t start = 0;
    while (start <= name.size()) {
        size_t slash = name.find('/', start);
        if (slash == std::string::npos) slash = name.size();

        auto segment = sanitize_segment(name.substr(start, slash - start));
        if (!segment.empty()) {
            segments.push_back(std::move(segment));
        }
        start = slash + 1;
    }

    if (segments.empty()) {
        return std::nullopt;
    }
    return SanitizedPath(std::move(segments));
}

} // namespace blobmirror
