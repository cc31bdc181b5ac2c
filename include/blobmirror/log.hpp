#pragma once

namespace blobmirror {

// printf-style line logging: info to stdout, errors to stderr with "ERROR: " prefix.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace blobmirror
