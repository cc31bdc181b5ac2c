#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blobmirror::net {

bool is_success_status(int status);

/// Percent-encode everything except RFC 3986 unreserved characters.
std::string url_encode(const std::string& str);

/// Decode %XX sequences. '+' is left untouched (Azure names are path-encoded).
std::string url_decode(const std::string& str);

std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& encoded);

/// Case-insensitive header map. Names are stored lower-cased.
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    std::vector<HeaderPair> all() const;

    std::optional<std::string> content_type() const;

private:
    static std::string normalize_name(const std::string& name);

    std::map<std::string, std::vector<std::string>> headers_;
};

// Every request the mirror issues is a GET
struct HttpRequest {
    std::string url;
    HttpHeaders headers;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{0};  // 0 = no overall limit (large blobs)

    static HttpRequest get(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;   // error body only, for downloads
    uint64_t bytes_written = 0;  // downloads: bytes streamed to the file
    std::string error;
    bool is_network_error = false;

    bool ok() const { return error.empty() && is_success_status(status_code); }
    std::string body_string() const;
};

struct HttpClientConfig {
    std::string user_agent = "blob-mirror/1.0";
    bool verify_ssl = true;
    size_t max_response_size = 64 * 1024 * 1024;  // For in-memory responses
    bool verbose = false;
};

/// Synchronous libcurl client. One easy handle is reused across requests, so an
/// instance must not be shared between threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Execute a request, buffering the response body in memory.
    HttpResponse execute(const HttpRequest& request);

    /// Execute a GET and stream a 2xx body into `destination`.
    ///
    /// The destination is created exclusively: if it already exists nothing is
    /// written and the response carries an error. On any failure the partially
    /// written file is removed. Non-2xx bodies are kept in `response.body`.
    HttpResponse download(const HttpRequest& request,
                          const std::filesystem::path& destination);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace blobmirror::net
