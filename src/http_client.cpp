#include "blobmirror/net/http_client.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace blobmirror::net {

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                decoded += static_cast<char>((h1 << 4) | h2);
                i += 2;
                continue;
            }
            // Invalid hex sequence: keep the literal '%'
        }
        decoded += str[i];
    }

    return decoded;
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < data.size()) {
        uint32_t octet_a = i < data.size() ? data[i++] : 0;
        uint32_t octet_b = i < data.size() ? data[i++] : 0;
        uint32_t octet_c = i < data.size() ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += (i > data.size() + 1) ? '=' : base64_chars[(triple >> 6) & 0x3F];
        result += (i > data.size()) ? '=' : base64_chars[triple & 0x3F];
    }

    return result;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> result;
    result.reserve(encoded.size() * 3 / 4);

    std::vector<int> decode_table(256, -1);
    for (int i = 0; i < 64; ++i) {
        decode_table[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    uint32_t val = 0;
    int bits = 0;

    for (char c : encoded) {
        if (c == '=' || c == '\n' || c == '\r') continue;
        if (decode_table[static_cast<unsigned char>(c)] < 0) continue;

        val = (val << 6) | decode_table[static_cast<unsigned char>(c)];
        bits += 6;

        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
        }
    }

    return result;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Bounded in-memory accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

// Streams 2xx bodies to a file; anything else is kept as the error body.
struct FileWriteContext {
    CURL* curl = nullptr;
    FILE* file = nullptr;
    std::vector<uint8_t>* error_body = nullptr;
    size_t max_error_size = 0;
    uint64_t bytes_written = 0;
    bool write_failed = false;
    int write_errno = 0;
};

static size_t file_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FileWriteContext*>(userdata);
    size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);

    if (!is_success_status(static_cast<int>(status))) {
        size_t room = ctx->max_error_size > ctx->error_body->size()
            ? ctx->max_error_size - ctx->error_body->size() : 0;
        size_t keep = std::min(room, bytes);
        ctx->error_body->insert(ctx->error_body->end(), ptr, ptr + keep);
        return bytes;
    }

    if (std::fwrite(ptr, 1, bytes, ctx->file) != bytes) {
        ctx->write_failed = true;
        ctx->write_errno = errno;
        return 0;
    }
    ctx->bytes_written += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // Skip empty lines and status line
    if (line.empty() || line.starts_with("HTTP/")) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        if (start != std::string::npos) {
            value = value.substr(start);
        }

        headers->add(name, value);
    }

    return bytes;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        curl_ = curl_easy_init();
    }

    ~Impl() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;
        if (!prepare(request, response)) {
            return response;
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &write_ctx);

        CURLcode res = curl_easy_perform(curl_);

        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        finish();
        return response;
    }

    HttpResponse download(const HttpRequest& request, const std::filesystem::path& destination) {
        HttpResponse response;

        // "x" = O_EXCL: never truncate a file that appeared since the caller checked
        FILE* file = std::fopen(destination.c_str(), "wbx");
        if (!file) {
            int err = errno;
            response.error = (err == EEXIST)
                ? "destination already exists: " + destination.string()
                : "cannot create " + destination.string() + ": " + std::strerror(err);
            return response;
        }

        if (!prepare(request, response)) {
            std::fclose(file);
            remove_partial(destination);
            return response;
        }

        FileWriteContext ctx;
        ctx.curl = curl_;
        ctx.file = file;
        ctx.error_body = &response.body;
        ctx.max_error_size = 64 * 1024;
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, file_write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &ctx);

        CURLcode res = curl_easy_perform(curl_);
        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
        response.bytes_written = ctx.bytes_written;

        bool close_failed = std::fclose(file) != 0;

        if (res != CURLE_OK) {
            if (ctx.write_failed) {
                response.error = "write to " + destination.string() + " failed: " +
                                 std::strerror(ctx.write_errno);
            } else {
                response.error = curl_easy_strerror(res);
                response.is_network_error = true;
            }
        } else if (close_failed) {
            response.error = "closing " + destination.string() + " failed";
        }

        finish();

        if (!response.ok()) {
            remove_partial(destination);
        }
        return response;
    }

private:
    bool prepare(const HttpRequest& request, HttpResponse& response) {
        if (!curl_) {
            response.error = "Failed to initialize libcurl handle";
            response.is_network_error = true;
            return false;
        }

        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());

        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        // Blob names may contain "." and ".." segments; send them unchanged
        curl_easy_setopt(curl_, CURLOPT_PATH_AS_IS, 1L);

        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list_ = curl_slist_append(headers_list_, header.c_str());
        }
        if (headers_list_) {
            curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_list_);
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl_, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));

        if (config_.verify_ssl) {
            curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            static bool ssl_warning_shown = false;
            if (!ssl_warning_shown) {
                std::cerr << "SECURITY WARNING: SSL verification disabled via configuration.\n"
                          << "This exposes connections to man-in-the-middle attacks.\n";
                ssl_warning_shown = true;
            }
            curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 10L);

        if (config_.verbose) {
            curl_easy_setopt(curl_, CURLOPT_VERBOSE, 1L);
        }
        return true;
    }


    void finish() {
        if (headers_list_) {
            curl_slist_free_all(headers_list_);
            headers_list_ = nullptr;
        }
    }

    static void remove_partial(const std::filesystem::path& destination) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
    }

    HttpClientConfig config_;
    CURL* curl_ = nullptr;
    struct curl_slist* headers_list_ = nullptr;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::download(const HttpRequest& request,
                                  const std::filesystem::path& destination) {
    return impl_->download(request, destination);
}

}  // namespace blobmirror::net
