#include "blobmirror/storage/azure_backend.hpp"
#include "blobmirror/log.hpp"
#include "blobmirror/net/http_client.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <map>
#include <stdexcept>

namespace blobmirror {

namespace {

constexpr const char* AZURE_API_VERSION = "2020-10-02";

// Well-known Azurite / storage emulator credentials
constexpr const char* DEV_ACCOUNT_NAME = "devstoreaccount1";
constexpr const char* DEV_ACCOUNT_KEY =
    "Eby8vdM02xNOcqFlqUwJPLlmEtlCDXJ1OUzFT50uSRZ6IFsuFq2UVErCz4I6tq/K1SZFPTOtr/KBHBeksoGMGw==";
constexpr const char* DEV_BLOB_ENDPOINT = "http://127.0.0.1:10000/devstoreaccount1";

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Percent-encode each path segment while preserving '/' as separators.
std::string url_encode_path(const std::string& path) {
    std::string result;
    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (start > 0) {
            result += '/';
        }
        result += net::url_encode(path.substr(start, slash - start));
        start = slash + 1;
    }
    return result;
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         result.data(), &len);
    result.resize(len);
    return result;
}

}  // namespace

// ============================================================================
// XML parsing helpers for List Blobs / error responses
// ============================================================================

namespace xml {

struct Element {
    std::string attributes;    // Raw text between the tag name and '>'
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;    // Position after the closing tag
};

// Find <tag ...>content</tag> or <tag ... /> at or after start_pos.
// "<Blob" does not match "<BlobPrefix".
std::optional<Element> find_element(const std::string& xml, const std::string& tag,
                                    size_t start_pos = 0) {
    std::string open_tag = "<" + tag;
    std::string close_tag = "</" + tag + ">";

    size_t pos = start_pos;
    while (true) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) return std::nullopt;

        size_t after = start + open_tag.size();
        if (after >= xml.size()) return std::nullopt;
        char c = xml[after];
        if (c != '>' && c != '/' && !std::isspace(static_cast<unsigned char>(c))) {
            pos = after;
            continue;
        }

        size_t tag_end = xml.find('>', after);
        if (tag_end == std::string::npos) return std::nullopt;

        Element element;
        if (xml[tag_end - 1] == '/') {
            element.attributes = xml.substr(after, tag_end - 1 - after);
            element.content_start = element.content_end = tag_end + 1;
            element.element_end = tag_end + 1;
            return element;
        }

        element.attributes = xml.substr(after, tag_end - after);
        element.content_start = tag_end + 1;
        size_t end = xml.find(close_tag, element.content_start);
        if (end == std::string::npos) return std::nullopt;
        element.content_end = end;
        element.element_end = end + close_tag.size();
        return element;
    }
}

std::string content_of(const std::string& xml, const Element& e) {
    return xml.substr(e.content_start, e.content_end - e.content_start);
}

// Value of <tag>value</tag>, empty if not found
std::string get_element(const std::string& xml, const std::string& tag) {
    auto e = find_element(xml, tag);
    return e ? content_of(xml, *e) : std::string();
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) {
                result += '<';
                i += 4;
            } else if (s.compare(i, 4, "&gt;") == 0) {
                result += '>';
                i += 4;
            } else if (s.compare(i, 5, "&amp;") == 0) {
                result += '&';
                i += 5;
            } else if (s.compare(i, 6, "&quot;") == 0) {
                result += '"';
                i += 6;
            } else if (s.compare(i, 6, "&apos;") == 0) {
                result += '\'';
                i += 6;
            } else if (s.compare(i, 2, "&#") == 0) {
                // Numeric character reference (ASCII range only)
                size_t semi = s.find(';', i);
                bool hex = i + 2 < s.size() && (s[i + 2] == 'x' || s[i + 2] == 'X');
                size_t digits = i + (hex ? 3 : 2);
                unsigned long code = 0;
                bool parsed = false;
                if (semi != std::string::npos && semi > digits) {
                    try {
                        code = std::stoul(s.substr(digits, semi - digits), nullptr, hex ? 16 : 10);
                        parsed = code < 0x80;
                    } catch (const std::exception&) {
                        parsed = false;
                    }
                }
                if (parsed) {
                    result += static_cast<char>(code);
                    i = semi + 1;
                } else {
                    result += s[i++];
                }
            } else {
                // Unknown entity, keep as-is
                result += s[i++];
            }
        } else {
            result += s[i++];
        }
    }

    return result;
}

} // namespace xml

ListPage parse_list_blobs_response(const std::string& body) {
    ListPage page;
    page.next_marker = xml::decode_entities(xml::get_element(body, "NextMarker"));

    size_t pos = 0;
    while (auto blob = xml::find_element(body, "Blob", pos)) {
        pos = blob->element_end;
        std::string content = xml::content_of(body, *blob);

        auto name_el = xml::find_element(content, "Name");
        if (!name_el) continue;

        RemoteObject object;
        object.name = xml::decode_entities(xml::content_of(content, *name_el));
        // Names with characters invalid in XML 1.0 are sent percent-encoded
        if (name_el->attributes.find("Encoded=\"true\"") != std::string::npos) {
            object.name = net::url_decode(object.name);
        }

        std::string props = xml::get_element(content, "Properties");
        if (!props.empty()) {
            std::string size_str = xml::get_element(props, "Content-Length");
            if (!size_str.empty()) {
                try {
                    object.size = std::stoull(size_str);
                } catch (const std::exception&) {
                    object.size = 0;
                }
            }
            object.etag = xml::decode_entities(xml::get_element(props, "Etag"));
            object.content_type = xml::decode_entities(xml::get_element(props, "Content-Type"));
        }

        page.objects.push_back(std::move(object));
    }

    return page;
}

std::string parse_error_response(const std::string& body) {
    std::string code = xml::decode_entities(xml::get_element(body, "Code"));
    std::string message = xml::decode_entities(xml::get_element(body, "Message"));
    // Messages carry "RequestId:... Time:..." on following lines
    auto newline = message.find('\n');
    if (newline != std::string::npos) {
        message = trim(message.substr(0, newline));
    }
    if (code.empty()) return message;
    if (message.empty()) return code;
    return code + ": " + message;
}

// ============================================================================
// AzureConnectionInfo
// ============================================================================

AzureConnectionInfo AzureConnectionInfo::parse(const std::string& connection_string) {
    std::map<std::string, std::string> fields;

    size_t pos = 0;
    while (pos < connection_string.size()) {
        auto semi = connection_string.find(';', pos);
        if (semi == std::string::npos) semi = connection_string.size();
        std::string pair = connection_string.substr(pos, semi - pos);
        pos = semi + 1;

        // Values may contain '=' (base64 padding, SAS signatures)
        auto eq = pair.find('=');
        if (eq == std::string::npos) continue;
        std::string key = to_lower(trim(pair.substr(0, eq)));
        if (!key.empty()) {
            fields[key] = trim(pair.substr(eq + 1));
        }
    }

    auto field = [&](const char* key) -> std::string {
        auto it = fields.find(key);
        return it != fields.end() ? it->second : std::string();
    };

    AzureConnectionInfo info;

    if (to_lower(field("usedevelopmentstorage")) == "true") {
        info.account_name = DEV_ACCOUNT_NAME;
        info.account_key = DEV_ACCOUNT_KEY;
        info.blob_endpoint = DEV_BLOB_ENDPOINT;
        return info;
    }

    info.account_name = field("accountname");
    info.account_key = field("accountkey");
    info.sas_token = field("sharedaccesssignature");
    if (!info.sas_token.empty() && info.sas_token.front() == '?') {
        info.sas_token.erase(0, 1);
    }

    info.blob_endpoint = field("blobendpoint");
    if (info.blob_endpoint.empty()) {
        if (info.account_name.empty()) {
            throw std::invalid_argument(
                "connection string has neither AccountName nor BlobEndpoint");
        }
        std::string protocol = field("defaultendpointsprotocol");
        if (protocol.empty()) protocol = "https";
        std::string suffix = field("endpointsuffix");
        if (suffix.empty()) suffix = "core.windows.net";
        info.blob_endpoint = protocol + "://" + info.account_name + ".blob." + suffix;
    }
    while (!info.blob_endpoint.empty() && info.blob_endpoint.back() == '/') {
        info.blob_endpoint.pop_back();
    }

    if (info.account_key.empty() && info.sas_token.empty()) {
        throw std::invalid_argument(
            "connection string has neither AccountKey nor SharedAccessSignature");
    }
    if (!info.account_key.empty() && info.account_name.empty()) {
        throw std::invalid_argument("connection string has AccountKey but no AccountName");
    }

    return info;
}

// ============================================================================
// AzureBlobContainer
// ============================================================================

class AzureBlobContainer::Cursor : public ObjectCursor {
public:
    explicit Cursor(AzureBlobContainer& container) : container_(container) {}

    std::optional<RemoteObject> next() override {
        while (index_ >= page_.objects.size()) {
            if (exhausted_) return std::nullopt;
            // The service may return an empty page with a continuation marker
            page_ = container_.list_page(page_.next_marker);
            index_ = 0;
            exhausted_ = page_.next_marker.empty();
        }
        return page_.objects[index_++];
    }

private:
    AzureBlobContainer& container_;
    ListPage page_;
    size_t index_ = 0;
    bool exhausted_ = false;
};

AzureBlobContainer::AzureBlobContainer(const Config& config)
    : config_(config) {
    net::HttpClientConfig http_config;
    http_config.user_agent = "blob-mirror-azure/1.0";
    http_config.verify_ssl = config_.verify_ssl;
    http_config.verbose = config_.verbose;
    http_client_ = std::make_unique<net::HttpClient>(http_config);
}

AzureBlobContainer::~AzureBlobContainer() = default;

std::unique_ptr<ObjectCursor> AzureBlobContainer::list() {
    return std::make_unique<Cursor>(*this);
}

ListPage AzureBlobContainer::list_page(const std::string& marker) {
    std::string url = container_url() + "?restype=container&comp=list";
    url += "&maxresults=" + std::to_string(config_.page_size);
    if (!marker.empty()) {
        url += "&marker=" + net::url_encode(marker);
    }

    net::HttpRequest request = net::HttpRequest::get(url);
    request.total_timeout = std::chrono::milliseconds(120000);
    add_common_headers(request);
    sign_request(request);

    auto response = http_client_->execute(request);

    if (!response.ok()) {
        std::string detail = response.error;
        if (detail.empty()) {
            detail = "HTTP " + std::to_string(response.status_code);
            std::string service = parse_error_response(response.body_string());
            if (!service.empty()) detail += " " + service;
        }
        throw StorageError("listing container '" + config_.container + "' failed: " + detail,
                           response.status_code);
    }

    auto page = parse_list_blobs_response(response.body_string());
    if (config_.verbose) {
        log_info("Listed %zu blobs from '%s'%s", page.objects.size(), config_.container.c_str(),
                 page.next_marker.empty() ? " (last page)" : "");
    }
    return page;
}

FetchResult AzureBlobContainer::fetch(const std::string& name,
                                      const std::filesystem::path& destination) {
    FetchResult result;

    net::HttpRequest request = net::HttpRequest::get(blob_url(name));
    add_common_headers(request);
    sign_request(request);

    auto response = http_client_->download(request, destination);

    result.status_code = response.status_code;
    result.is_network_error = response.is_network_error;
    result.bytes_written = response.bytes_written;

    if (!response.ok()) {
        result.success = false;
        if (!response.error.empty()) {
            result.error_message = response.error;
        } else {
            result.error_message = "HTTP " + std::to_string(response.status_code);
            std::string service = parse_error_response(response.body_string());
            if (service.empty()) {
                service = response.headers.get("x-ms-error-code").value_or("");
            }
            if (!service.empty()) result.error_message += " " + service;
        }
        return result;
    }

    result.success = true;
    return result;
}

std::string AzureBlobContainer::container_url() const {
    return config_.connection.blob_endpoint + "/" + config_.container;
}

std::string AzureBlobContainer::blob_url(const std::string& name) const {
    return container_url() + "/" + url_encode_path(name);
}

void AzureBlobContainer::add_common_headers(net::HttpRequest& request) const {
    // Azure requires x-ms-date and x-ms-version on all requests
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);
    char date_buf[128];
    strftime(date_buf, sizeof(date_buf), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);

    request.headers.set("x-ms-date", date_buf);
    request.headers.set("x-ms-version", AZURE_API_VERSION);
}

void AzureBlobContainer::sign_request(net::HttpRequest& request) const {
    const auto& conn = config_.connection;

    if (conn.account_key.empty()) {
        // SAS token auth: append query params
        auto& url = request.url;
        url += (url.find('?') != std::string::npos ? "&" : "?") + conn.sas_token;
        return;
    }

    auto signature = shared_key_signature(
        conn.account_key, shared_key_string_to_sign(request, conn.account_name));
    request.headers.set("Authorization", "SharedKey " + conn.account_name + ":" + signature);
}

// ============================================================================
// SharedKey signing
// ============================================================================

std::string shared_key_string_to_sign(const net::HttpRequest& request,
                                      const std::string& account_name) {
    // VERB\nContent-Encoding\nContent-Language\nContent-Length\nContent-MD5\n
    // Content-Type\nDate\nIf-Modified-Since\nIf-Match\nIf-None-Match\n
    // If-Unmodified-Since\nRange\nCanonicalizedHeaders\nCanonicalizedResource
    std::string string_to_sign = "GET\n";
    string_to_sign += "\n";  // Content-Encoding
    string_to_sign += "\n";  // Content-Language
    string_to_sign += "\n";  // Content-Length (empty for GET)
    string_to_sign += "\n";  // Content-MD5
    string_to_sign += request.headers.content_type().value_or("") + "\n";
    string_to_sign += "\n";  // Date (x-ms-date is used instead)
    string_to_sign += "\n";  // If-Modified-Since
    string_to_sign += request.headers.get("If-Match").value_or("") + "\n";
    string_to_sign += request.headers.get("If-None-Match").value_or("") + "\n";
    string_to_sign += "\n";  // If-Unmodified-Since
    string_to_sign += request.headers.get("x-ms-range").value_or(
                          request.headers.get("Range").value_or("")) + "\n";

    // Canonicalized x-ms- headers (HttpHeaders keeps names lower-cased and sorted)
    for (const auto& [name, value] : request.headers.all()) {
        if (name.rfind("x-ms-", 0) == 0) {
            string_to_sign += name + ":" + trim(value) + "\n";
        }
    }

    // Canonicalized resource: /account + encoded URI path
    std::string path;
    auto scheme_end = request.url.find("://");
    auto path_start = request.url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    auto qpos = request.url.find('?');
    if (path_start != std::string::npos && (qpos == std::string::npos || path_start < qpos)) {
        path = request.url.substr(path_start, qpos == std::string::npos
                                                  ? std::string::npos
                                                  : qpos - path_start);
    }
    string_to_sign += "/" + account_name + path;

    // Query parameters, names lower-cased and sorted, values decoded
    if (qpos != std::string::npos) {
        std::string query = request.url.substr(qpos + 1);
        std::map<std::string, std::string> params;
        size_t pos = 0;
        while (pos < query.size()) {
            auto amp = query.find('&', pos);
            std::string param = (amp != std::string::npos) ? query.substr(pos, amp - pos)
                                                           : query.substr(pos);
            auto eq = param.find('=');
            if (eq != std::string::npos) {
                params[to_lower(net::url_decode(param.substr(0, eq)))] =
                    net::url_decode(param.substr(eq + 1));
            } else {
                params[to_lower(net::url_decode(param))] = "";
            }
            pos = (amp != std::string::npos) ? amp + 1 : query.size();
        }
        for (const auto& [pname, pval] : params) {
            string_to_sign += "\n" + pname + ":" + pval;
        }
    }

    return string_to_sign;
}

std::string shared_key_signature(const std::string& account_key,
                                 const std::string& string_to_sign) {
    return net::base64_encode(hmac_sha256(net::base64_decode(account_key), string_to_sign));
}

} // namespace blobmirror
