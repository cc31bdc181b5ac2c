#pragma once

#include "blobmirror/storage/backend.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace blobmirror {

namespace net {
class HttpClient;
struct HttpRequest;
}

// Credentials and endpoint extracted from an Azure storage connection string
struct AzureConnectionInfo {
    std::string account_name;
    std::string account_key;      // Base64 SharedKey
    std::string sas_token;        // Without leading '?'
    std::string blob_endpoint;    // e.g. https://acct.blob.core.windows.net (no trailing '/')

    /// Parse "Key=Value;Key=Value" connection strings, including
    /// "UseDevelopmentStorage=true". Throws std::invalid_argument on
    /// strings without usable account and credential information.
    static AzureConnectionInfo parse(const std::string& connection_string);
};

// One page of a container listing
struct ListPage {
    std::vector<RemoteObject> objects;
    std::string next_marker;     // Empty on the last page
};

/// Parse an EnumerationResults body from List Blobs.
ListPage parse_list_blobs_response(const std::string& xml);

/// Extract "Code: Message" from an Azure error body, or empty if none.
std::string parse_error_response(const std::string& xml);

/// SharedKey string-to-sign of a GET: x-ms-* headers, "/account" + URL path
/// exactly as sent, then sorted query parameters.
std::string shared_key_string_to_sign(const net::HttpRequest& request,
                                      const std::string& account_name);

/// Base64 HMAC-SHA256 of `string_to_sign` keyed with the base64 account key.
std::string shared_key_signature(const std::string& account_key,
                                 const std::string& string_to_sign);

// Azure Blob Storage container exposed as lister + fetcher.
class AzureBlobContainer : public ObjectLister, public ObjectFetcher {
public:
    struct Config {
        AzureConnectionInfo connection;
        std::string container;
        uint32_t page_size = 5000;    // Service maximum per List Blobs call
        bool verify_ssl = true;
        bool verbose = false;
    };

    explicit AzureBlobContainer(const Config& config);
    ~AzureBlobContainer() override;

    AzureBlobContainer(const AzureBlobContainer&) = delete;
    AzureBlobContainer& operator=(const AzureBlobContainer&) = delete;

    std::unique_ptr<ObjectCursor> list() override;

    FetchResult fetch(const std::string& name,
                      const std::filesystem::path& destination) override;

    /// Fetch one page starting at `marker`. Throws StorageError on failure.
    ListPage list_page(const std::string& marker);

    std::string container_url() const;
    std::string blob_url(const std::string& name) const;

private:
    class Cursor;

    void add_common_headers(net::HttpRequest& request) const;
    void sign_request(net::HttpRequest& request) const;

    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;
};

} // namespace blobmirror
