#pragma once

#include "objgate/net/http.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objgate::net {

// Remote source drivers only read
enum class HttpMethod {
    GET,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

// Outbound HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Timeouts
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    static HttpRequest get(const std::string& url);
};

// Outbound HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

struct HttpClientConfig {
    // Default timeouts (total can be overridden by OBJGATE_REQUEST_TIMEOUT)
    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_total_timeout{300000};

    // Response size limit (0 = unlimited). Migrated objects are buffered whole.
    size_t max_response_size = 5ULL * 1024 * 1024 * 1024 + 2;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "objgate/1.0";

    bool verbose = false;
};

// Synchronous libcurl client. One easy handle per request.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    HttpResponse execute(const HttpRequest& request);

    /// True when the linked libcurl can speak the given protocol ("http", "https").
    static bool supports_protocol(const std::string& protocol);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS Signature Version 4 request signing
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    void sign(HttpRequest& request) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;

    int effective_port() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

}  // namespace objgate::net
