#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace objgate::net {

// HTTP status codes used as protocol signals by the gateway
enum class HttpStatus {
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,
    MultipleChoices = 300,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    LengthRequired = 411,
    PreconditionFailed = 412,
    PayloadTooLarge = 413,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503
};

inline constexpr int status_code(HttpStatus s) { return static_cast<int>(s); }

bool is_success_status(int status);

// HTTP headers (case-insensitive). Names are stored lowercased.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return headers_.empty(); }

    // Iteration
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    /// Remove every header whose lowercased name satisfies pred.
    template <typename Pred>
    void remove_if(Pred pred) {
        for (auto it = headers_.begin(); it != headers_.end();) {
            if (pred(it->first)) {
                it = headers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Common headers
    void set_content_type(const std::string& content_type);
    void set_content_length(uint64_t length);

    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

    static std::string normalize_name(const std::string& name);

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

// Path decomposed as /<version>/<account>/<container>/<object>.
// Missing trailing segments are empty.
struct PathParts {
    std::string version;
    std::string account;
    std::string container;
    std::string object;
};

/// Split a request path into at least min_segs and at most max_segs
/// segments. With rest_with_last, the final segment keeps any remaining
/// slashes (object names may contain '/'). Returns nullopt if the path
/// does not have the required shape.
std::optional<PathParts> split_path(const std::string& path,
                                    int min_segs,
                                    int max_segs,
                                    bool rest_with_last = false);

// Inbound request as seen by a pipeline stage.
struct Request {
    std::string method = "GET";
    std::string path;    // URL-decoded, e.g. /v1/AUTH_test/c/o
    std::string query;   // raw query string without '?'
    HttpHeaders headers;
    std::vector<uint8_t> body;

    /// Build a request from a method and a (possibly quoted) path with
    /// optional query string.
    static Request blank(const std::string& method, const std::string& path_qs);

    std::map<std::string, std::string> params() const;
    std::optional<std::string> param(const std::string& name) const;

    /// Declared body length: Content-Length header, else body size.
    uint64_t content_length() const;

    void set_body(std::vector<uint8_t> data);
    void set_body(const std::string& data);

    std::string body_string() const;
};

// Buffered response of a pipeline stage or sub-request.
struct Response {
    int status = 200;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status); }

    /// Content-Length header when present. Without one, a chunked transfer
    /// is indeterminate (nullopt) and anything else is the buffered size.
    std::optional<uint64_t> content_length() const;

    std::string body_string() const;

    std::optional<std::string> etag() const { return headers.get("ETag"); }

    /// Response with a text body and matching Content-Length.
    static Response make(int status, const std::string& body = "",
                         const std::string& content_type = "text/plain");
};

// URL encoding/decoding
std::string url_encode(const std::string& str);   // encodes '/' too
std::string url_quote(const std::string& str);    // keeps '/' intact
std::string url_decode(const std::string& str);

/// Case-insensitive prefix test on a header name.
bool has_prefix_ci(const std::string& name, const std::string& prefix);

/// True for the usual config spellings of true: "true", "1", "yes", "on", "t", "y".
bool config_true_value(const std::string& value);

}  // namespace objgate::net
