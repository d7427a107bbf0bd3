#include "objgate/net/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace objgate::net {

// ============================================================================
// Status helpers
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

// ============================================================================
// URL encoding
// ============================================================================

namespace {

std::string percent_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

}  // namespace

std::string url_encode(const std::string& str) {
    return percent_encode(str, false);
}

std::string url_quote(const std::string& str) {
    return percent_encode(str, true);
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                int value = (h1 << 4) | h2;
                // Drop %00 so names cannot be truncated
                if (value == 0) {
                    i += 2;
                    continue;
                }
                decoded += static_cast<char>(value);
                i += 2;
                continue;
            }
        }
        decoded += str[i];
    }

    return decoded;
}

bool has_prefix_ci(const std::string& name, const std::string& prefix) {
    if (name.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(name[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool config_true_value(const std::string& value) {
    auto v = to_lower(value);
    return v == "true" || v == "1" || v == "yes" || v == "on" || v == "t" || v == "y";
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    return to_lower(name);
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::vector<std::string> HttpHeaders::get_all(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end()) {
        return it->second;
    }
    return {};
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
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

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_content_length(uint64_t length) {
    set("Content-Length", std::to_string(length));
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

// ============================================================================
// Path splitting
// ============================================================================

std::optional<PathParts> split_path(const std::string& path,
                                    int min_segs,
                                    int max_segs,
                                    bool rest_with_last) {
    if (path.empty() || path[0] != '/' || min_segs < 1 || max_segs > 4 ||
        min_segs > max_segs) {
        return std::nullopt;
    }

    std::vector<std::string> segs;
    size_t pos = 1;
    while (true) {
        if (rest_with_last && static_cast<int>(segs.size()) == max_segs - 1) {
            segs.push_back(path.substr(pos));
            break;
        }
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) {
            segs.push_back(path.substr(pos));
            break;
        }
        segs.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }

    int count = static_cast<int>(segs.size());
    if (count < min_segs || count > max_segs) {
        return std::nullopt;
    }
    // Required segments must be non-empty
    for (int i = 0; i < min_segs; ++i) {
        if (segs[i].empty()) return std::nullopt;
    }
    // Without rest_with_last a trailing empty optional segment is tolerated
    // only as the very last one ("/v1/a/c/")
    if (!rest_with_last) {
        for (int i = min_segs; i < count - 1; ++i) {
            if (segs[i].empty()) return std::nullopt;
        }
    }

    PathParts parts;
    std::string* fields[] = {&parts.version, &parts.account, &parts.container, &parts.object};
    for (int i = 0; i < count; ++i) {
        *fields[i] = segs[i];
    }
    return parts;
}

// ============================================================================
// Request
// ============================================================================

Request Request::blank(const std::string& method, const std::string& path_qs) {
    Request req;
    req.method = method;
    size_t q = path_qs.find('?');
    if (q == std::string::npos) {
        req.path = url_decode(path_qs);
    } else {
        req.path = url_decode(path_qs.substr(0, q));
        req.query = path_qs.substr(q + 1);
    }
    return req;
}

std::map<std::string, std::string> Request::params() const {
    std::map<std::string, std::string> result;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string pair = query.substr(pos, amp - pos);
        std::replace(pair.begin(), pair.end(), '+', ' ');
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }
        pos = amp + 1;
    }
    return result;
}

std::optional<std::string> Request::param(const std::string& name) const {
    auto p = params();
    auto it = p.find(name);
    if (it == p.end()) return std::nullopt;
    return it->second;
}

uint64_t Request::content_length() const {
    return headers.content_length().value_or(body.size());
}

void Request::set_body(std::vector<uint8_t> data) {
    body = std::move(data);
    headers.set_content_length(body.size());
}

void Request::set_body(const std::string& data) {
    set_body(std::vector<uint8_t>(data.begin(), data.end()));
}

std::string Request::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// Response
// ============================================================================

std::optional<uint64_t> Response::content_length() const {
    if (auto len = headers.content_length()) {
        return len;
    }
    auto te = headers.get("Transfer-Encoding");
    if (te && to_lower(*te).find("chunked") != std::string::npos) {
        return std::nullopt;
    }
    return body.size();
}

std::string Response::body_string() const {
    return std::string(body.begin(), body.end());
}

Response Response::make(int status, const std::string& body,
                        const std::string& content_type) {
    Response resp;
    resp.status = status;
    resp.body.assign(body.begin(), body.end());
    resp.headers.set_content_length(resp.body.size());
    if (!body.empty()) {
        resp.headers.set_content_type(content_type);
    }
    return resp;
}

}  // namespace objgate::net
