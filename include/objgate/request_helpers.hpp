#pragma once

#include "objgate/net/http.hpp"

#include <map>
#include <optional>
#include <string>

namespace objgate {

// Metadata header classification. `server_type` is "object", "container" or
// "account"; header names compare case-insensitively.
bool is_user_meta(const std::string& server_type, const std::string& key);
bool is_sys_meta(const std::string& server_type, const std::string& key);
bool is_sys_or_user_meta(const std::string& server_type, const std::string& key);

/// System metadata of `server_type` as a map keyed by the lowercased name
/// with the X-<Type>-Sysmeta- prefix stripped ("migration-active").
std::map<std::string, std::string> get_sysmeta(const net::HttpHeaders& headers,
                                               const std::string& server_type);

/// Object sys/user metadata and X-Delete-At, copied from one header set
/// into another, replacing existing values.
void copy_headers_into(const net::HttpHeaders& from, net::HttpHeaders& to);

/// Container and object named by a path-valued header such as X-Copy-From
/// or Destination.
struct ContainerObject {
    std::string container;
    std::string object;
};

/// Decode and split a "<container>/<object>" header value (leading '/'
/// optional). On failure `error` holds the 412 to send back.
struct PathHeaderResult {
    std::optional<ContainerObject> value;
    std::optional<net::Response> error;
};
PathHeaderResult check_path_header(const std::string& header_value,
                                   const std::string& header_name);

/// Decode an account header value; must be non-empty and slash-free.
struct AccountResult {
    std::optional<std::string> account;
    std::optional<net::Response> error;
};
AccountResult check_account_format(const std::string& header_value);

}  // namespace objgate
