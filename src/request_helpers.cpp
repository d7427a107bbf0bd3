#include "objgate/request_helpers.hpp"

#include <algorithm>
#include <cctype>

namespace objgate {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string user_meta_prefix(const std::string& server_type) {
    return "x-" + to_lower(server_type) + "-meta-";
}

std::string sys_meta_prefix(const std::string& server_type) {
    return "x-" + to_lower(server_type) + "-sysmeta-";
}

net::Response precondition_failed(const std::string& body) {
    return net::Response::make(net::status_code(net::HttpStatus::PreconditionFailed), body);
}

}  // namespace

bool is_user_meta(const std::string& server_type, const std::string& key) {
    auto prefix = user_meta_prefix(server_type);
    return key.size() > prefix.size() && net::has_prefix_ci(key, prefix);
}

bool is_sys_meta(const std::string& server_type, const std::string& key) {
    auto prefix = sys_meta_prefix(server_type);
    return key.size() > prefix.size() && net::has_prefix_ci(key, prefix);
}

bool is_sys_or_user_meta(const std::string& server_type, const std::string& key) {
    return is_user_meta(server_type, key) || is_sys_meta(server_type, key);
}

std::map<std::string, std::string> get_sysmeta(const net::HttpHeaders& headers,
                                               const std::string& server_type) {
    std::map<std::string, std::string> sysmeta;
    auto prefix = sys_meta_prefix(server_type);
    for (const auto& [name, value] : headers.all()) {
        if (is_sys_meta(server_type, name)) {
            sysmeta[to_lower(name.substr(prefix.size()))] = value;
        }
    }
    return sysmeta;
}

void copy_headers_into(const net::HttpHeaders& from, net::HttpHeaders& to) {
    for (const auto& [name, value] : from.all()) {
        if (is_sys_or_user_meta("object", name) || name == "x-delete-at") {
            to.set(name, value);
        }
    }
}

PathHeaderResult check_path_header(const std::string& header_value,
                                   const std::string& header_name) {
    PathHeaderResult result;

    std::string path = net::url_decode(header_value);
    if (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }

    size_t slash = path.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= path.size()) {
        result.error = precondition_failed(
            header_name + " header must be of the form <container name>/<object name>");
        return result;
    }

    result.value = ContainerObject{path.substr(0, slash), path.substr(slash + 1)};
    return result;
}

AccountResult check_account_format(const std::string& header_value) {
    AccountResult result;

    std::string account = net::url_decode(header_value);
    if (account.empty()) {
        result.error = precondition_failed("Account name cannot be empty");
        return result;
    }
    if (account.find('/') != std::string::npos) {
        result.error = precondition_failed("Account name cannot contain slashes");
        return result;
    }

    result.account = account;
    return result;
}

}  // namespace objgate
