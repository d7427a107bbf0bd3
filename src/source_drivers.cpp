#include "objgate/source_driver.hpp"
#include "objgate/log.hpp"
#include "objgate/net/http_client.hpp"

#include <sys/stat.h>
#include <sys/xattr.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace objgate {

const char* driver_error_kind_name(DriverErrorKind kind) {
    switch (kind) {
        case DriverErrorKind::None: return "none";
        case DriverErrorKind::NotFound: return "not_found";
        case DriverErrorKind::Connection: return "connection";
        case DriverErrorKind::Unavailable: return "unavailable";
        case DriverErrorKind::InvalidParams: return "invalid_params";
        case DriverErrorKind::RemoteStatus: return "remote_status";
        case DriverErrorKind::Io: return "io";
        case DriverErrorKind::TooLarge: return "too_large";
    }
    return "unknown";
}

std::optional<uint64_t> max_object_size(const MigrationParams& params) {
    auto it = params.find(MAX_OBJECT_SIZE_PARAM);
    if (it == params.end()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        uint64_t value = std::stoull(it->second, &used);
        if (used == it->second.size()) {
            return value;
        }
    } catch (const std::exception& e) {
        log_warn("ignoring %s '%s': %s", MAX_OBJECT_SIZE_PARAM, it->second.c_str(), e.what());
        return std::nullopt;
    }
    log_warn("ignoring %s '%s': trailing characters", MAX_OBJECT_SIZE_PARAM,
             it->second.c_str());
    return std::nullopt;
}

namespace {

std::string param_or_empty(const MigrationParams& params, const std::string& key) {
    auto it = params.find(key);
    return it == params.end() ? std::string() : it->second;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool has_parent_component(const std::string& path) {
    for (const auto& part : std::filesystem::path(path)) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

// Rejects blank values and anything that could climb out of a root directory
bool is_valid_path(const std::string& path) {
    return !is_blank(path) && !has_parent_component(path);
}

// Whether lexically normal `path` lies at or below lexically normal `root`
bool is_within(const std::filesystem::path& root, const std::filesystem::path& path) {
    auto mismatch = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    return mismatch.first == root.end();
}

std::filesystem::path normal_directory(const std::filesystem::path& dir) {
    auto normal = dir.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

std::string strip_trailing_slashes(std::string s) {
    while (!s.empty() && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

}  // namespace

// ============================================================================
// Content type guessing
// ============================================================================

std::string guess_content_type(const std::string& name) {
    static const std::map<std::string, std::string> types = {
        {"bin", "application/octet-stream"},
        {"bz2", "application/x-bzip2"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"gif", "image/gif"},
        {"gz", "application/gzip"},
        {"htm", "text/html"},
        {"html", "text/html"},
        {"ico", "image/vnd.microsoft.icon"},
        {"jpeg", "image/jpeg"},
        {"jpg", "image/jpeg"},
        {"js", "application/javascript"},
        {"json", "application/json"},
        {"md", "text/markdown"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
        {"pdf", "application/pdf"},
        {"png", "image/png"},
        {"svg", "image/svg+xml"},
        {"tar", "application/x-tar"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"txt", "text/plain"},
        {"wav", "audio/x-wav"},
        {"webp", "image/webp"},
        {"xml", "application/xml"},
        {"yaml", "application/yaml"},
        {"zip", "application/zip"},
    };

    auto slash = name.rfind('/');
    auto dot = name.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }

    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = types.find(ext);
    return it == types.end() ? std::string() : it->second;
}

// ============================================================================
// SecureString - A string class that zeros memory on destruction
// Keeps remote store credentials from lingering after a migration attempt
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(const std::string& s) : data_(s) {}

    SecureString(const SecureString& other) : data_(other.data_) {}

    SecureString& operator=(const std::string& s) {
        clear();
        data_ = s;
        return *this;
    }

    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            clear();
            data_ = other.data_;
        }
        return *this;
    }

    ~SecureString() {
        clear();
    }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

    void clear() {
        if (!data_.empty()) {
            // volatile keeps the compiler from eliding the zeroing
            volatile char* p = const_cast<volatile char*>(data_.data());
            size_t len = data_.size();
            while (len--) {
                *p++ = 0;
            }
            data_.clear();
            data_.shrink_to_fit();
        }
    }

private:
    std::string data_;
};

// ============================================================================
// FileSystemSourceDriver - objects stored as plain files
// ============================================================================

class FileSystemSourceDriver : public SourceDriver {
public:
    FileSystemSourceDriver(const std::filesystem::path& data_source,
                           std::optional<uint64_t> max_object_size)
        : data_source_(normal_directory(data_source))
        , max_object_size_(max_object_size) {}

    std::string type_name() const override { return "fsystem"; }

    FetchResult get_object(const std::string& object_name) override {
        // An absolute name would replace the source directory when joined
        if (object_name.empty() || object_name.front() == '/' ||
            has_parent_component(object_name)) {
            return FetchResult::failure(DriverErrorKind::InvalidParams,
                                        "Invalid object name for file system source: " +
                                            object_name);
        }

        auto file_path = (data_source_ / object_name).lexically_normal();
        if (!is_within(data_source_, file_path)) {
            return FetchResult::failure(DriverErrorKind::InvalidParams,
                                        "Object name leaves the file system source: " +
                                            object_name);
        }

        struct stat st;
        if (::stat(file_path.c_str(), &st) != 0) {
            return FetchResult::failure(DriverErrorKind::NotFound,
                                        "Failed to access object in file system");
        }
        if (S_ISDIR(st.st_mode)) {
            return FetchResult::failure(DriverErrorKind::NotFound,
                                        "Object is a directory in file system");
        }
        if (max_object_size_ && static_cast<uint64_t>(st.st_size) > *max_object_size_) {
            auto result = FetchResult::failure(DriverErrorKind::TooLarge,
                                               "Object of " + std::to_string(st.st_size) +
                                                   " bytes exceeds the size limit");
            result.object.size = static_cast<uint64_t>(st.st_size);
            return result;
        }

        file_.open(file_path, std::ios::binary);
        if (!file_) {
            return FetchResult::failure(DriverErrorKind::Io,
                                        "Failed to open " + file_path.string());
        }

        FetchResult result;
        auto& obj = result.object;

        std::vector<uint8_t> data(static_cast<size_t>(st.st_size));
        file_.read(reinterpret_cast<char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return FetchResult::failure(DriverErrorKind::Io,
                                        "Failed to read " + file_path.string());
        }

        obj.metadata["uid"] = std::to_string(st.st_uid);
        obj.metadata["gid"] = std::to_string(st.st_gid);
        read_user_xattrs(file_path, obj.metadata);

        obj.size = static_cast<uint64_t>(st.st_size);
        obj.data = std::move(data);
        obj.content_type = guess_content_type(object_name);
        obj.timestamp = static_cast<double>(st.st_mtim.tv_sec) +
                        static_cast<double>(st.st_mtim.tv_nsec) / 1e9;

        result.success = true;
        return result;
    }

    void finalize() override {
        if (file_.is_open()) {
            file_.close();
        }
    }

private:
    // user.* extended attributes, prefix stripped. Filesystems without xattr
    // support simply contribute nothing.
    static void read_user_xattrs(const std::filesystem::path& path,
                                 std::map<std::string, std::string>& metadata) {
        ssize_t list_size = ::listxattr(path.c_str(), nullptr, 0);
        if (list_size <= 0) {
            return;
        }

        std::vector<char> names(static_cast<size_t>(list_size));
        list_size = ::listxattr(path.c_str(), names.data(), names.size());
        if (list_size <= 0) {
            return;
        }

        const std::string prefix = "user.";
        size_t pos = 0;
        while (pos < static_cast<size_t>(list_size)) {
            std::string name(names.data() + pos);
            pos += name.size() + 1;
            if (name.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }

            ssize_t value_size = ::getxattr(path.c_str(), name.c_str(), nullptr, 0);
            if (value_size < 0) {
                continue;
            }
            std::string value(static_cast<size_t>(value_size), '\0');
            if (value_size > 0) {
                value_size = ::getxattr(path.c_str(), name.c_str(), value.data(), value.size());
                if (value_size < 0) {
                    continue;
                }
                value.resize(static_cast<size_t>(value_size));
            }
            metadata[name.substr(prefix.size())] = value;
        }
    }

    std::filesystem::path data_source_;
    std::optional<uint64_t> max_object_size_;
    std::ifstream file_;
};

// ============================================================================
// SwiftSourceDriver - objects in a remote Swift-compatible store
// ============================================================================

class SwiftSourceDriver : public SourceDriver {
public:
    struct Config {
        std::string container;
        std::string token_url;
        std::string user;
        SecureString key;
        std::optional<uint64_t> max_object_size;
    };

    explicit SwiftSourceDriver(const Config& config)
        : config_(config) {
        net::HttpClientConfig http_config;
        http_config.user_agent = "objgate-swift/1.0";
        if (config.max_object_size) {
            http_config.max_response_size = static_cast<size_t>(*config.max_object_size);
        }
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "swift"; }

    FetchResult get_object(const std::string& object_name) override {
        if (auto auth_error = authenticate()) {
            return *auth_error;
        }

        std::string url = strip_trailing_slashes(storage_url_) + "/" +
                          net::url_quote(config_.container) + "/" +
                          net::url_quote(object_name);

        net::HttpRequest request = net::HttpRequest::get(url);
        request.headers.set("X-Auth-Token", token_.str());
        // Keeps a migrating remote proxy from chaining into its own source
        request.headers.set("X-Container-Migration-Provider", "swift");

        auto response = http_client_->execute(request);
        if (response.is_network_error) {
            return FetchResult::failure(DriverErrorKind::Connection,
                                        "Connection failed to " + storage_url_ + ": " +
                                            response.error);
        }
        if (response.status_code == net::status_code(net::HttpStatus::NotFound)) {
            return FetchResult::failure(DriverErrorKind::NotFound,
                                        "Object not found in remote container " +
                                            config_.container);
        }
        if (response.status_code == net::status_code(net::HttpStatus::PayloadTooLarge)) {
            return FetchResult::failure(DriverErrorKind::TooLarge, response.error);
        }
        if (!response.ok()) {
            return FetchResult::failure(DriverErrorKind::RemoteStatus,
                                        "Object GET failed: " + response.body_string());
        }

        FetchResult result;
        auto& obj = result.object;
        for (const auto& [name, value] : response.headers.all()) {
            if (net::has_prefix_ci(name, "x-object-meta-")) {
                obj.metadata[name] = value;
            }
        }
        obj.size = response.headers.content_length().value_or(response.body.size());
        obj.content_type = response.headers.content_type().value_or("");
        if (auto ts = response.headers.get("X-Timestamp")) {
            try {
                obj.timestamp = std::stod(*ts);
            } catch (const std::exception&) {
                log_warn("swift source returned unparseable X-Timestamp '%s'", ts->c_str());
            }
        }
        obj.data = std::move(response.body);

        result.success = true;
        return result;
    }

    void finalize() override {
        token_.clear();
        config_.key.clear();
    }

private:
    // Auth v1: credentials in, storage URL and token out
    std::optional<FetchResult> authenticate() {
        net::HttpRequest request = net::HttpRequest::get(config_.token_url);
        request.headers.set("X-Auth-User", config_.user);
        request.headers.set("X-Auth-Key", config_.key.str());

        auto response = http_client_->execute(request);
        if (response.is_network_error) {
            return FetchResult::failure(DriverErrorKind::Connection,
                                        "Auth request to " + config_.token_url +
                                            " failed: " + response.error);
        }
        if (!response.ok()) {
            return FetchResult::failure(DriverErrorKind::RemoteStatus,
                                        "Auth failed: HTTP " +
                                            std::to_string(response.status_code));
        }

        auto storage_url = response.headers.get("X-Storage-Url");
        auto token = response.headers.get("X-Auth-Token");
        if (!storage_url || !token) {
            return FetchResult::failure(DriverErrorKind::RemoteStatus,
                                        "Auth response lacks X-Storage-Url or X-Auth-Token");
        }

        storage_url_ = *storage_url;
        token_ = *token;
        return std::nullopt;
    }

    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;
    std::string storage_url_;
    SecureString token_;
};

// ============================================================================
// S3SourceDriver - objects in a remote S3-compatible bucket
// ============================================================================

class S3SourceDriver : public SourceDriver {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;  // Empty for AWS, custom for MinIO/etc
        SecureString access_key;
        SecureString secret_key;
        std::optional<uint64_t> max_object_size;
    };

    explicit S3SourceDriver(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3") {
        net::HttpClientConfig http_config;
        http_config.user_agent = "objgate-s3/1.0";
        if (config.max_object_size) {
            http_config.max_response_size = static_cast<size_t>(*config.max_object_size);
        }
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    FetchResult get_object(const std::string& object_name) override {
        net::HttpRequest request = net::HttpRequest::get(build_url(object_name));
        signer_.sign(request);

        auto response = http_client_->execute(request);
        if (response.is_network_error) {
            return FetchResult::failure(DriverErrorKind::Connection,
                                        "Connection failed to bucket " + config_.bucket +
                                            ": " + response.error);
        }
        if (response.status_code == net::status_code(net::HttpStatus::NotFound)) {
            return FetchResult::failure(DriverErrorKind::NotFound,
                                        "Object not found in bucket " + config_.bucket);
        }
        if (response.status_code == net::status_code(net::HttpStatus::PayloadTooLarge)) {
            return FetchResult::failure(DriverErrorKind::TooLarge, response.error);
        }
        if (!response.ok()) {
            return FetchResult::failure(DriverErrorKind::RemoteStatus,
                                        "Object GET failed: HTTP " +
                                            std::to_string(response.status_code));
        }

        FetchResult result;
        auto& obj = result.object;
        const std::string amz_meta = "x-amz-meta-";
        for (const auto& [name, value] : response.headers.all()) {
            if (net::has_prefix_ci(name, amz_meta)) {
                obj.metadata["X-Object-Meta-" + name.substr(amz_meta.size())] = value;
            }
        }
        obj.size = response.headers.content_length().value_or(response.body.size());
        obj.content_type = response.headers.content_type().value_or("");
        if (auto last_modified = response.headers.get("Last-Modified")) {
            obj.timestamp = parse_http_date(*last_modified);
        }
        obj.data = std::move(response.body);

        result.success = true;
        return result;
    }

    void finalize() override {
        config_.access_key.clear();
        config_.secret_key.clear();
    }

private:
    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = strip_trailing_slashes(config_.endpoint) + "/" + config_.bucket;
        } else {
            url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
        }
        return url + "/" + net::url_quote(key);
    }

    // RFC 1123 date ("Wed, 21 Oct 2015 07:28:00 GMT")
    static std::optional<double> parse_http_date(const std::string& value) {
        std::tm tm{};
        if (::strptime(value.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) {
            return std::nullopt;
        }
        return static_cast<double>(::timegm(&tm));
    }

    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

// ============================================================================
// SourceDriverFactory implementation
// ============================================================================

DriverCreateResult SourceDriverFactory::create_fsystem(const std::string& source,
                                                       const MigrationParams& params) {
    auto parent = params.find("driver_fsystem_parent_path");
    if (parent == params.end()) {
        return DriverCreateResult::failure(
            DriverErrorKind::InvalidParams,
            "driver_fsystem_parent_path parameter should be configured");
    }
    if (!is_valid_path(parent->second)) {
        return DriverCreateResult::failure(
            DriverErrorKind::InvalidParams,
            "driver_fsystem_parent_path: " + parent->second + " is invalid");
    }
    if (!is_valid_path(source)) {
        return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                           "Migration source " + source + " is invalid");
    }

    std::string relative = source;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }

    std::filesystem::path data_source = std::filesystem::path("/") / parent->second / relative;
    return DriverCreateResult::ok(
        std::make_unique<FileSystemSourceDriver>(data_source, max_object_size(params)));
}

DriverCreateResult SourceDriverFactory::create_swift(const std::string& source,
                                                     const MigrationParams& params) {
    if (!remote_available()) {
        return DriverCreateResult::failure(DriverErrorKind::Unavailable,
                                           "HTTP client cannot reach remote stores");
    }

    SwiftSourceDriver::Config config;
    config.container = source;
    config.token_url = param_or_empty(params, "token-url");
    config.user = param_or_empty(params, "user");
    config.key = param_or_empty(params, "key");
    config.max_object_size = max_object_size(params);

    if (is_blank(config.container)) {
        return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                           "Migration source is empty");
    }
    if (config.token_url.empty() || config.user.empty() || config.key.empty()) {
        return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                           "swift driver requires token-url, user and key");
    }

    return DriverCreateResult::ok(std::make_unique<SwiftSourceDriver>(config));
}

DriverCreateResult SourceDriverFactory::create_s3(const std::string& source,
                                                  const MigrationParams& params) {
    if (!remote_available()) {
        return DriverCreateResult::failure(DriverErrorKind::Unavailable,
                                           "HTTP client cannot reach remote stores");
    }

    S3SourceDriver::Config config;
    config.bucket = source;
    config.endpoint = param_or_empty(params, "endpoint");
    if (auto region = param_or_empty(params, "region"); !region.empty()) {
        config.region = region;
    }
    config.access_key = param_or_empty(params, "access-key");
    config.secret_key = param_or_empty(params, "secret-key");
    config.max_object_size = max_object_size(params);

    if (is_blank(config.bucket) || config.bucket.find('/') != std::string::npos) {
        return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                           "Migration source " + source +
                                               " is not a valid bucket name");
    }
    if (config.access_key.empty() || config.secret_key.empty()) {
        return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                           "s3 driver requires access-key and secret-key");
    }

    return DriverCreateResult::ok(std::make_unique<S3SourceDriver>(config));
}

bool SourceDriverFactory::remote_available() {
    return net::HttpClient::supports_protocol("http") ||
           net::HttpClient::supports_protocol("https");
}

std::map<std::string, DriverFactory> SourceDriverFactory::builtin_factories() {
    return {
        {"fsystem", DriverFactory{&SourceDriverFactory::create_fsystem, [] { return true; }}},
        {"swift", DriverFactory{&SourceDriverFactory::create_swift,
                                &SourceDriverFactory::remote_available}},
        {"s3", DriverFactory{&SourceDriverFactory::create_s3,
                             &SourceDriverFactory::remote_available}},
    };
}

}  // namespace objgate
