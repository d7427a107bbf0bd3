#include "objgate/migration.hpp"
#include "objgate/log.hpp"
#include "objgate/metrics.hpp"
#include "objgate/request_helpers.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <vector>

namespace objgate {

namespace {

constexpr const char* MIGRATION_TAG = "DM";
constexpr const char* SETUP_PREFIX = "X-Container-Migration-";
constexpr const char* SYSMETA_SETUP_PREFIX = "X-Container-Sysmeta-Migration-";
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

// Setup headers every migration needs, in the order they are reported missing
const char* const MANDATORY_FIELDS[] = {"Provider", "Source", "Active"};

double now_seconds() {
    return std::chrono::duration<double>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

std::string title_case(const std::string& key) {
    std::string result;
    result.reserve(key.size());
    bool prev_alpha = false;
    for (unsigned char c : key) {
        if (std::isalpha(c)) {
            result += static_cast<char>(prev_alpha ? std::tolower(c) : std::toupper(c));
            prev_alpha = true;
        } else {
            result += static_cast<char>(c);
            prev_alpha = false;
        }
    }
    return result;
}

std::string format_timestamp(double seconds) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%016.5f", seconds);
    return buf;
}

MigrationMiddleware::MigrationMiddleware(Handler& next,
                                         const DriverRegistry& registry,
                                         const ObjectConstraints& constraints,
                                         MetricsExporter* metrics)
    : next_(next)
    , registry_(registry)
    , constraints_(constraints)
    , metrics_(metrics) {}

net::Response MigrationMiddleware::handle(net::Request& req, RequestContext& ctx) {
    auto parts = net::split_path(req.path, 3, 4, true);
    if (!parts) {
        return next_.handle(req, ctx);
    }

    if (parts->object.empty() && (req.method == "PUT" || req.method == "POST")) {
        if (auto error = validate_setup(req)) {
            return *error;
        }
    }

    // The replay after a migration must see the request as the client sent it
    const net::Request original = req;
    const RequestContext original_ctx = ctx;

    net::Response resp = forward(req, ctx);

    if (resp.status != net::status_code(net::HttpStatus::NotFound)) {
        return resp;
    }
    if (req.headers.has("X-Container-Migration-Provider")) {
        return resp;
    }
    if (parts->object.empty() || (req.method != "GET" && req.method != "HEAD")) {
        return resp;
    }

    auto container_md = container_metadata(req, *parts);
    auto active = container_md.find("migration-active");
    if (active == container_md.end() || !net::config_true_value(active->second)) {
        return resp;
    }

    return handle_miss(original, original_ctx, *parts, container_md, std::move(resp));
}

std::optional<net::Response> MigrationMiddleware::validate_setup(net::Request& req) const {
    bool any_present = false;
    for (const char* field : MANDATORY_FIELDS) {
        any_present = any_present || req.headers.has(std::string(SETUP_PREFIX) + field);
    }
    if (!any_present) {
        return std::nullopt;
    }

    for (const char* field : MANDATORY_FIELDS) {
        if (req.headers.get(std::string(SETUP_PREFIX) + field).value_or("").empty()) {
            return net::Response::make(net::status_code(net::HttpStatus::PreconditionFailed),
                                       "Migration " + to_lower(field) + " is missing");
        }
    }

    std::vector<std::string> accepted;
    for (const char* field : MANDATORY_FIELDS) {
        accepted.push_back(field);
    }

    std::string provider = to_lower(*req.headers.get(std::string(SETUP_PREFIX) + "Provider"));
    const DriverEntry* entry = registry_.find(provider);
    if (!entry) {
        return net::Response::make(net::status_code(net::HttpStatus::BadRequest),
                                   "Invalid provider");
    }
    if (!entry->driver_loaded) {
        return net::Response::make(net::status_code(net::HttpStatus::BadRequest),
                                   "Invalid access driver");
    }

    for (const auto& key : entry->keys) {
        std::string suffix = title_case(key);
        if (!req.headers.has(SETUP_PREFIX + suffix)) {
            return net::Response::make(net::status_code(net::HttpStatus::BadRequest),
                                       "Missing required header: " +
                                           std::string(SETUP_PREFIX) + suffix);
        }
        accepted.push_back(suffix);
    }

    for (const auto& [param, value] : entry->static_params) {
        if (is_blank(value)) {
            return net::Response::make(net::status_code(net::HttpStatus::BadRequest),
                                       "Missing value for " + param);
        }
    }

    for (const auto& suffix : accepted) {
        auto value = req.headers.get(SETUP_PREFIX + suffix);
        if (value) {
            req.headers.set(SYSMETA_SETUP_PREFIX + suffix, *value);
        }
    }

    log_debug("migration setup for %s: provider=%s", req.path.c_str(), provider.c_str());
    return std::nullopt;
}

net::Response MigrationMiddleware::forward(net::Request& req, RequestContext& ctx) {
    net::Response resp = next_.handle(req, ctx);
    for (const char* field : MANDATORY_FIELDS) {
        if (auto value = resp.headers.get(std::string(SYSMETA_SETUP_PREFIX) + field)) {
            resp.headers.set(std::string(SETUP_PREFIX) + field, *value);
        }
    }
    return resp;
}

std::map<std::string, std::string> MigrationMiddleware::container_metadata(
    const net::Request& req, const net::PathParts& parts) {
    net::Request container_req;
    container_req.method = "HEAD";
    container_req.path = "/" + parts.version + "/" + parts.account + "/" + parts.container;
    if (auto token = req.headers.get("X-Auth-Token")) {
        container_req.headers.set("X-Auth-Token", *token);
    }

    auto sub_ctx = RequestContext::subrequest(MIGRATION_TAG);
    net::Response container_resp = next_.handle(container_req, sub_ctx);
    if (!container_resp.ok()) {
        log_debug("container HEAD %s returned %d", container_req.path.c_str(),
                  container_resp.status);
        return {};
    }
    return get_sysmeta(container_resp.headers, "container");
}

net::Response MigrationMiddleware::handle_miss(
    const net::Request& original,
    const RequestContext& original_ctx,
    const net::PathParts& parts,
    const std::map<std::string, std::string>& container_md,
    net::Response not_found) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->migration_duration());

    auto fail = [&](const std::string& message) {
        log_error("Migration of %s failed: %s", original.path.c_str(), message.c_str());
        if (metrics_) metrics_->migrations_failure().Increment();
        not_found.headers.set("X-Migration-Status", message);
        return std::move(not_found);
    };
    auto reject = [&](net::Response error) {
        log_error("Migration of %s rejected: %s", original.path.c_str(),
                  error.body_string().c_str());
        if (metrics_) metrics_->migrations_invalid().Increment();
        error.headers.set("X-Migration-Status", error.body_string());
        return error;
    };

    auto created = registry_.resolve(container_md, constraints_.max_file_size());
    if (!created.success) {
        return fail(created.error_message);
    }

    std::string provider;
    if (auto it = container_md.find("migration-provider"); it != container_md.end()) {
        provider = to_lower(it->second);
    }
    std::string source;
    if (auto it = container_md.find("migration-source"); it != container_md.end()) {
        source = it->second;
    }

    {
        DriverGuard guard(*created.driver);

        FetchResult fetched = created.driver->get_object(parts.object);
        if (fetched.error_kind == DriverErrorKind::TooLarge) {
            // The driver stopped before buffering; an unknown size is over the limit
            uint64_t refused = fetched.object.size.value_or(constraints_.max_file_size() + 1);
            if (auto error = constraints_.check_object_creation(parts.object, refused)) {
                return reject(std::move(*error));
            }
            return fail(fetched.error_message);
        }
        if (!fetched.success) {
            return fail(fetched.error_message);
        }
        SourceObject& object = fetched.object;
        if (!object.data) {
            return fail("No data stream for object " + parts.object);
        }

        uint64_t length = object.data->size();
        if (object.size && *object.size != length) {
            return fail("Source reported " + std::to_string(*object.size) +
                        " bytes but returned " + std::to_string(length));
        }
        if (auto error = constraints_.check_object_creation(parts.object, length)) {
            return reject(std::move(*error));
        }

        double now = now_seconds();

        net::Request put_req;
        put_req.method = "PUT";
        put_req.path = original.path;
        if (auto token = original.headers.get("X-Auth-Token")) {
            put_req.headers.set("X-Auth-Token", *token);
        }
        for (const auto& [key, value] : object.metadata) {
            if (net::has_prefix_ci(key, "X-Object-Meta-")) {
                put_req.headers.set(key, value);
            } else {
                put_req.headers.set("X-Object-Meta-" + key, value);
            }
        }
        put_req.headers.set("X-Object-Sysmeta-Migration-Timestamp", format_timestamp(now));
        put_req.headers.set("X-Object-Sysmeta-Migration-Source", provider + ":" + source);
        put_req.headers.set("X-Timestamp",
                            format_timestamp(std::min(now, object.timestamp.value_or(now))));
        put_req.headers.set_content_type(object.content_type.empty() ? DEFAULT_CONTENT_TYPE
                                                                     : object.content_type);
        put_req.headers.set_content_length(length);
        put_req.body = std::move(*object.data);

        auto sub_ctx = RequestContext::subrequest(MIGRATION_TAG);
        net::Response put_resp = next_.handle(put_req, sub_ctx);
        if (!put_resp.ok()) {
            return fail("Failed to create local object.Status " +
                        std::to_string(put_resp.status));
        }

        log_info("Migrated %s from %s:%s (%llu bytes, driver %s)", original.path.c_str(),
                 provider.c_str(), source.c_str(), static_cast<unsigned long long>(length),
                 created.driver->type_name().c_str());
        if (metrics_) {
            metrics_->migrations_success().Increment();
            metrics_->migration_bytes_total().Increment(static_cast<double>(length));
        }
    }

    net::Request replay = original;
    RequestContext replay_ctx = original_ctx;
    return forward(replay, replay_ctx);
}

}  // namespace objgate
