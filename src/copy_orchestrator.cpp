#include "objgate/copy.hpp"
#include "objgate/log.hpp"
#include "objgate/metrics.hpp"
#include "objgate/request_helpers.hpp"

#include <optional>

namespace objgate {

namespace {

constexpr const char* COPY_SOURCE_TAG = "SSC";

net::Response entity_too_large() {
    return net::Response::make(net::status_code(net::HttpStatus::PayloadTooLarge),
                               "The body of your request was too large for this server.");
}

// Provenance headers for the copy response: where the data came from plus
// the metadata the sink object ends up with.
net::HttpHeaders create_response_headers(const std::string& source_path,
                                          const net::Response& source_resp,
                                          const net::Request& sink_req) {
    net::HttpHeaders headers;

    // source_path is /<v>/<account>/<container>/<object>
    size_t acct_start = source_path.find('/', 1) + 1;
    size_t acct_end = source_path.find('/', acct_start);
    std::string account = source_path.substr(acct_start, acct_end - acct_start);
    std::string path = source_path.substr(acct_end + 1);

    headers.set("X-Copied-From-Account", net::url_quote(account));
    headers.set("X-Copied-From", net::url_quote(path));
    if (auto last_modified = source_resp.headers.get("Last-Modified")) {
        headers.set("X-Copied-From-Last-Modified", *last_modified);
    }

    for (const auto& [name, value] : sink_req.headers.all()) {
        if (is_sys_or_user_meta("object", name) || name == "x-delete-at") {
            headers.set(name, value);
        }
    }
    return headers;
}

}  // namespace

CopyOrchestrator::CopyOrchestrator(Handler& next,
                                   const ObjectConstraints& constraints,
                                   MetricsExporter* metrics)
    : next_(next)
    , constraints_(constraints)
    , metrics_(metrics) {}

net::Response CopyOrchestrator::get_source_object(const std::string& source_path,
                                                  const net::Request& req,
                                                  const RequestContext& ctx) {
    // Same headers and query as the client's request, as a bodiless GET
    net::Request source_req;
    source_req.method = "GET";
    source_req.path = source_path;
    source_req.query = req.query;
    source_req.headers = req.headers;
    source_req.headers.set_content_length(0);

    // The source uses its own container's policy
    source_req.headers.remove("X-Backend-Storage-Policy-Index");
    source_req.headers.set("X-Newest", "true");

    auto sub_ctx = RequestContext::subrequest(COPY_SOURCE_TAG);
    net::Response source_resp = next_.handle(source_req, sub_ctx);

    if (ctx.copy_hook) {
        source_resp = ctx.copy_hook(source_req, std::move(source_resp), req);
    }

    auto length = source_resp.content_length();
    if (!length) {
        // Chunked source with no declared length
        log_debug("copy source %s has indeterminate length", source_path.c_str());
        return entity_too_large();
    }
    if (*length > constraints_.max_file_size()) {
        log_debug("copy source %s is %llu bytes, limit %llu", source_path.c_str(),
                  static_cast<unsigned long long>(*length),
                  static_cast<unsigned long long>(constraints_.max_file_size()));
        return entity_too_large();
    }

    return source_resp;
}

net::Response CopyOrchestrator::copy(const std::string& source_path,
                                     net::Request& req,
                                     RequestContext& ctx) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->copy_duration());

    net::Response source_resp = get_source_object(source_path, req, ctx);
    if (source_resp.status >= net::status_code(net::HttpStatus::MultipleChoices)) {
        if (metrics_) {
            if (source_resp.status == net::status_code(net::HttpStatus::PayloadTooLarge)) {
                metrics_->copies_rejected().Increment();
            } else {
                metrics_->copies_failure().Increment();
            }
        }
        return source_resp;
    }

    uint64_t length = source_resp.content_length().value_or(source_resp.body.size());

    auto dest = net::split_path(req.path, 4, 4, true);
    if (auto error = constraints_.check_object_creation(dest ? dest->object : "", length)) {
        if (metrics_) metrics_->copies_rejected().Increment();
        return *error;
    }

    // Sink PUT keeps everything the client sent
    net::Request sink_req = req;
    sink_req.body = std::move(source_resp.body);
    sink_req.headers.set_content_length(length);
    if (auto etag = source_resp.etag()) {
        sink_req.headers.set("ETag", *etag);
    } else {
        sink_req.headers.remove("ETag");
    }

    sink_req.headers.remove("X-Copy-From");
    sink_req.headers.remove("X-Copy-From-Account");

    // Client content-type overrides the source's
    auto client_type = req.headers.content_type();
    if (!client_type || client_type->empty()) {
        if (auto source_type = source_resp.headers.content_type()) {
            sink_req.headers.set_content_type(*source_type);
        }
    }

    bool fresh_metadata =
        net::config_true_value(sink_req.headers.get("X-Fresh-Metadata").value_or("false"));

    if (fresh_metadata || ctx.post_as_copy) {
        // New sysmeta from the client is dropped, the source's sysmeta kept
        sink_req.headers.remove_if([](const std::string& name) {
            return is_sys_meta("object", name);
        });
        for (const auto& [name, value] : source_resp.headers.all()) {
            if (is_sys_meta("object", name)) {
                sink_req.headers.set(name, value);
            }
        }
    } else {
        // Source metadata first, then the client's on top
        copy_headers_into(source_resp.headers, sink_req.headers);
        copy_headers_into(req.headers, sink_req.headers);
    }

    // Manifest marker survives POSTs and manifest copies
    if (auto slo = source_resp.headers.get("X-Static-Large-Object")) {
        if (req.param("multipart-manifest") == "get" || ctx.post_as_copy) {
            sink_req.headers.set("X-Static-Large-Object", *slo);
        }
    }

    net::HttpHeaders resp_headers = create_response_headers(source_path, source_resp, sink_req);

    net::Response resp = next_.handle(sink_req, ctx);

    if (resp.ok()) {
        for (const auto& [name, value] : resp_headers.all()) {
            resp.headers.set(name, value);
        }
        if (metrics_) {
            metrics_->copies_success().Increment();
            metrics_->copy_bytes_total().Increment(static_cast<double>(length));
        }
    } else if (metrics_) {
        metrics_->copies_failure().Increment();
    }

    // Object POSTs used to answer 202; keep picky clients happy
    if (ctx.orig_method.value_or(req.method) == "POST" &&
        resp.status == net::status_code(net::HttpStatus::Created)) {
        resp.status = net::status_code(net::HttpStatus::Accepted);
    }

    return resp;
}

net::Response CopyOrchestrator::handle_options(net::Request& req, RequestContext& ctx) {
    net::Response resp = next_.handle(req, ctx);
    if (!resp.ok()) {
        return resp;
    }

    for (const char* header : {"Allow", "Access-Control-Allow-Methods"}) {
        auto value = resp.headers.get(header);
        if (value && value->find("COPY") == std::string::npos) {
            resp.headers.set(header, *value + ", COPY");
        }
    }
    if (metrics_) metrics_->options_total().Increment();

    return resp;
}

}  // namespace objgate
