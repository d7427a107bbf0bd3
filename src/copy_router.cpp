#include "objgate/copy.hpp"
#include "objgate/log.hpp"
#include "objgate/request_helpers.hpp"

namespace objgate {

namespace {

net::Response zero_body_required() {
    return net::Response::make(net::status_code(net::HttpStatus::BadRequest),
                               "Copy requests require a zero byte body");
}

}  // namespace

CopyRouter::CopyRouter(Handler& next,
                       const ObjectConstraints& constraints,
                       bool object_post_as_copy,
                       MetricsExporter* metrics)
    : next_(next)
    , orchestrator_(next, constraints, metrics)
    , object_post_as_copy_(object_post_as_copy) {}

net::Response CopyRouter::handle(net::Request& req, RequestContext& ctx) {
    auto parts = net::split_path(req.path, 4, 4, true);
    if (!parts) {
        // Not an object request
        return next_.handle(req, ctx);
    }

    // Remember what the client sent before COPY/POST turn into PUT
    ctx.orig_method = req.method;

    if (req.method == "PUT" && !req.headers.get("X-Copy-From").value_or("").empty()) {
        return handle_put(req, ctx);
    }
    if (req.method == "COPY") {
        return handle_copy(req, ctx, *parts);
    }
    if (req.method == "POST" && object_post_as_copy_) {
        return handle_object_post_as_copy(req, ctx, *parts);
    }
    if (req.method == "OPTIONS") {
        return orchestrator_.handle_options(req, ctx);
    }

    return next_.handle(req, ctx);
}

net::Response CopyRouter::handle_object_post_as_copy(net::Request& req,
                                                     RequestContext& ctx,
                                                     const net::PathParts& parts) {
    req.method = "PUT";
    req.path = "/" + parts.version + "/" + parts.account + "/" + parts.container + "/" +
               parts.object;
    req.body.clear();
    req.headers.set_content_length(0);
    req.headers.set("X-Copy-From", net::url_quote("/" + parts.container + "/" + parts.object));
    ctx.post_as_copy = true;
    return handle_put(req, ctx);
}

net::Response CopyRouter::handle_copy(net::Request& req,
                                      RequestContext& ctx,
                                      const net::PathParts& parts) {
    if (req.headers.get("Destination").value_or("").empty()) {
        return net::Response::make(net::status_code(net::HttpStatus::PreconditionFailed),
                                   "Destination header required");
    }
    if (req.content_length() != 0) {
        return zero_body_required();
    }

    std::string dest_account = parts.account;
    if (auto header = req.headers.get("Destination-Account")) {
        auto checked = check_account_format(*header);
        if (checked.error) {
            return *checked.error;
        }
        req.headers.set("X-Copy-From-Account", parts.account);
        dest_account = *checked.account;
        req.headers.remove("Destination-Account");
    }

    auto dest = check_path_header(*req.headers.get("Destination"), "Destination");
    if (dest.error) {
        return *dest.error;
    }

    std::string source = "/" + parts.container + "/" + parts.object;

    // Rewrite in place as a PUT onto the destination
    req.method = "PUT";
    req.path = "/" + parts.version + "/" + dest_account + "/" + dest.value->container + "/" +
               dest.value->object;
    req.headers.set_content_length(0);
    req.headers.set("X-Copy-From", net::url_quote(source));
    req.headers.remove("Destination");
    return handle_put(req, ctx);
}

net::Response CopyRouter::handle_put(net::Request& req, RequestContext& ctx) {
    if (req.content_length() != 0) {
        return zero_body_required();
    }

    std::string copy_from = req.headers.get("X-Copy-From").value_or("");
    if (ctx.orig_method.value_or(req.method) != "POST") {
        ctx.log_info.push_back("x-copy-from:" + copy_from);
    }

    auto dest = net::split_path(req.path, 2, 3, true);
    if (!dest) {
        return net::Response::make(net::status_code(net::HttpStatus::BadRequest),
                                   "Invalid destination path");
    }

    std::string src_account = dest->account;
    if (auto header = req.headers.get("X-Copy-From-Account"); header && !header->empty()) {
        auto checked = check_account_format(*header);
        if (checked.error) {
            return *checked.error;
        }
        src_account = *checked.account;
    }

    auto src = check_path_header(copy_from, "X-Copy-From");
    if (src.error) {
        return *src.error;
    }

    std::string source_path = "/" + dest->version + "/" + src_account + "/" +
                              src.value->container + "/" + src.value->object;
    log_debug("copy %s -> %s (%s)", source_path.c_str(), req.path.c_str(),
              ctx.orig_method.value_or(req.method).c_str());

    return orchestrator_.copy(source_path, req, ctx);
}

}  // namespace objgate
