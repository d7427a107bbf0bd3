#pragma once

#include "objgate/net/http.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace objgate {

/// Substitutes the fetched copy source, e.g. so copying a large-object
/// manifest yields the assembled content instead of the manifest bytes.
/// Called as hook(source_request, source_response, original_request).
using CopyHook = std::function<net::Response(const net::Request&,
                                             net::Response,
                                             const net::Request&)>;

/// Per-request orchestration state, passed explicitly down the pipeline.
struct RequestContext {
    /// Method the client actually sent, before COPY/POST became PUT.
    std::optional<std::string> orig_method;

    bool post_as_copy = false;

    CopyHook copy_hook;

    /// Extra fields for the access log line (e.g. "x-copy-from:/c/o").
    std::vector<std::string> log_info;

    /// Tag of the component that issued this request as a sub-request
    /// ("SSC", "DM"); empty for client requests.
    std::string source;

    /// Fresh context for a sub-request issued on behalf of `source`.
    static RequestContext subrequest(const std::string& source) {
        RequestContext ctx;
        ctx.source = source;
        return ctx;
    }
};

/// One stage of the proxy pipeline. A middleware holds a reference to the
/// next stage and issues sub-requests by calling its handle().
class Handler {
public:
    virtual ~Handler() = default;

    virtual net::Response handle(net::Request& req, RequestContext& ctx) = 0;
};

}  // namespace objgate
