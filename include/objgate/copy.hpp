#pragma once

#include "objgate/constraints.hpp"
#include "objgate/pipeline.hpp"

#include <string>

namespace objgate {

class MetricsExporter;

/// Server-side copy: fetches a source object with a sub-request and writes
/// it back through the pipeline as a PUT, merging metadata on the way.
class CopyOrchestrator {
public:
    CopyOrchestrator(Handler& next,
                     const ObjectConstraints& constraints,
                     MetricsExporter* metrics = nullptr);

    /// Copy the object at `source_path` (/<v>/<account>/<container>/<object>,
    /// decoded) onto the object named by `req`, a PUT carrying X-Copy-From.
    /// Exactly one fetch and one PUT are issued; failures are not retried.
    net::Response copy(const std::string& source_path, net::Request& req, RequestContext& ctx);

    /// Forward an OPTIONS request and advertise COPY in Allow and
    /// Access-Control-Allow-Methods on success.
    net::Response handle_options(net::Request& req, RequestContext& ctx);

private:
    // GET the source (X-Newest) and run the copy hook. Oversized or
    // indeterminate-length sources become 413.
    net::Response get_source_object(const std::string& source_path,
                                    const net::Request& req,
                                    const RequestContext& ctx);

    Handler& next_;
    const ObjectConstraints& constraints_;
    MetricsExporter* metrics_;
};

/// Recognizes the ways a client can ask for a copy (PUT with X-Copy-From,
/// COPY with Destination, POST when post-as-copy is on) and rewrites them to
/// the canonical PUT before handing them to the CopyOrchestrator.
class CopyRouter : public Handler {
public:
    CopyRouter(Handler& next,
               const ObjectConstraints& constraints,
               bool object_post_as_copy,
               MetricsExporter* metrics = nullptr);

    net::Response handle(net::Request& req, RequestContext& ctx) override;

    bool object_post_as_copy() const { return object_post_as_copy_; }

private:
    net::Response handle_put(net::Request& req, RequestContext& ctx);
    net::Response handle_copy(net::Request& req, RequestContext& ctx,
                              const net::PathParts& parts);
    net::Response handle_object_post_as_copy(net::Request& req, RequestContext& ctx,
                                             const net::PathParts& parts);

    Handler& next_;
    CopyOrchestrator orchestrator_;
    bool object_post_as_copy_;
};

}  // namespace objgate
