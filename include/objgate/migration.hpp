#pragma once

#include "objgate/constraints.hpp"
#include "objgate/driver_registry.hpp"
#include "objgate/pipeline.hpp"

#include <map>
#include <optional>
#include <string>

namespace objgate {

class MetricsExporter;

/// On-demand migration of objects from an external source.
///
/// Container PUT/POST: validates the X-Container-Migration-* setup headers
/// against the driver registry and duplicates them as container system
/// metadata so the backend persists them.
///
/// Object GET/HEAD answered 404: when the container has an active migration,
/// the object is fetched through the provider's driver, written locally with
/// a PUT sub-request and the original request is replayed. Failures leave the
/// client with the 404 plus an X-Migration-Status header.
class MigrationMiddleware : public Handler {
public:
    MigrationMiddleware(Handler& next,
                        const DriverRegistry& registry,
                        const ObjectConstraints& constraints,
                        MetricsExporter* metrics = nullptr);

    net::Response handle(net::Request& req, RequestContext& ctx) override;

private:
    // 412/400 for a bad migration setup; on success the accepted headers
    // have been duplicated as sysmeta on `req`.
    std::optional<net::Response> validate_setup(net::Request& req) const;

    // Call downstream and expose the container's migration sysmeta under
    // the client-facing header names.
    net::Response forward(net::Request& req, RequestContext& ctx);

    // Migration sysmeta of the object's container, read with a HEAD
    // sub-request.
    std::map<std::string, std::string> container_metadata(const net::Request& req,
                                                          const net::PathParts& parts);

    net::Response handle_miss(const net::Request& original,
                              const RequestContext& original_ctx,
                              const net::PathParts& parts,
                              const std::map<std::string, std::string>& container_md,
                              net::Response not_found);

    Handler& next_;
    const DriverRegistry& registry_;
    const ObjectConstraints& constraints_;
    MetricsExporter* metrics_;
};

/// Header form of a migration key: each letter after a non-letter is
/// upper-cased, the rest lower-cased ("token-url" -> "Token-Url").
std::string title_case(const std::string& key);

/// Seconds since the epoch in the backend's X-Timestamp form (%016.5f).
std::string format_timestamp(double seconds);

}  // namespace objgate
