#pragma once

#include "objgate/constraints.hpp"
#include "objgate/copy.hpp"
#include "objgate/driver_registry.hpp"
#include "objgate/gateway_config.hpp"
#include "objgate/migration.hpp"
#include "objgate/pipeline.hpp"

#include <memory>

namespace objgate {

class MetricsExporter;

/// The copy and migration stages assembled in front of a backend handler:
///
///   client -> CopyRouter -> MigrationMiddleware -> backend
///
/// Copy source fetches pass through migration, so copying an object that
/// only exists in the external source migrates it first. Disabled stages are
/// left out of the chain.
class Gateway : public Handler {
public:
    /// Throws ConfigError when the migration settings name an unknown driver.
    /// `metrics` must outlive the gateway.
    Gateway(const GatewayConfig& config, Handler& backend, MetricsExporter* metrics = nullptr);
    ~Gateway() override;

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    net::Response handle(net::Request& req, RequestContext& ctx) override;

    const DriverRegistry& registry() const { return registry_; }
    const ObjectConstraints& constraints() const { return constraints_; }

private:
    ObjectConstraints constraints_;
    DriverRegistry registry_;
    std::unique_ptr<MigrationMiddleware> migration_;
    std::unique_ptr<CopyRouter> copy_;
    Handler* entry_;
    MetricsExporter* metrics_;
};

}  // namespace objgate
