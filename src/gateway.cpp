#include "objgate/gateway.hpp"
#include "objgate/log.hpp"
#include "objgate/metrics.hpp"

namespace objgate {

Gateway::Gateway(const GatewayConfig& config, Handler& backend, MetricsExporter* metrics)
    : constraints_(config.constraints())
    , entry_(&backend)
    , metrics_(metrics) {
    if (config.migration_enabled) {
        registry_ = DriverRegistry::from_config(config.migration);
        migration_ = std::make_unique<MigrationMiddleware>(*entry_, registry_, constraints_, metrics);
        entry_ = migration_.get();
    }
    if (config.copy_enabled) {
        copy_ = std::make_unique<CopyRouter>(*entry_, constraints_, config.object_post_as_copy,
                                             metrics);
        entry_ = copy_.get();
    }
    if (metrics) {
        metrics->set_registry(&registry_);
    }

    log_info("gateway: copy=%s post-as-copy=%s migration=%s providers=%zu",
             config.copy_enabled ? "on" : "off",
             config.object_post_as_copy ? "on" : "off",
             config.migration_enabled ? "on" : "off", registry_.size());
}

Gateway::~Gateway() {
    // The exporter may keep writing snapshots after the registry is gone
    if (metrics_) {
        metrics_->set_registry(nullptr);
    }
}

net::Response Gateway::handle(net::Request& req, RequestContext& ctx) {
    return entry_->handle(req, ctx);
}

}  // namespace objgate
