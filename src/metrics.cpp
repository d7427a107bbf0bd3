#include "objgate/metrics.hpp"
#include "objgate/driver_registry.hpp"
#include "objgate/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace objgate {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& copies_family = prometheus::BuildCounter()
        .Name("objgate_copies_total")
        .Help("Total server-side copies by outcome")
        .Labels(labels)
        .Register(*registry_);
    copies_success_ = &copies_family.Add({{"result", "success"}});
    copies_rejected_ = &copies_family.Add({{"result", "rejected"}});
    copies_failure_ = &copies_family.Add({{"result", "failure"}});

    copy_bytes_total_ = &prometheus::BuildCounter()
        .Name("objgate_copy_bytes_total")
        .Help("Total bytes written by server-side copies")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& migrations_family = prometheus::BuildCounter()
        .Name("objgate_migrations_total")
        .Help("Total on-demand migrations by outcome")
        .Labels(labels)
        .Register(*registry_);
    migrations_success_ = &migrations_family.Add({{"result", "success"}});
    migrations_failure_ = &migrations_family.Add({{"result", "failure"}});
    migrations_invalid_ = &migrations_family.Add({{"result", "invalid"}});

    migration_bytes_total_ = &prometheus::BuildCounter()
        .Name("objgate_migration_bytes_total")
        .Help("Total bytes migrated from external sources")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    options_total_ = &prometheus::BuildCounter()
        .Name("objgate_options_total")
        .Help("Total OPTIONS responses advertising COPY")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    drivers_registered_ = &gauge_reg("objgate_drivers_registered", "Configured migration providers");
    drivers_loaded_ = &gauge_reg("objgate_drivers_loaded", "Migration providers whose driver is available");

    // --- Histograms ---

    copy_duration_ = &prometheus::BuildHistogram()
        .Name("objgate_copy_duration_seconds")
        .Help("Server-side copy duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60});

    migration_duration_ = &prometheus::BuildHistogram()
        .Name("objgate_migration_duration_seconds")
        .Help("On-demand migration duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::set_registry(const DriverRegistry* registry) {
    std::lock_guard lock(drivers_mutex_);
    drivers_ = registry;
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

std::string MetricsExporter::render() {
    update_gauges();
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(drivers_mutex_);
    if (drivers_) {
        drivers_registered_->Set(static_cast<double>(drivers_->size()));
        drivers_loaded_->Set(static_cast<double>(drivers_->loaded_count()));
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("Cannot open metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("Cannot publish metrics file %s: %s",
                  prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace objgate
