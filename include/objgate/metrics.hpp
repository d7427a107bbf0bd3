#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace objgate {

class DriverRegistry;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports gateway metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. Counters are only ever written by the request path.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file. Empty disables
    ///                        the file; the registry can still be rendered.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Registry whose provider counts are reported as gauges (not owned).
    /// Must stay alive until replaced; pass nullptr before destroying it.
    void set_registry(const DriverRegistry* registry);

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize the current registry in the Prometheus text format.
    std::string render();

    // --- Counter accessors ---
    prometheus::Counter& copies_success() { return *copies_success_; }
    prometheus::Counter& copies_rejected() { return *copies_rejected_; }
    prometheus::Counter& copies_failure() { return *copies_failure_; }
    prometheus::Counter& copy_bytes_total() { return *copy_bytes_total_; }
    prometheus::Counter& migrations_success() { return *migrations_success_; }
    prometheus::Counter& migrations_failure() { return *migrations_failure_; }
    prometheus::Counter& migrations_invalid() { return *migrations_invalid_; }
    prometheus::Counter& migration_bytes_total() { return *migration_bytes_total_; }
    prometheus::Counter& options_total() { return *options_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& copy_duration() { return *copy_duration_; }
    prometheus::Histogram& migration_duration() { return *migration_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex drivers_mutex_;
    const DriverRegistry* drivers_ = nullptr;

    // --- Counters ---
    prometheus::Counter* copies_success_;
    prometheus::Counter* copies_rejected_;
    prometheus::Counter* copies_failure_;
    prometheus::Counter* copy_bytes_total_;
    prometheus::Counter* migrations_success_;
    prometheus::Counter* migrations_failure_;
    prometheus::Counter* migrations_invalid_;
    prometheus::Counter* migration_bytes_total_;
    prometheus::Counter* options_total_;

    // --- Gauges ---
    prometheus::Gauge* drivers_registered_;
    prometheus::Gauge* drivers_loaded_;

    // --- Histograms ---
    prometheus::Histogram* copy_duration_;
    prometheus::Histogram* migration_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace objgate
