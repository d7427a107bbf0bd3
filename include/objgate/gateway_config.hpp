#pragma once

#include "objgate/constraints.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace objgate {

/// Configuration for the copy and migration layers.
struct GatewayConfig {
    // Server-side copy
    bool copy_enabled = true;
    bool object_post_as_copy = true;  // POST on an object is a copy onto itself

    // Object creation limits
    uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    size_t max_object_name_length = DEFAULT_MAX_OBJECT_NAME_LENGTH;

    // On-demand migration. Flat driver settings handed to
    // DriverRegistry::from_config:
    //   supported_drivers, driver_<n>_keys, driver_<n>_module, driver_<n>_*
    bool migration_enabled = true;
    std::map<std::string, std::string> migration;

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;    // e.g. /var/lib/node_exporter/textfile/objgate.prom
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<GatewayConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in required keys for built-in drivers that have none configured.
    void apply_defaults();

    /// Validate settings. Returns error message or empty string.
    std::string validate() const;

    /// Providers named by migration["supported_drivers"].
    std::vector<std::string> supported_drivers() const;

    /// Object creation limits derived from this configuration.
    ObjectConstraints constraints() const {
        return ObjectConstraints(max_file_size, max_object_name_length);
    }
};

}  // namespace objgate
