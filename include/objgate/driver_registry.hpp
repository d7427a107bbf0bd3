#pragma once

#include "objgate/source_driver.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace objgate {

/// Startup configuration problem (e.g. a provider naming an unknown driver).
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One configured migration provider
struct DriverEntry {
    std::string provider;
    std::vector<std::string> keys;       // required container metadata keys
    std::string module;                  // factory name
    bool driver_loaded = false;
    std::map<std::string, std::string> static_params;  // driver_<provider>_* settings
    DriverFactory factory;
};

/// Maps provider names to driver factories. Built once from configuration,
/// read-only afterwards.
class DriverRegistry {
public:
    DriverRegistry() = default;

    /// Build from the flat migration settings:
    ///   supported_drivers = fsystem,swift
    ///   driver_swift_keys = token-url,user,key
    ///   driver_swift_module = swift          (defaults to the provider name)
    ///   driver_fsystem_parent_path = /srv    (static parameter)
    /// Throws ConfigError when a module names no known factory.
    static DriverRegistry from_config(const std::map<std::string, std::string>& conf);

    /// Make a driver type available to from_config under `name`. Call before
    /// any registry is built.
    static void register_factory(const std::string& name, DriverFactory factory);
    static bool has_factory(const std::string& name);

    const DriverEntry* find(const std::string& provider) const;

    /// Create a driver from container migration metadata (keys such as
    /// "migration-provider", "migration-source", "migration-<key>").
    /// A `max_object_size` reaches the driver as MAX_OBJECT_SIZE_PARAM.
    DriverCreateResult resolve(const std::map<std::string, std::string>& container_md,
                               std::optional<uint64_t> max_object_size = std::nullopt) const;

    /// Create a driver for an explicit provider, source and required-key values.
    DriverCreateResult create(const std::string& provider,
                              const std::string& source,
                              const std::map<std::string, std::string>& key_values,
                              std::optional<uint64_t> max_object_size = std::nullopt) const;

    std::vector<std::string> providers() const;
    size_t size() const { return entries_.size(); }
    size_t loaded_count() const;
    bool empty() const { return entries_.empty(); }

    /// provider -> "enabled" for every provider whose driver is loaded.
    std::map<std::string, std::string> capabilities() const;

private:
    std::map<std::string, DriverEntry> entries_;
};

/// Split a comma-separated list, trimming blanks and dropping empty items.
std::vector<std::string> split_list(const std::string& value);

}  // namespace objgate
