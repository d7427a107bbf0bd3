#include "objgate/driver_registry.hpp"
#include "objgate/log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace objgate {

namespace {

struct FactoryTable {
    std::mutex mutex;
    std::map<std::string, DriverFactory> factories = SourceDriverFactory::builtin_factories();
};

FactoryTable& factory_table() {
    static FactoryTable table;
    return table;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

}  // namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        auto item = trim(value.substr(pos, comma - pos));
        if (!item.empty()) {
            items.push_back(item);
        }
        pos = comma + 1;
    }
    return items;
}

// ============================================================================
// Factory table
// ============================================================================

void DriverRegistry::register_factory(const std::string& name, DriverFactory factory) {
    auto& table = factory_table();
    std::lock_guard lock(table.mutex);
    table.factories[name] = std::move(factory);
}

bool DriverRegistry::has_factory(const std::string& name) {
    auto& table = factory_table();
    std::lock_guard lock(table.mutex);
    return table.factories.count(name) > 0;
}

// ============================================================================
// Construction
// ============================================================================

DriverRegistry DriverRegistry::from_config(const std::map<std::string, std::string>& conf) {
    DriverRegistry registry;

    auto supported = conf.find("supported_drivers");
    if (supported == conf.end()) {
        return registry;
    }

    for (const auto& provider : split_list(supported->second)) {
        const std::string prefix = "driver_" + provider + "_";
        const std::string keys_key = prefix + "keys";
        const std::string module_key = prefix + "module";

        DriverEntry entry;
        entry.provider = provider;

        if (auto it = conf.find(keys_key); it != conf.end()) {
            entry.keys = split_list(it->second);
        }

        entry.module = provider;
        if (auto it = conf.find(module_key); it != conf.end() && !trim(it->second).empty()) {
            entry.module = trim(it->second);
        }

        {
            auto& table = factory_table();
            std::lock_guard lock(table.mutex);
            auto factory = table.factories.find(entry.module);
            if (factory == table.factories.end()) {
                throw ConfigError("Unknown driver module '" + entry.module +
                                  "' for provider " + provider);
            }
            entry.factory = factory->second;
        }

        entry.driver_loaded = entry.factory.available ? entry.factory.available() : true;

        for (const auto& [key, value] : conf) {
            if (key != keys_key && key != module_key && key.compare(0, prefix.size(), prefix) == 0) {
                entry.static_params[key] = value;
            }
        }

        log_info("migration provider %s: module=%s keys=%zu params=%zu%s",
                 provider.c_str(), entry.module.c_str(), entry.keys.size(),
                 entry.static_params.size(), entry.driver_loaded ? "" : " (driver unavailable)");

        registry.entries_[provider] = std::move(entry);
    }

    return registry;
}

// ============================================================================
// Lookup and resolution
// ============================================================================

const DriverEntry* DriverRegistry::find(const std::string& provider) const {
    auto it = entries_.find(provider);
    return it == entries_.end() ? nullptr : &it->second;
}

DriverCreateResult DriverRegistry::create(
    const std::string& provider,
    const std::string& source,
    const std::map<std::string, std::string>& key_values,
    std::optional<uint64_t> max_object_size) const {
    const DriverEntry* entry = find(provider);
    if (!entry) {
        return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                           "Migration provider " + provider + " is not registered");
    }
    if (!entry->driver_loaded || !entry->factory.create) {
        return DriverCreateResult::failure(DriverErrorKind::Unavailable,
                                           "Failed to retrieve remote driver for " + provider);
    }

    MigrationParams params;
    for (const auto& key : entry->keys) {
        auto it = key_values.find(key);
        if (it == key_values.end()) {
            return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                               "Missing migration parameter: " + key);
        }
        params[key] = it->second;
    }
    for (const auto& [key, value] : entry->static_params) {
        params[key] = value;
    }
    if (max_object_size) {
        params[MAX_OBJECT_SIZE_PARAM] = std::to_string(*max_object_size);
    }

    auto result = entry->factory.create(source, params);
    if (result.success && !result.driver) {
        return DriverCreateResult::failure(DriverErrorKind::Unavailable,
                                           "Driver factory for " + provider + " returned no driver");
    }
    return result;
}

DriverCreateResult DriverRegistry::resolve(
    const std::map<std::string, std::string>& container_md,
    std::optional<uint64_t> max_object_size) const {
    auto provider_it = container_md.find("migration-provider");
    if (provider_it == container_md.end() || trim(provider_it->second).empty()) {
        return DriverCreateResult::failure(DriverErrorKind::InvalidParams,
                                           "Migration provider is missing");
    }
    std::string provider = to_lower(trim(provider_it->second));

    std::string source;
    if (auto it = container_md.find("migration-source"); it != container_md.end()) {
        source = it->second;
    }

    std::map<std::string, std::string> key_values;
    if (const DriverEntry* entry = find(provider)) {
        for (const auto& key : entry->keys) {
            auto it = container_md.find("migration-" + to_lower(key));
            if (it != container_md.end()) {
                key_values[key] = it->second;
            }
        }
    }

    return create(provider, source, key_values, max_object_size);
}

std::vector<std::string> DriverRegistry::providers() const {
    std::vector<std::string> names;
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    return names;
}

size_t DriverRegistry::loaded_count() const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [](const auto& kv) { return kv.second.driver_loaded; }));
}

std::map<std::string, std::string> DriverRegistry::capabilities() const {
    std::map<std::string, std::string> caps;
    for (const auto& [name, entry] : entries_) {
        if (entry.driver_loaded) {
            caps[name] = "enabled";
        }
    }
    return caps;
}

}  // namespace objgate
