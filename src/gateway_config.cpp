#include "objgate/gateway_config.hpp"
#include "objgate/driver_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace objgate {

namespace {

// Required container keys of the built-in driver types
const std::map<std::string, std::string> BUILTIN_DRIVER_KEYS = {
    {"swift", "token-url,user,key"},
    {"s3", "endpoint,region,access-key,secret-key"},
};

bool is_valid_provider_name(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '_' || c == '-';
    });
}

// Driver settings in JSON may be strings, lists (joined with ','), numbers or booleans
std::string json_setting_to_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array()) {
        std::string joined;
        for (const auto& item : value) {
            if (!joined.empty()) joined += ",";
            joined += item.is_string() ? item.get<std::string>() : item.dump();
        }
        return joined;
    }
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_null()) return {};
    return value.dump();
}

// Split a --driver-opt key=value argument
bool parse_driver_opt(const std::string& value, std::map<std::string, std::string>& migration) {
    auto eq = value.find('=');
    if (eq == std::string::npos || eq == 0) {
        std::cerr << "Error: --driver-opt expects <key>=<value>, got: " << value << "\n";
        return false;
    }
    migration[value.substr(0, eq)] = value.substr(eq + 1);
    return true;
}

}  // namespace

std::optional<GatewayConfig> GatewayConfig::from_args(int argc, char* argv[]) {
    GatewayConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--no-copy") {
            config.copy_enabled = false;
        } else if (arg == "--no-post-as-copy") {
            config.object_post_as_copy = false;
        } else if (arg == "--max-file-size") {
            auto* v = next_arg(i, "--max-file-size");
            if (!v) return std::nullopt;
            config.max_file_size = std::stoull(v);
        } else if (arg == "--max-object-name-length") {
            auto* v = next_arg(i, "--max-object-name-length");
            if (!v) return std::nullopt;
            config.max_object_name_length = std::stoull(v);
        } else if (arg == "--no-migration") {
            config.migration_enabled = false;
        } else if (arg == "--supported-drivers") {
            auto* v = next_arg(i, "--supported-drivers");
            if (!v) return std::nullopt;
            config.migration["supported_drivers"] = v;
        } else if (arg == "--driver-opt") {
            auto* v = next_arg(i, "--driver-opt");
            if (!v) return std::nullopt;
            if (!parse_driver_opt(v, config.migration)) return std::nullopt;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            config.metrics_interval_secs = std::stoull(v);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr <<
                "Configuration options:\n"
                "  --config <path>                  JSON config file\n"
                "\n"
                "Server-side copy:\n"
                "  --no-copy                        Disable server-side copy\n"
                "  --no-post-as-copy                Do not treat object POST as a copy\n"
                "  --max-file-size <bytes>          Largest object accepted (default: 5 GiB + 2)\n"
                "  --max-object-name-length <N>     Longest object name (default: 1024)\n"
                "\n"
                "Migration:\n"
                "  --no-migration                   Disable on-demand migration\n"
                "  --supported-drivers <a,b>        Migration providers to register\n"
                "  --driver-opt <key>=<value>       Driver setting, e.g.\n"
                "                                   driver_fsystem_parent_path=/srv/old\n"
                "                                   driver_swift_keys=token-url,user,key\n"
                "\n"
                "Logging and metrics:\n"
                "  --verbose                        Verbose output\n"
                "  --log-file <path>                Log file path\n"
                "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
                "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
                "  --help                           Show this help\n";
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (const char* v = std::getenv("OBJGATE_SUPPORTED_DRIVERS")) {
        if (config.migration.count("supported_drivers") == 0) {
            config.migration["supported_drivers"] = v;
        }
    }

    config.apply_defaults();
    return config;
}

bool GatewayConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("copy_enabled")) copy_enabled = j["copy_enabled"].get<bool>();
        if (j.contains("object_post_as_copy"))
            object_post_as_copy = j["object_post_as_copy"].get<bool>();
        if (j.contains("max_file_size")) max_file_size = j["max_file_size"].get<uint64_t>();
        if (j.contains("max_object_name_length"))
            max_object_name_length = j["max_object_name_length"].get<size_t>();
        if (j.contains("migration_enabled")) migration_enabled = j["migration_enabled"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        // Migration drivers
        if (j.contains("migration") && j["migration"].is_object()) {
            for (auto& [key, val] : j["migration"].items()) {
                migration[key] = json_setting_to_string(val);
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void GatewayConfig::apply_defaults() {
    for (const auto& provider : supported_drivers()) {
        auto builtin = BUILTIN_DRIVER_KEYS.find(provider);
        if (builtin == BUILTIN_DRIVER_KEYS.end()) continue;

        // Only when the provider really uses the built-in driver of that name
        auto module = migration.find("driver_" + provider + "_module");
        if (module != migration.end() && !module->second.empty() && module->second != provider) {
            continue;
        }
        migration.emplace("driver_" + provider + "_keys", builtin->second);
    }
}

std::string GatewayConfig::validate() const {
    if (max_file_size == 0) return "max_file_size must be > 0";
    if (max_object_name_length == 0) return "max_object_name_length must be > 0";
    if (!metrics_file.empty() && metrics_interval_secs == 0)
        return "metrics_interval must be > 0";

    auto providers = supported_drivers();
    for (const auto& provider : providers) {
        if (!is_valid_provider_name(provider))
            return "invalid driver name '" + provider + "' (lowercase letters, digits, '-', '_')";
    }

    for (const auto& [key, value] : migration) {
        if (key == "supported_drivers") continue;
        if (key.compare(0, 7, "driver_") != 0)
            return "unknown migration setting: " + key;
        bool matched = std::any_of(providers.begin(), providers.end(), [&](const std::string& p) {
            return key.compare(0, 7 + p.size() + 1, "driver_" + p + "_") == 0;
        });
        if (!matched) return "migration setting " + key + " names no supported driver";
    }
    return {};
}

std::vector<std::string> GatewayConfig::supported_drivers() const {
    auto it = migration.find("supported_drivers");
    if (it == migration.end()) return {};
    return split_list(it->second);
}

}  // namespace objgate
