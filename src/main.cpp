// objgate-migrate: inspect the configured migration providers and pull single
// objects through them without a proxy in front.
//
// Usage: objgate-migrate [config options] --list-drivers
//        objgate-migrate [config options] --fetch <provider> --source <src>
//                        --object <name> --output <path> [--param key=value]...

#include "objgate/driver_registry.hpp"
#include "objgate/gateway_config.hpp"
#include "objgate/log.hpp"
#include "objgate/metrics.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct ToolOptions {
    bool list_drivers = false;
    std::string fetch_provider;
    std::string source;
    std::string object;
    std::string output;
    std::map<std::string, std::string> params;
};

bool is_secret(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("password") != std::string::npos;
}

void print_usage() {
    fprintf(stderr,
        "Usage: objgate-migrate [config options] <action>\n"
        "\n"
        "Actions:\n"
        "  --list-drivers                List configured migration providers\n"
        "  --fetch <provider>            Fetch one object through a provider\n"
        "\n"
        "Fetch options:\n"
        "  --source <src>                Source container, bucket or directory\n"
        "  --object <name>               Object name within the source\n"
        "  --output <path>               File to write the object data to\n"
        "  --param <key>=<value>         Required driver key, e.g. token-url=...\n"
        "\n"
        "Run with --help for configuration options.\n"
    );
}

// Pulls the tool's own flags out of argv; everything else is configuration.
// Returns false on a malformed flag.
bool split_args(int argc, char* argv[], ToolOptions& tool, std::vector<char*>& config_args) {
    config_args.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "%s requires argument\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--list-drivers") {
            tool.list_drivers = true;
        } else if (arg == "--fetch") {
            auto* v = value("--fetch");
            if (!v) return false;
            tool.fetch_provider = v;
        } else if (arg == "--source") {
            auto* v = value("--source");
            if (!v) return false;
            tool.source = v;
        } else if (arg == "--object") {
            auto* v = value("--object");
            if (!v) return false;
            tool.object = v;
        } else if (arg == "--output") {
            auto* v = value("--output");
            if (!v) return false;
            tool.output = v;
        } else if (arg == "--param") {
            auto* v = value("--param");
            if (!v) return false;
            std::string kv = v;
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                fprintf(stderr, "--param expects <key>=<value>, got: %s\n", v);
                return false;
            }
            tool.params[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else {
            config_args.push_back(argv[i]);
        }
    }
    return true;
}

void list_drivers(const objgate::DriverRegistry& registry) {
    if (registry.empty()) {
        printf("No migration providers configured (supported_drivers is empty)\n");
        return;
    }
    for (const auto& provider : registry.providers()) {
        const auto* entry = registry.find(provider);
        printf("%s\n", provider.c_str());
        printf("  module: %s\n", entry->module.c_str());
        printf("  loaded: %s\n", entry->driver_loaded ? "yes" : "no");
        std::string keys;
        for (const auto& key : entry->keys) {
            if (!keys.empty()) keys += ",";
            keys += key;
        }
        printf("  keys: %s\n", keys.empty() ? "(none)" : keys.c_str());
        for (const auto& [name, value] : entry->static_params) {
            printf("  %s: %s\n", name.c_str(), is_secret(name) ? "****" : value.c_str());
        }
    }
}

int fetch_object(const objgate::DriverRegistry& registry, const ToolOptions& tool,
                 uint64_t max_file_size, objgate::MetricsExporter* metrics) {
    if (tool.object.empty() || tool.output.empty()) {
        fprintf(stderr, "--fetch requires --object and --output\n");
        return 1;
    }

    std::optional<objgate::ScopedTimer> timer;
    if (metrics) timer.emplace(metrics->migration_duration());

    auto created = registry.create(tool.fetch_provider, tool.source, tool.params, max_file_size);
    if (!created.success) {
        objgate::log_error("Cannot create driver for %s: %s (%s)", tool.fetch_provider.c_str(),
                           created.error_message.c_str(),
                           objgate::driver_error_kind_name(created.error_kind));
        if (metrics) metrics->migrations_invalid().Increment();
        return 1;
    }

    objgate::DriverGuard guard(*created.driver);
    auto fetched = created.driver->get_object(tool.object);
    if (!fetched.success || !fetched.object.data) {
        objgate::log_error("Fetch of %s from %s:%s failed: %s (%s)", tool.object.c_str(),
                           tool.fetch_provider.c_str(), tool.source.c_str(),
                           fetched.success ? "no data stream" : fetched.error_message.c_str(),
                           objgate::driver_error_kind_name(fetched.error_kind));
        if (metrics) metrics->migrations_failure().Increment();
        return 1;
    }

    const auto& obj = fetched.object;
    const auto& data = *obj.data;

    std::ofstream ofs(tool.output, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        objgate::log_error("Cannot open output file: %s", tool.output.c_str());
        return 1;
    }
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!ofs) {
        objgate::log_error("Failed writing %s", tool.output.c_str());
        return 1;
    }

    printf("object: %s\n", tool.object.c_str());
    printf("  driver: %s\n", created.driver->type_name().c_str());
    printf("  size: %zu\n", data.size());
    printf("  content-type: %s\n",
           obj.content_type.empty() ? "(unknown)" : obj.content_type.c_str());
    if (obj.timestamp) {
        printf("  timestamp: %.5f\n", *obj.timestamp);
    }
    for (const auto& [key, value] : obj.metadata) {
        printf("  meta %s: %s\n", key.c_str(), value.c_str());
    }

    if (metrics) {
        metrics->migrations_success().Increment();
        metrics->migration_bytes_total().Increment(static_cast<double>(data.size()));
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    ToolOptions tool;
    std::vector<char*> config_args;
    if (!split_args(argc, argv, tool, config_args)) {
        print_usage();
        return 1;
    }

    std::optional<objgate::GatewayConfig> config_opt;
    try {
        config_opt = objgate::GatewayConfig::from_args(static_cast<int>(config_args.size()),
                                                       config_args.data());
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        return 1;
    }
    if (!config_opt) {
        print_usage();
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    if (!tool.list_drivers && tool.fetch_provider.empty()) {
        print_usage();
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        } else {
            std::cerr << "Cannot open log file " << config.log_file << ": "
                      << std::strerror(errno) << "\n";
        }
    }

    objgate::set_verbose_logging(config.verbose);

    objgate::DriverRegistry registry;
    try {
        registry = objgate::DriverRegistry::from_config(config.migration);
    } catch (const objgate::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<objgate::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<objgate::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"tool", "objgate-migrate"}});
        metrics->set_registry(&registry);
        metrics->start();
    }

    int rc = 0;
    if (tool.list_drivers) {
        list_drivers(registry);
    }
    if (!tool.fetch_provider.empty()) {
        rc = fetch_object(registry, tool, config.max_file_size, metrics.get());
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}
