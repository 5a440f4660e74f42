#include "netrecon/core/scan_config.h"
#include "netrecon/core/errors.h"
#include "netrecon/core/port_resolver.h"
#include "netrecon/common/logger.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace netrecon {

namespace {

// 计数类配置项：按有符号整数读取，负数不会回绕成极大值
std::size_t read_count(const nlohmann::json& section, const char* key,
                       int64_t min_value, const std::string& config_file) {
    auto value = section[key].get<int64_t>();
    if (value < min_value) {
        throw ConfigurationError(std::string(key) + " must be at least " + std::to_string(min_value) +
                                 " in '" + config_file + "'", std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}

} // namespace

ScanConfig load_config(const std::string& config_file, ScanConfig base) {
    std::ifstream ifs(config_file);
    if (!ifs.is_open()) {
        throw ConfigurationError("config file '" + config_file + "' not found", config_file);
    }

    ScanConfig config = base;
    try {
        nlohmann::json j = nlohmann::json::parse(ifs);

        // ===== Scan 配置 =====
        if (j.contains("scan")) {
            auto s = j["scan"];
            if (s.contains("timeout_ms")) config.timeout = Timeout(s["timeout_ms"].get<int64_t>());
            if (s.contains("workers")) config.workers = read_count(s, "workers", 1, config_file);
            if (s.contains("port_concurrency")) {
                config.port_concurrency = read_count(s, "port_concurrency", 1, config_file);
            }
            if (s.contains("max_in_flight")) config.max_in_flight = read_count(s, "max_in_flight", 0, config_file);
            if (s.contains("ports")) config.ports = resolve_ports(s["ports"].get<std::string>());
            if (s.contains("max_runtime_ms")) {
                config.max_runtime = std::chrono::milliseconds(s["max_runtime_ms"].get<int64_t>());
            }
        }

        // ===== Liveness 配置 =====
        if (j.contains("liveness")) {
            auto l = j["liveness"];
            if (l.contains("enabled")) config.liveness_enabled = l["enabled"];
            if (l.contains("ports")) {
                config.liveness_ports.clear();
                for (const auto& p : l["ports"]) {
                    auto value = p.get<int>();
                    if (value < 1 || value > 65535) {
                        throw ConfigurationError("liveness port out of range in '" + config_file + "'",
                                                 std::to_string(value));
                    }
                    config.liveness_ports.push_back(static_cast<Port>(value));
                }
            }
        }

        // ===== Enrichment 配置 =====
        if (j.contains("enrichment")) {
            auto e = j["enrichment"];
            if (e.contains("resolve_hostnames")) config.resolve_hostnames = e["resolve_hostnames"];
            if (e.contains("lookup_mac")) config.lookup_mac = e["lookup_mac"];
            if (e.contains("fingerprint")) config.fingerprint = e["fingerprint"];
            if (e.contains("dns_timeout_ms")) config.dns_timeout = Timeout(e["dns_timeout_ms"].get<int64_t>());
            if (e.contains("fingerprint_timeout_ms")) {
                config.fingerprint_timeout = Timeout(e["fingerprint_timeout_ms"].get<int64_t>());
            }
            if (e.contains("nmap_path")) config.nmap_path = e["nmap_path"].get<std::string>();
            if (e.contains("neighbor_table_path")) config.neighbor_table_path = e["neighbor_table_path"].get<std::string>();
        }

        // ===== Output 配置 =====
        if (j.contains("output")) {
            auto o = j["output"];
            if (o.contains("format")) config.output_format = o["format"].get<std::string>();
        }

        // ===== Logging 配置 =====
        if (j.contains("logging")) {
            auto l = j["logging"];
            if (l.contains("level")) config.logging_level = l["level"].get<std::string>();
            if (l.contains("file_path")) config.logging_file_path = l["file_path"].get<std::string>();
        }

        LOG_CONFIG_INFO("Loaded config from {}", config_file);
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_WARN("Failed to parse config file '{}': {}", config_file, e.what());
        LOG_CONFIG_WARN("Using default configuration");
        return base;
    }

    return config;
}

void validate_config(const ScanConfig& config) {
    if (config.timeout.count() <= 0) {
        throw ConfigurationError("timeout must be greater than zero",
                                 std::to_string(config.timeout.count()) + "ms");
    }
    if (config.workers == 0 || config.workers > kMaxCount) {
        throw ConfigurationError("workers must be between 1 and " + std::to_string(kMaxCount),
                                 std::to_string(config.workers));
    }
    if (config.port_concurrency == 0 || config.port_concurrency > kMaxCount) {
        throw ConfigurationError("port concurrency must be between 1 and " + std::to_string(kMaxCount),
                                 std::to_string(config.port_concurrency));
    }
    if (config.max_runtime.count() < 0) {
        throw ConfigurationError("max runtime must not be negative",
                                 std::to_string(config.max_runtime.count()) + "ms");
    }
    if (config.ports.empty()) {
        throw ConfigurationError("no ports to scan", "");
    }
    if (config.liveness_enabled && config.liveness_ports.empty()) {
        throw ConfigurationError("liveness probing enabled without liveness ports", "");
    }
    if (config.output_format != "text" && config.output_format != "json") {
        throw ConfigurationError("unknown output format '" + config.output_format + "'",
                                 config.output_format);
    }
}

} // namespace netrecon
