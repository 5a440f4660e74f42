#pragma once

#include "netrecon/core/types.h"
#include <string>
#include <vector>
#include <chrono>

namespace netrecon {

// workers / port_concurrency 的上限
constexpr std::size_t kMaxCount = 65535;

// =====================
// 扫描配置
// =====================
// 启动时构建一次，运行期间只读，按值或 const 引用传给各组件

struct ScanConfig {
    // Scan 配置
    Timeout timeout = Timeout(500);          // 每次 connect 的超时
    std::size_t workers = 16;                // 外层并发：同时处理的主机数
    std::size_t port_concurrency = 128;      // 内层并发：单主机同时在途的端口连接数
    std::size_t max_in_flight = 0;           // 全局在途连接上限（0 表示按 FD 限制推导）
    std::vector<Port> ports;                 // 已解析端口集合
    std::chrono::milliseconds max_runtime{0}; // 整体运行期限（0 表示不限制）

    // Liveness 配置
    bool liveness_enabled = true;            // false 时视所有目标为存活
    std::vector<Port> liveness_ports = {80, 443, 22, 445, 139};

    // Enrichment 配置
    bool resolve_hostnames = true;
    bool lookup_mac = true;
    bool fingerprint = true;
    Timeout dns_timeout = Timeout(1000);
    Timeout fingerprint_timeout = Timeout(60000);
    std::string nmap_path = "nmap";
    std::string neighbor_table_path = "/proc/net/arp";

    // Output 配置
    std::string output_format = "text";      // text 或 json

    // Logging 配置
    std::string logging_level = "info";
    std::string logging_file_path;           // 为空时只输出到 stderr
};

// 从 JSON 文件叠加配置；文件不存在时抛出 ConfigurationError，
// JSON 解析失败时记录警告并保留传入的默认值
ScanConfig load_config(const std::string& config_file, ScanConfig base = {});

// 检查数值取值；非法时抛出 ConfigurationError
void validate_config(const ScanConfig& config);

} // namespace netrecon
