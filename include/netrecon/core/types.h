#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <chrono>
#include <optional>
#include <boost/asio/ip/address_v4.hpp>

namespace netrecon {

// =====================
// 基础类型定义
// =====================

using Port = uint16_t;

// 统一的超时类型别名
using Timeout = std::chrono::milliseconds;

using Address = boost::asio::ip::address_v4;

// 单次 TCP 连接尝试的结果
enum class ConnectOutcome {
    Open,           // 三次握手完成
    Refused,        // 收到 RST
    TimedOut,       // 超时无应答
    Unreachable,    // 主机 / 网络不可达
    Cancelled,      // 运行被取消
    Failed          // 其他本地错误（如 socket 创建失败）
};

const char* to_string(ConnectOutcome outcome);

// 主机存活状态
enum class Liveness {
    Unknown,
    Up,
    Down
};

// 开放端口及服务名（未知时为空）
struct OpenPort {
    Port port = 0;
    std::string service;

    bool operator==(const OpenPort& other) const {
        return port == other.port && service == other.service;
    }
};

// 单主机扫描报告
struct HostReport {
    Address address;
    std::optional<std::string> hostname;
    std::optional<std::string> mac;
    std::optional<std::string> os_guess;
    std::vector<OpenPort> open_ports;      // 端口升序
    bool complete = true;                  // 补充信息阶段被取消时为 false
};

// 服务 / 操作系统识别结果
struct FingerprintResult {
    std::optional<std::string> os_guess;
    std::map<Port, std::string> services;
};

} // namespace netrecon
