#pragma once

#include "netrecon/core/types.h"
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace netrecon {

// 解析 nmap -oG 输出：Ports 字段中 open 端口的服务名，OS 字段作为系统猜测
// 无法识别的行忽略，不抛异常
FingerprintResult parse_grepable(const std::string& output);

// =====================
// nmap 服务 / 系统识别
// =====================

class NmapFingerprinter {
public:
    // 在 PATH 中查找可执行文件；name 含 '/' 时直接检查该路径
    static std::optional<std::string> find_executable(const std::string& name);

    // executable 为 find_executable 返回的路径
    NmapFingerprinter(std::string executable, Timeout host_timeout, bool os_detection);

    // 对 ports 做版本探测；任何失败、超时或取消都返回空结果
    // nmap 运行超过 host_timeout 加余量，或 stop 被请求时，整个进程组被 SIGKILL
    FingerprintResult run(const Address& address, const std::vector<Port>& ports, std::stop_token stop) const;

    // argv，第一个元素为可执行文件路径
    std::vector<std::string> build_arguments(const Address& address, const std::vector<Port>& ports) const;

private:
    // fork/exec 并读取 stdout；被杀死或退出码非 0 时返回 std::nullopt
    std::optional<std::string> capture_output(const std::vector<std::string>& args, std::stop_token stop) const;

    std::string executable_;
    Timeout host_timeout_;
    bool os_detection_;
};

} // namespace netrecon
