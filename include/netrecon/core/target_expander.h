#pragma once

#include "netrecon/core/types.h"
#include <string>
#include <vector>

namespace netrecon {

// =====================
// 目标展开
// =====================
// 纯计算，无网络 I/O；非法输入抛出 InvalidAddress / InvalidRange / InvalidCIDR

// 单个 CIDR 块最多展开的地址数（/8）
constexpr uint64_t kMaxBlockSize = uint64_t(1) << 24;

// "192.168.0.10"
std::vector<Address> expand_host(const std::string& spec);

// "192.168.0.1-192.168.0.49" 或 "192.168.0.1-49"，端点仅最后一段可不同
std::vector<Address> expand_range(const std::string& spec);

// "192.168.0.0/24"；前缀 < 31 时去掉网络地址与广播地址
std::vector<Address> expand_cidr(const std::string& spec);

// 按形态自动识别：含 '/' 为 CIDR，含 '-' 为区间，否则为单主机
std::vector<Address> expand(const std::string& spec);

// 依次展开多个 spec，去重并保留首次出现的顺序
std::vector<Address> expand_all(const std::vector<std::string>& specs);

// 读取目标文件：每行一个 spec，忽略空行与 '#'、';' 开头的注释
std::vector<std::string> load_target_specs(const std::string& path);

} // namespace netrecon
