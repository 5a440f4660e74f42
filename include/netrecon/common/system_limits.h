#pragma once

#include <cstddef>

namespace netrecon {

// 保留给标准流、日志文件、DNS、nmap 管道等的文件描述符
constexpr std::size_t kReservedDescriptors = 150;

// 查询 RLIMIT_NOFILE，尽量把软限制提升到硬限制；返回最终软限制
std::size_t raise_descriptor_limit();

// 依据描述符上限与并发配置计算在途连接上限
// requested 非 0 时作为上限参与取小
std::size_t derive_in_flight_ceiling(std::size_t descriptor_limit,
                                     std::size_t workers,
                                     std::size_t per_host_attempts,
                                     std::size_t requested);

} // namespace netrecon
