#pragma once

#include "netrecon/core/types.h"
#include <optional>
#include <string>

namespace netrecon {

// =====================
// c-ares 反向解析（PTR）
// =====================
// 每次查询使用独立 channel，可在多个工作线程中并发调用

class CAresReverseResolver {
public:
    explicit CAresReverseResolver(Timeout timeout = Timeout(1000));

    // 查询失败、超时或无 PTR 记录时返回 std::nullopt
    std::optional<std::string> lookup(const Address& address) const;


private:
    Timeout timeout_;
};

} // namespace netrecon
