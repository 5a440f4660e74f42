#pragma once

#include "netrecon/core/types.h"
#include "netrecon/network/tcp_connector.h"
#include <stop_token>
#include <vector>

namespace netrecon {

// =====================
// 端口扫描接口
// =====================

class IPortScanner {
public:
    virtual ~IPortScanner() = default;

    // 返回升序的开放端口；取消时返回已知部分，由调用方丢弃
    virtual std::vector<Port> scan(
        const Address& address,
        const std::vector<Port>& ports,
        Timeout timeout,
        std::size_t concurrency,
        std::stop_token stop
    ) = 0;
};

// =====================
// TCP connect 扫描
// =====================
// 单主机同时在途的尝试数不超过 concurrency，
// 每次尝试另受 TcpConnector 的全局上限约束。不重试。

class TcpPortScanner : public IPortScanner {
public:
    explicit TcpPortScanner(TcpConnector& connector);

    std::vector<Port> scan(
        const Address& address,
        const std::vector<Port>& ports,
        Timeout timeout,
        std::size_t concurrency,
        std::stop_token stop
    ) override;

private:
    TcpConnector& connector_;
};

} // namespace netrecon
