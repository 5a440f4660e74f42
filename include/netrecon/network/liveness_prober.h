#pragma once

#include "netrecon/core/types.h"
#include "netrecon/network/tcp_connector.h"
#include <stop_token>
#include <vector>

namespace netrecon {

// =====================
// 存活探测接口
// =====================

class ILivenessProber {
public:
    virtual ~ILivenessProber() = default;

    // true 表示主机存活；取消时返回 false
    virtual bool probe(const Address& address, Timeout timeout, std::stop_token stop) = 0;
};

// =====================
// 基于 TCP connect 的存活探测
// =====================
// 并行连接若干常见端口，任一端口完成握手或返回 RST 即判定存活；
// 全部超时 / 不可达才判定为 down。
// 过滤了全部探测端口、却在其他端口提供服务的主机会被误判为 down。

class TcpLivenessProber : public ILivenessProber {
public:
    TcpLivenessProber(TcpConnector& connector, std::vector<Port> probe_ports);

    bool probe(const Address& address, Timeout timeout, std::stop_token stop) override;

private:
    TcpConnector& connector_;
    std::vector<Port> probe_ports_;
};

// 不探测，所有目标视为存活
class AssumeUpProber : public ILivenessProber {
public:
    bool probe(const Address&, Timeout, std::stop_token) override { return true; }
};

} // namespace netrecon
