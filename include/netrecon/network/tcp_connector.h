#pragma once

#include "netrecon/core/types.h"
#include "netrecon/common/io_thread_pool.h"
#include "netrecon/common/connection_limiter.h"
#include <functional>
#include <stop_token>

namespace netrecon {

// =====================
// TCP 连接器
// =====================
// 所有连接尝试的唯一出口：
//   - 发起前向 ConnectionLimiter 申请槽位（可能阻塞调用线程）
//   - socket 与定时器挂在 IoThreadPool 的某个 io_context 上异步执行
//   - stop_token 被请求时中止在途连接，不必等到超时
// 回调恰好调用一次，在 I/O 线程上执行

class TcpConnector {
public:
    using Callback = std::function<void(ConnectOutcome)>;

    TcpConnector(IoThreadPool& io, ConnectionLimiter& limiter);

    // 异步连接；在获得槽位前 stop 被请求则返回 false，且不会调用回调
    bool async_connect(
        const Address& address,
        Port port,
        Timeout timeout,
        std::stop_token stop,
        Callback on_complete
    );

    // 同步封装：阻塞直到连接结果产生
    ConnectOutcome connect(
        const Address& address,
        Port port,
        Timeout timeout,
        std::stop_token stop = {}
    );

private:
    IoThreadPool& io_;
    ConnectionLimiter& limiter_;
};

} // namespace netrecon
