#include "netrecon/network/tcp_connector.h"
#include "netrecon/common/logger.h"
#include <future>
#include <optional>

namespace netrecon {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using steady_timer = asio::steady_timer;

const char* to_string(ConnectOutcome outcome) {
    switch (outcome) {
        case ConnectOutcome::Open:        return "open";
        case ConnectOutcome::Refused:     return "refused";
        case ConnectOutcome::TimedOut:    return "timed out";
        case ConnectOutcome::Unreachable: return "unreachable";
        case ConnectOutcome::Cancelled:   return "cancelled";
        case ConnectOutcome::Failed:      return "failed";
    }
    return "unknown";
}

namespace {

ConnectOutcome classify(const boost::system::error_code& ec) {
    if (!ec) return ConnectOutcome::Open;
    if (ec == asio::error::connection_refused) return ConnectOutcome::Refused;
    if (ec == asio::error::timed_out) return ConnectOutcome::TimedOut;
    if (ec == asio::error::host_unreachable || ec == asio::error::network_unreachable) {
        return ConnectOutcome::Unreachable;
    }
    return ConnectOutcome::Failed;
}

// 单次连接的上下文；所有成员只在所属 io_context 线程上访问
struct ConnectContext {
    tcp::socket socket;
    steady_timer timer;
    ConnectionLimiter& limiter;
    TcpConnector::Callback on_complete;
    std::optional<std::stop_callback<std::function<void()>>> stop_cb;
    tcp::endpoint endpoint;
    bool completed{false};

    ConnectContext(asio::any_io_executor exec, ConnectionLimiter& l, TcpConnector::Callback cb)
        : socket(exec), timer(exec), limiter(l), on_complete(std::move(cb)) {}

    void finish(ConnectOutcome outcome) {
        if (completed) return;
        completed = true;
        // 先注销取消回调，之后不会再有跨线程访问
        stop_cb.reset();
        boost::system::error_code ec;
        (void)timer.cancel();
        socket.close(ec);
        limiter.release();
        LOG_PORT_SCAN_TRACE("{} -> {}", endpoint.address().to_string() + ":" + std::to_string(endpoint.port()),
                            to_string(outcome));
        if (on_complete) {
            auto cb = std::move(on_complete);
            cb(outcome);
        }
    }
};

void start_connect(const std::shared_ptr<ConnectContext>& ctx, Timeout timeout, std::stop_token stop) {
    if (stop.stop_requested()) {
        ctx->finish(ConnectOutcome::Cancelled);
        return;
    }

    // request_stop 在其他线程调用时，只投递一个 finish 到本 socket 的执行器
    std::weak_ptr<ConnectContext> weak = ctx;
    ctx->stop_cb.emplace(stop, std::function<void()>([weak]() {
        if (auto c = weak.lock()) {
            asio::post(c->socket.get_executor(), [c]() { c->finish(ConnectOutcome::Cancelled); });
        }
    }));

    ctx->timer.expires_after(timeout);
    ctx->timer.async_wait([ctx](const boost::system::error_code& ec) {
        if (!ec) {
            ctx->finish(ConnectOutcome::TimedOut);
        }
    });

    ctx->socket.async_connect(ctx->endpoint, [ctx](const boost::system::error_code& ec) {
        if (ctx->completed || ec == asio::error::operation_aborted) {
            return;
        }
        auto outcome = classify(ec);
        if (outcome == ConnectOutcome::Failed) {
            LOG_PORT_SCAN_WARN("Connect to {}:{} failed: {}",
                               ctx->endpoint.address().to_string(), ctx->endpoint.port(), ec.message());
        }
        ctx->finish(outcome);
    });
}

} // namespace

TcpConnector::TcpConnector(IoThreadPool& io, ConnectionLimiter& limiter)
    : io_(io), limiter_(limiter) {}

bool TcpConnector::async_connect(
    const Address& address,
    Port port,
    Timeout timeout,
    std::stop_token stop,
    Callback on_complete
) {
    if (!limiter_.acquire(stop)) {
        return false;
    }

    auto ctx = std::make_shared<ConnectContext>(io_.get_executor(), limiter_, std::move(on_complete));
    ctx->endpoint = tcp::endpoint(asio::ip::address(address), port);

    // 定时器、取消回调与 connect 都在 socket 自己的线程上建立
    asio::post(ctx->socket.get_executor(), [ctx, timeout, stop]() {
        start_connect(ctx, timeout, stop);
    });
    return true;
}

ConnectOutcome TcpConnector::connect(
    const Address& address,
    Port port,
    Timeout timeout,
    std::stop_token stop
) {
    auto promise = std::make_shared<std::promise<ConnectOutcome>>();
    auto future = promise->get_future();

    bool started = async_connect(address, port, timeout, stop, [promise](ConnectOutcome outcome) {
        promise->set_value(outcome);
    });
    if (!started) {
        return ConnectOutcome::Cancelled;
    }
    return future.get();
}

} // namespace netrecon
