#include "netrecon/network/port_scanner.h"
#include "netrecon/common/logger.h"
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace netrecon {

namespace {

struct WindowState {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::size_t in_flight = 0;
    std::vector<Port> open;
    std::size_t refused = 0;
    std::size_t silent = 0;
};

} // namespace

TcpPortScanner::TcpPortScanner(TcpConnector& connector)
    : connector_(connector) {}

std::vector<Port> TcpPortScanner::scan(
    const Address& address,
    const std::vector<Port>& ports,
    Timeout timeout,
    std::size_t concurrency,
    std::stop_token stop
) {
    if (concurrency == 0) concurrency = 1;
    auto state = std::make_shared<WindowState>();

    for (Port port : ports) {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            // 窗口满时等待任一尝试完成
            if (!state->cv.wait(lock, stop, [&]() { return state->in_flight < concurrency; })) {
                break;
            }
            ++state->in_flight;
        }

        bool started = connector_.async_connect(address, port, timeout, stop,
            [state, port](ConnectOutcome outcome) {
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    --state->in_flight;
                    if (outcome == ConnectOutcome::Open) {
                        state->open.push_back(port);
                    } else if (outcome == ConnectOutcome::Refused) {
                        ++state->refused;
                    } else {
                        ++state->silent;
                    }
                }
                state->cv.notify_all();
            });

        if (!started) {
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->in_flight;
            break;
        }
    }

    // 取消后 connector 会尽快完成在途尝试，这里不带 stop 等待，保证回调不再访问结果
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait(lock, [&]() { return state->in_flight == 0; });

    std::vector<Port> open = std::move(state->open);
    std::sort(open.begin(), open.end());

    LOG_PORT_SCAN_DEBUG("{}: {} open, {} refused, {} silent{}", address.to_string(),
                        open.size(), state->refused, state->silent,
                        stop.stop_requested() ? " (cancelled)" : "");
    return open;
}

} // namespace netrecon
