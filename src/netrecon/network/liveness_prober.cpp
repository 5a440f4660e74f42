#include "netrecon/network/liveness_prober.h"
#include "netrecon/common/logger.h"
#include <condition_variable>
#include <mutex>

namespace netrecon {

namespace {

struct ProbeState {
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t pending = 0;
    bool up = false;
    Port answered_port = 0;
    ConnectOutcome answer = ConnectOutcome::TimedOut;
};

} // namespace

TcpLivenessProber::TcpLivenessProber(TcpConnector& connector, std::vector<Port> probe_ports)
    : connector_(connector), probe_ports_(std::move(probe_ports)) {}

bool TcpLivenessProber::probe(const Address& address, Timeout timeout, std::stop_token stop) {
    // 在途尝试可能晚于本函数返回才完成，状态需共享所有权
    auto state = std::make_shared<ProbeState>();

    for (Port port : probe_ports_) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->up) break;
            ++state->pending;
        }

        bool started = connector_.async_connect(address, port, timeout, stop,
            [state, port](ConnectOutcome outcome) {
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    --state->pending;
                    if (!state->up &&
                        (outcome == ConnectOutcome::Open || outcome == ConnectOutcome::Refused)) {
                        state->up = true;
                        state->answered_port = port;
                        state->answer = outcome;
                    }
                }
                state->cv.notify_all();
            });

        if (!started) {
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->pending;
            break;
        }
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait(lock, [&state]() { return state->up || state->pending == 0; });

    if (state->up) {
        LOG_LIVENESS_DEBUG("{} is up ({} on port {})", address.to_string(),
                           to_string(state->answer), state->answered_port);
    } else {
        LOG_LIVENESS_DEBUG("{} is down", address.to_string());
    }
    return state->up && !stop.stop_requested();
}

} // namespace netrecon
