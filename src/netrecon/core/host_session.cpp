#include "netrecon/core/host_session.h"
#include "netrecon/common/logger.h"

namespace netrecon {

const char* to_string(HostSession::State state) {
    switch (state) {
        case HostSession::State::PENDING:   return "pending";
        case HostSession::State::PROBING:   return "probing";
        case HostSession::State::DOWN:      return "down";
        case HostSession::State::SCANNING:  return "scanning";
        case HostSession::State::ENRICHING: return "enriching";
        case HostSession::State::REPORTED:  return "reported";
        case HostSession::State::CANCELLED: return "cancelled";
    }
    return "unknown";
}

HostSession::HostSession(
    const Address& address,
    ILivenessProber& prober,
    IPortScanner& scanner,
    IEnricher& enricher,
    const ScanConfig& config
)
    : address_(address),
      prober_(prober),
      scanner_(scanner),
      enricher_(enricher),
      config_(config) {}

bool HostSession::set_state(State from, State to) {
    State expected = from;
    return state_.compare_exchange_strong(expected, to);
}

bool HostSession::is_terminal(State state) {
    return state == State::DOWN || state == State::REPORTED || state == State::CANCELLED;
}

void HostSession::cancel() {
    auto s = state_.load();
    while (!is_terminal(s)) {
        if (state_.compare_exchange_weak(s, State::CANCELLED)) {
            LOG_CORE_DEBUG("{} cancelled while {}", address_.to_string(), to_string(s));
            return;
        }
    }
}

std::optional<HostReport> HostSession::run(std::stop_token stop) {
    if (stop.stop_requested() || !set_state(State::PENDING, State::PROBING)) {
        cancel();
        return std::nullopt;
    }

    // ====== 存活探测 ======
    bool up = prober_.probe(address_, config_.timeout, stop);
    if (stop.stop_requested()) {
        cancel();
        return std::nullopt;
    }
    if (!up) {
        liveness_.store(Liveness::Down);
        set_state(State::PROBING, State::DOWN);
        LOG_CORE_DEBUG("{} is down", address_.to_string());
        return std::nullopt;
    }
    liveness_.store(Liveness::Up);

    // ====== 端口扫描 ======
    if (!set_state(State::PROBING, State::SCANNING)) {
        cancel();
        return std::nullopt;
    }
    auto open = scanner_.scan(address_, config_.ports, config_.timeout, config_.port_concurrency, stop);
    if (stop.stop_requested()) {
        // 部分结果不可信，丢弃
        cancel();
        return std::nullopt;
    }

    HostReport report;
    report.address = address_;
    report.open_ports.reserve(open.size());
    for (Port p : open) {
        report.open_ports.push_back(OpenPort{p, ""});
    }
    LOG_CORE_INFO("{} is up, {} open port(s)", address_.to_string(), open.size());

    // ====== 补充信息 ======
    if (!set_state(State::SCANNING, State::ENRICHING)) {
        cancel();
        return std::nullopt;
    }
    enrich(report, stop);

    if (!report.complete) {
        cancel();
        return report;
    }
    set_state(State::ENRICHING, State::REPORTED);
    return report;
}

void HostSession::enrich(HostReport& report, std::stop_token stop) {
    const std::string ip = address_.to_string();

    if (stop.stop_requested()) {
        report.complete = false;
        return;
    }
    try {
        report.hostname = enricher_.resolve_hostname(address_);
    } catch (const std::exception& e) {
        LOG_ENRICH_DEBUG("Hostname lookup for {} failed: {}", ip, e.what());
    }

    if (stop.stop_requested()) {
        report.complete = false;
        return;
    }
    try {
        report.mac = enricher_.lookup_link_layer_address(address_);
    } catch (const std::exception& e) {
        LOG_ENRICH_DEBUG("MAC lookup for {} failed: {}", ip, e.what());
    }

    if (stop.stop_requested()) {
        report.complete = false;
        return;
    }
    try {
        std::vector<Port> ports;
        ports.reserve(report.open_ports.size());
        for (const auto& op : report.open_ports) {
            ports.push_back(op.port);
        }

        auto fp = enricher_.detect_service_and_os(address_, ports, stop);
        report.os_guess = fp.os_guess;
        for (auto& op : report.open_ports) {
            auto it = fp.services.find(op.port);
            if (it != fp.services.end()) {
                op.service = it->second;
            }
        }
    } catch (const std::exception& e) {
        LOG_ENRICH_DEBUG("Fingerprinting {} failed: {}", ip, e.what());
    }

    if (stop.stop_requested()) {
        report.complete = false;
    }
}

} // namespace netrecon
