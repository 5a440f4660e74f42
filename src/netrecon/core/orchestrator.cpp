#include "netrecon/core/orchestrator.h"
#include "netrecon/core/host_session.h"
#include "netrecon/common/thread_pool.h"
#include "netrecon/common/logger.h"
#include <algorithm>
#include <future>
#include <stdexcept>

namespace netrecon {

ScanOrchestrator::ScanOrchestrator(
    std::shared_ptr<ILivenessProber> prober,
    std::shared_ptr<IPortScanner> scanner,
    std::shared_ptr<IEnricher> enricher
)
    : prober_(std::move(prober)),
      scanner_(std::move(scanner)),
      enricher_(std::move(enricher)) {
    if (!prober_ || !scanner_ || !enricher_) {
        throw std::invalid_argument("ScanOrchestrator requires prober, scanner and enricher");
    }
}

std::vector<HostReport> ScanOrchestrator::run(
    const std::vector<Address>& targets,
    const ScanConfig& config,
    std::stop_token stop
) {
    auto start = std::chrono::steady_clock::now();

    targets_.store(targets.size());
    hosts_up_.store(0);
    hosts_alive_.store(0);
    hosts_down_.store(0);
    hosts_cancelled_.store(0);
    hosts_failed_.store(0);
    open_ports_.store(0);
    elapsed_ms_.store(0);

    std::vector<HostReport> reports;
    if (targets.empty()) {
        return reports;
    }

    std::size_t workers = std::max<std::size_t>(1, std::min(config.workers, targets.size()));
    LOG_CORE_INFO("Scanning {} target(s), {} port(s) each, {} worker(s)",
                  targets.size(), config.ports.size(), workers);

    ThreadPool pool(workers);
    std::vector<std::future<std::optional<HostReport>>> futures;
    futures.reserve(targets.size());

    for (const auto& address : targets) {
        futures.push_back(pool.submit([this, address, &config, stop]() -> std::optional<HostReport> {
            HostSession session(address, *prober_, *scanner_, *enricher_, config);
            auto report = session.run(stop);

            switch (session.liveness()) {
                case Liveness::Up:
                    hosts_alive_.fetch_add(1, std::memory_order_relaxed);
                    break;
                case Liveness::Down:
                    hosts_down_.fetch_add(1, std::memory_order_relaxed);
                    break;
                case Liveness::Unknown:
                    break;
            }
            if (session.state() == HostSession::State::CANCELLED) {
                hosts_cancelled_.fetch_add(1, std::memory_order_relaxed);
            }
            if (report) {
                hosts_up_.fetch_add(1, std::memory_order_relaxed);
                open_ports_.fetch_add(report->open_ports.size(), std::memory_order_relaxed);
            }
            return report;
        }));
    }

    // 按输入顺序收集
    for (std::size_t i = 0; i < futures.size(); ++i) {
        try {
            auto report = futures[i].get();
            if (report) {
                reports.push_back(std::move(*report));
            }
        } catch (const std::exception& e) {
            hosts_failed_.fetch_add(1, std::memory_order_relaxed);
            LOG_CORE_ERROR("Scan of {} failed: {}", targets[i].to_string(), e.what());
        }
    }

    pool.shutdown();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    elapsed_ms_.store(elapsed.count());

    LOG_CORE_INFO("Done: {} reported, {} alive, {} down, {} cancelled, {} open port(s) in {} ms{}",
                  hosts_up_.load(), hosts_alive_.load(), hosts_down_.load(), hosts_cancelled_.load(),
                  open_ports_.load(), elapsed.count(),
                  stop.stop_requested() ? " (interrupted)" : "");
    return reports;
}

ScanStatistics ScanOrchestrator::statistics() const {
    ScanStatistics s;
    s.targets = targets_.load();
    s.hosts_up = hosts_up_.load();
    s.hosts_alive = hosts_alive_.load();
    s.hosts_down = hosts_down_.load();
    s.hosts_cancelled = hosts_cancelled_.load();
    s.hosts_failed = hosts_failed_.load();
    s.open_ports = open_ports_.load();
    s.elapsed = std::chrono::milliseconds(elapsed_ms_.load());
    return s;
}

} // namespace netrecon
