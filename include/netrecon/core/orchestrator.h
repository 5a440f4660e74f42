#pragma once

#include "netrecon/core/types.h"
#include "netrecon/core/scan_config.h"
#include "netrecon/network/liveness_prober.h"
#include "netrecon/network/port_scanner.h"
#include "netrecon/enrich/enricher.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <vector>

namespace netrecon {

// 一次运行的统计
struct ScanStatistics {
    std::size_t targets = 0;
    std::size_t hosts_up = 0;           // 产生报告的主机
    std::size_t hosts_alive = 0;        // 通过存活探测的主机（含端口扫描中被取消的）
    std::size_t hosts_down = 0;
    std::size_t hosts_cancelled = 0;
    std::size_t hosts_failed = 0;       // 任务内部异常
    std::size_t open_ports = 0;
    std::chrono::milliseconds elapsed{0};
};

// =====================
// 扫描编排器
// =====================
// 外层 ThreadPool 每个目标一个任务，任务内依次执行 HostSession 各阶段；
// 结果按输入顺序汇总，与完成顺序无关

class ScanOrchestrator {
public:
    ScanOrchestrator(
        std::shared_ptr<ILivenessProber> prober,
        std::shared_ptr<IPortScanner> scanner,
        std::shared_ptr<IEnricher> enricher
    );

    // 阻塞直到所有目标结束或被取消；返回存活主机的报告
    std::vector<HostReport> run(
        const std::vector<Address>& targets,
        const ScanConfig& config,
        std::stop_token stop = {}
    );

    // 最近一次 run 的统计
    ScanStatistics statistics() const;

private:
    std::shared_ptr<ILivenessProber> prober_;
    std::shared_ptr<IPortScanner> scanner_;
    std::shared_ptr<IEnricher> enricher_;

    std::atomic<std::size_t> targets_{0};
    std::atomic<std::size_t> hosts_up_{0};
    std::atomic<std::size_t> hosts_alive_{0};
    std::atomic<std::size_t> hosts_down_{0};
    std::atomic<std::size_t> hosts_cancelled_{0};
    std::atomic<std::size_t> hosts_failed_{0};
    std::atomic<std::size_t> open_ports_{0};
    std::atomic<int64_t> elapsed_ms_{0};
};

} // namespace netrecon
