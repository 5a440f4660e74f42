#pragma once

#include "netrecon/core/types.h"
#include "netrecon/core/scan_config.h"
#include "netrecon/network/liveness_prober.h"
#include "netrecon/network/port_scanner.h"
#include "netrecon/enrich/enricher.h"
#include <atomic>
#include <optional>
#include <stop_token>

namespace netrecon {

// =====================
// 主机会话（HostSession）
// =====================
// 封装单个目标的完整生命周期：
// 存活探测 -> 端口扫描 -> 补充信息 -> 报告
// 任意非终止状态都可转入 CANCELLED

class HostSession {
public:
    enum class State {
        PENDING,        // 待探测
        PROBING,        // 存活探测中
        DOWN,           // 不存活（终止，丢弃）
        SCANNING,       // 端口扫描中
        ENRICHING,      // 补充信息中
        REPORTED,       // 报告完成
        CANCELLED       // 被取消
    };

    HostSession(
        const Address& address,
        ILivenessProber& prober,
        IPortScanner& scanner,
        IEnricher& enricher,
        const ScanConfig& config
    );

    // 执行全部阶段；主机不存活或在端口扫描完成前被取消时返回 std::nullopt
    // 补充信息阶段被取消时返回已收集部分，complete = false
    std::optional<HostReport> run(std::stop_token stop);

    // ====== 访问器 ======
    const Address& address() const { return address_; }
    State state() const { return state_.load(); }
    Liveness liveness() const { return liveness_.load(); }

    // ====== 状态转换 ======
    bool set_state(State from, State to);

private:
    static bool is_terminal(State state);

    // 任意非终止状态 -> CANCELLED
    void cancel();

    void enrich(HostReport& report, std::stop_token stop);

    Address address_;
    ILivenessProber& prober_;
    IPortScanner& scanner_;
    IEnricher& enricher_;
    const ScanConfig& config_;
    std::atomic<State> state_{State::PENDING};
    std::atomic<Liveness> liveness_{Liveness::Unknown};
};

const char* to_string(HostSession::State state);

} // namespace netrecon
