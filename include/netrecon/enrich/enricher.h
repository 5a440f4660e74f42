#pragma once

#include "netrecon/core/types.h"
#include "netrecon/core/scan_config.h"
#include "netrecon/enrich/reverse_resolver.h"
#include "netrecon/enrich/neighbor_table.h"
#include "netrecon/enrich/fingerprinter.h"
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace netrecon {

// =====================
// 补充信息接口
// =====================
// 所有方法尽力而为：拿不到即返回空，不向调用方抛出

class IEnricher {
public:
    virtual ~IEnricher() = default;

    virtual std::optional<std::string> resolve_hostname(const Address& address) = 0;

    virtual std::optional<std::string> lookup_link_layer_address(const Address& address) = 0;

    // 可能耗时较长；stop 被请求时尽快返回空结果
    virtual FingerprintResult detect_service_and_os(
        const Address& address,
        const std::vector<Port>& open_ports,
        std::stop_token stop
    ) = 0;
};

// 全部返回空
class NullEnricher : public IEnricher {
public:
    std::optional<std::string> resolve_hostname(const Address&) override { return std::nullopt; }
    std::optional<std::string> lookup_link_layer_address(const Address&) override { return std::nullopt; }
    FingerprintResult detect_service_and_os(const Address&, const std::vector<Port>&, std::stop_token) override {
        return {};
    }
};

// =====================
// 系统数据源
// =====================
// 反向 DNS（c-ares）、内核邻居表、nmap；未配置的数据源返回空

class SystemEnricher : public IEnricher {
public:
    SystemEnricher(
        std::optional<CAresReverseResolver> resolver,
        std::optional<NeighborTable> neighbors,
        std::optional<NmapFingerprinter> fingerprinter
    );

    std::optional<std::string> resolve_hostname(const Address& address) override;

    std::optional<std::string> lookup_link_layer_address(const Address& address) override;

    FingerprintResult detect_service_and_os(
        const Address& address,
        const std::vector<Port>& open_ports,
        std::stop_token stop
    ) override;

    bool has_fingerprinter() const { return fingerprinter_.has_value(); }

private:
    std::optional<CAresReverseResolver> resolver_;
    std::optional<NeighborTable> neighbors_;
    std::optional<NmapFingerprinter> fingerprinter_;
};

// =====================
// 补充信息工厂
// =====================
// 启动时调用一次：探测 nmap 是否可用，按配置组装数据源

class EnricherFactory {
public:
    static std::unique_ptr<IEnricher> create(const ScanConfig& config);
};

} // namespace netrecon
