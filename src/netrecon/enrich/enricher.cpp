#include "netrecon/enrich/enricher.h"
#include "netrecon/common/logger.h"
#include <unistd.h>

namespace netrecon {

SystemEnricher::SystemEnricher(
    std::optional<CAresReverseResolver> resolver,
    std::optional<NeighborTable> neighbors,
    std::optional<NmapFingerprinter> fingerprinter
)
    : resolver_(std::move(resolver)),
      neighbors_(std::move(neighbors)),
      fingerprinter_(std::move(fingerprinter)) {}

std::optional<std::string> SystemEnricher::resolve_hostname(const Address& address) {
    if (!resolver_) return std::nullopt;
    return resolver_->lookup(address);
}

std::optional<std::string> SystemEnricher::lookup_link_layer_address(const Address& address) {
    if (!neighbors_) return std::nullopt;
    return neighbors_->lookup(address);
}

FingerprintResult SystemEnricher::detect_service_and_os(
    const Address& address,
    const std::vector<Port>& open_ports,
    std::stop_token stop
) {
    if (!fingerprinter_) return {};
    return fingerprinter_->run(address, open_ports, stop);
}

std::unique_ptr<IEnricher> EnricherFactory::create(const ScanConfig& config) {
    if (!config.resolve_hostnames && !config.lookup_mac && !config.fingerprint) {
        LOG_ENRICH_INFO("Enrichment disabled");
        return std::make_unique<NullEnricher>();
    }

    std::optional<CAresReverseResolver> resolver;
    if (config.resolve_hostnames) {
        resolver.emplace(config.dns_timeout);
    }

    std::optional<NeighborTable> neighbors;
    if (config.lookup_mac) {
        neighbors.emplace(config.neighbor_table_path);
    }

    std::optional<NmapFingerprinter> fingerprinter;
    if (config.fingerprint) {
        auto exe = NmapFingerprinter::find_executable(config.nmap_path);
        if (exe) {
            // -O 需要原始套接字
            bool os_detection = (geteuid() == 0);
            fingerprinter.emplace(*exe, config.fingerprint_timeout, os_detection);
            LOG_ENRICH_INFO("Fingerprinting with {}{}", *exe,
                            os_detection ? "" : " (service detection only, OS detection needs root)");
        } else {
            LOG_ENRICH_WARN("'{}' not found, service and OS detection disabled", config.nmap_path);
        }
    }

    return std::make_unique<SystemEnricher>(std::move(resolver), std::move(neighbors), std::move(fingerprinter));
}

} // namespace netrecon
