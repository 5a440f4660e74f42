#include "netrecon/core/port_resolver.h"
#include "netrecon/core/errors.h"
#include "netrecon/common/logger.h"
#include "netrecon/common/string_utils.h"
#include <bitset>

namespace netrecon {

namespace {

constexpr uint32_t kMaxPort = 65535;

std::vector<Port> resolve_range(const std::string& spec) {
    auto parts = split(spec, '-');
    if (parts.size() != 2) {
        throw InvalidPortRange(spec, "expected <low>-<high>");
    }
    auto low = parse_decimal(trim(parts[0]), kMaxPort);
    auto high = parse_decimal(trim(parts[1]), kMaxPort);
    if (!low || !high || *low == 0 || *high == 0) {
        throw InvalidPortRange(spec, "ports must be integers in 1-65535");
    }
    if (*low > *high) {
        throw InvalidPortRange(spec, "low port is greater than high port");
    }

    std::vector<Port> ports;
    ports.reserve(*high - *low + 1);
    for (uint32_t p = *low; p <= *high; ++p) {
        ports.push_back(static_cast<Port>(p));
    }
    return ports;
}

std::vector<Port> resolve_list(const std::string& spec) {
    std::vector<Port> ports;
    std::bitset<kMaxPort + 1> seen;

    for (const auto& raw : split(spec, ',')) {
        std::string token = trim(raw);
        auto value = parse_decimal(token, kMaxPort);
        if (!value || *value == 0) {
            throw InvalidPortList(spec, "bad port '" + token + "'");
        }
        if (!seen.test(*value)) {
            seen.set(*value);
            ports.push_back(static_cast<Port>(*value));
        }
    }
    return ports;
}

} // namespace

std::vector<Port> resolve_ports(const std::string& raw_spec) {
    std::string spec = trim(raw_spec);

    std::vector<Port> ports;
    if (spec.find(',') != std::string::npos) {
        ports = resolve_list(spec);
    } else if (spec.find('-') != std::string::npos) {
        ports = resolve_range(spec);
    } else {
        ports = resolve_list(spec);
    }

    LOG_TARGET_DEBUG("Port spec '{}' resolved to {} ports", spec, ports.size());
    return ports;
}

} // namespace netrecon
