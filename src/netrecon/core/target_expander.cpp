#include "netrecon/core/target_expander.h"
#include "netrecon/core/errors.h"
#include "netrecon/common/logger.h"
#include "netrecon/common/string_utils.h"
#include <fstream>
#include <unordered_set>

namespace netrecon {

namespace {

std::optional<Address> parse_address(const std::string& s) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(trim(s), ec);
    if (ec) {
        return std::nullopt;
    }
    return addr;
}

} // namespace

std::vector<Address> expand_host(const std::string& spec) {
    auto addr = parse_address(spec);
    if (!addr) {
        throw InvalidAddress(spec);
    }
    return {*addr};
}

std::vector<Address> expand_range(const std::string& spec) {
    auto parts = split(trim(spec), '-');
    if (parts.size() != 2) {
        throw InvalidRange(spec, "expected <start>-<end>");
    }

    auto start = parse_address(parts[0]);
    if (!start) {
        throw InvalidRange(spec, "bad start address");
    }

    uint32_t start_uint = start->to_uint();
    uint32_t prefix = start_uint & 0xFFFFFF00u;
    uint32_t last_octet = 0;

    std::string end_part = trim(parts[1]);
    if (end_part.find('.') != std::string::npos) {
        auto end = parse_address(end_part);
        if (!end) {
            throw InvalidRange(spec, "bad end address");
        }
        if ((end->to_uint() & 0xFFFFFF00u) != prefix) {
            throw InvalidRange(spec, "endpoints differ outside the last octet");
        }
        last_octet = end->to_uint() & 0xFFu;
    } else {
        auto value = parse_decimal(end_part, 255);
        if (!value) {
            throw InvalidRange(spec, "bad end octet");
        }
        last_octet = *value;
    }

    uint32_t end_uint = prefix | last_octet;
    if (end_uint < start_uint) {
        throw InvalidRange(spec, "end is lower than start");
    }

    std::vector<Address> ips;
    ips.reserve(end_uint - start_uint + 1);
    for (uint64_t i = start_uint; i <= end_uint; ++i) {
        ips.emplace_back(static_cast<uint32_t>(i));
    }
    LOG_TARGET_DEBUG("Range {} expanded to {} addresses", spec, ips.size());
    return ips;
}

std::vector<Address> expand_cidr(const std::string& spec) {
    auto parts = split(trim(spec), '/');
    if (parts.size() != 2) {
        throw InvalidCIDR(spec, "expected <address>/<prefix>");
    }

    auto base_addr = parse_address(parts[0]);
    if (!base_addr) {
        throw InvalidCIDR(spec, "bad address");
    }
    auto prefix = parse_decimal(trim(parts[1]), 32);
    if (!prefix) {
        throw InvalidCIDR(spec, "prefix length must be 0-32");
    }

    // 计算网络地址的主机位数
    uint32_t host_bits = 32 - *prefix;
    uint64_t block_size = uint64_t(1) << host_bits;
    if (block_size > kMaxBlockSize) {
        throw InvalidCIDR(spec, "block larger than /8 is not supported");
    }

    uint32_t host_mask = static_cast<uint32_t>(block_size - 1);
    uint32_t network_addr = base_addr->to_uint() & ~host_mask;
    uint32_t broadcast_addr = network_addr | host_mask;

    uint32_t first = network_addr;
    uint32_t last = broadcast_addr;
    if (*prefix < 31) {
        ++first;
        --last;
    }

    std::vector<Address> ips;
    ips.reserve(static_cast<std::size_t>(last - first) + 1);
    for (uint64_t i = first; i <= last; ++i) {
        ips.emplace_back(static_cast<uint32_t>(i));
    }
    LOG_TARGET_DEBUG("CIDR {} expanded to {} addresses", spec, ips.size());
    return ips;
}

std::vector<Address> expand(const std::string& spec) {
    if (spec.find('/') != std::string::npos) {
        return expand_cidr(spec);
    }
    if (spec.find('-') != std::string::npos) {
        return expand_range(spec);
    }
    return expand_host(spec);
}

std::vector<Address> expand_all(const std::vector<std::string>& specs) {
    std::vector<Address> all;
    std::unordered_set<uint32_t> seen;
    std::size_t duplicates = 0;

    for (const auto& spec : specs) {
        for (const auto& addr : expand(spec)) {
            if (seen.insert(addr.to_uint()).second) {
                all.push_back(addr);
            } else {
                ++duplicates;
            }
        }
    }

    if (duplicates > 0) {
        LOG_TARGET_INFO("Dropped {} duplicate addresses", duplicates);
    }
    return all;
}

std::vector<std::string> load_target_specs(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open target file '" + path + "'", path);
    }

    std::vector<std::string> specs;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        specs.push_back(line);
    }

    LOG_TARGET_INFO("Loaded {} target specs from {}", specs.size(), path);
    return specs;
}

} // namespace netrecon
