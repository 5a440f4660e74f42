#include "netrecon/enrich/neighbor_table.h"
#include "netrecon/common/logger.h"
#include <boost/system/error_code.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace netrecon {

namespace {

bool is_mac(const std::string& s) {
    if (s.size() != 17) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i % 3 == 2) {
            if (s[i] != ':') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<std::string> parse_arp_table(std::istream& in, const Address& address) {
    // IP address  HW type  Flags  HW address  Mask  Device
    std::string line;
    std::getline(in, line);  // 表头

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string ip, hw_type, flags, mac;
        if (!(fields >> ip >> hw_type >> flags >> mac)) {
            continue;
        }

        boost::system::error_code ec;
        auto entry = boost::asio::ip::make_address_v4(ip, ec);
        if (ec || entry != address) {
            continue;
        }

        // 未完成的表项跳过，同一地址在其他接口上可能有完整表项
        if (flags == "0x0" || !is_mac(mac) || mac == "00:00:00:00:00:00") {
            continue;
        }
        std::transform(mac.begin(), mac.end(), mac.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return mac;
    }
    return std::nullopt;
}

NeighborTable::NeighborTable(std::string path)
    : path_(std::move(path)) {}

std::optional<std::string> NeighborTable::lookup(const Address& address) const {
    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        LOG_ENRICH_DEBUG("Neighbor table {} not readable", path_);
        return std::nullopt;
    }
    return parse_arp_table(ifs, address);
}

} // namespace netrecon
