#pragma once

#include "netrecon/core/types.h"
#include <istream>
#include <optional>
#include <string>

namespace netrecon {

// 从 /proc/net/arp 格式的文本中查找 address 的 MAC
// 未完成（flags 0x0）或全零的表项视为不存在；返回小写 MAC
std::optional<std::string> parse_arp_table(std::istream& in, const Address& address);

// =====================
// 内核邻居表
// =====================
// 每次查询重新读取文件，端口扫描期间产生的新表项也能查到

class NeighborTable {
public:
    explicit NeighborTable(std::string path = "/proc/net/arp");

    std::optional<std::string> lookup(const Address& address) const;


private:
    std::string path_;
};

} // namespace netrecon
