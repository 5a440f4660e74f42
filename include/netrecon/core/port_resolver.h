#pragma once

#include "netrecon/core/types.h"
#include <string>
#include <vector>

namespace netrecon {

// 端口集合解析
//   "1-1024"     升序区间，非法时抛出 InvalidPortRange
//   "22,80,443"  逐项校验，任一项非法即整体失败（InvalidPortList），不返回部分结果
//   "8080"       单端口
// 结果去重，保持给定顺序
std::vector<Port> resolve_ports(const std::string& spec);

} // namespace netrecon
