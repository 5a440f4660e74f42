#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netrecon {

inline std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// 按分隔符切分，保留空段
inline std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type begin = 0;
    while (true) {
        auto pos = s.find(sep, begin);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return parts;
}

// 纯十进制数字且不超过 max，否则 nullopt（不接受符号、空格、前缀）
inline std::optional<uint32_t> parse_decimal(const std::string& s, uint32_t max) {
    if (s.empty() || s.size() > 10) return std::nullopt;
    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > max) return std::nullopt;
    return static_cast<uint32_t>(value);
}

} // namespace netrecon
