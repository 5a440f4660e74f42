#pragma once

#include "netrecon/core/types.h"
#include <ostream>
#include <string>
#include <vector>

namespace netrecon {

// =====================
// 输出格式枚举
// =====================

enum class OutputFormat {
    TEXT,       // 人类可读文本
    JSON        // JSON 数组
};

// "text" / "json"；其他值抛出 ConfigurationError
OutputFormat parse_output_format(const std::string& name);

// =====================
// 结果处理器
// =====================

class ResultHandler {
public:
    ResultHandler() = default;
    explicit ResultHandler(OutputFormat format) : format_(format) {}

    OutputFormat format() const { return format_; }

    // 导出到字符串
    std::string report_to_string(const HostReport& report) const;
    std::string reports_to_string(const std::vector<HostReport>& reports) const;

    // 写到输出流（通常是 stdout）
    void print_reports(const std::vector<HostReport>& reports, std::ostream& os) const;

private:
    std::string to_text(const HostReport& report) const;
    std::string to_text(const std::vector<HostReport>& reports) const;

    std::string to_json(const HostReport& report) const;
    std::string to_json(const std::vector<HostReport>& reports) const;

    OutputFormat format_ = OutputFormat::TEXT;
};

} // namespace netrecon
