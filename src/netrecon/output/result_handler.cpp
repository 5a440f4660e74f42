#include "netrecon/output/result_handler.h"
#include "netrecon/core/errors.h"
#include "netrecon/common/logger.h"
#include <nlohmann/json.hpp>
#include <sstream>

namespace netrecon {

// -------------- 内部辅助 --------------

namespace {

const std::string kRule(60, '=');

const std::string& or_dash(const std::optional<std::string>& v) {
    static const std::string dash = "-";
    return (v && !v->empty()) ? *v : dash;
}

nlohmann::json optional_json(const std::optional<std::string>& v) {
    if (v && !v->empty()) return *v;
    return nullptr;
}

nlohmann::json report_json(const HostReport& report) {
    nlohmann::json j;
    j["ip"] = report.address.to_string();
    j["mac"] = optional_json(report.mac);
    j["hostname"] = optional_json(report.hostname);
    j["os"] = optional_json(report.os_guess);
    j["open_ports"] = nlohmann::json::array();
    for (const auto& op : report.open_ports) {
        nlohmann::json jp;
        jp["port"] = op.port;
        jp["protocol"] = "tcp";
        jp["service"] = op.service.empty() ? nlohmann::json(nullptr) : nlohmann::json(op.service);
        j["open_ports"].push_back(jp);
    }
    j["complete"] = report.complete;
    return j;
}

} // namespace

OutputFormat parse_output_format(const std::string& name) {
    if (name == "text") return OutputFormat::TEXT;
    if (name == "json") return OutputFormat::JSON;
    throw ConfigurationError("unknown output format '" + name + "'", name);
}

// -------------- 文本格式 --------------

std::string ResultHandler::to_text(const HostReport& report) const {
    std::ostringstream oss;
    oss << kRule << "\n";
    oss << "IP: " << report.address.to_string();
    if (!report.complete) oss << " (incomplete)";
    oss << "\n";
    oss << "MAC: " << or_dash(report.mac) << "\n";
    oss << "Hostname: " << or_dash(report.hostname) << "\n";
    oss << "OS: " << or_dash(report.os_guess) << "\n";
    if (report.open_ports.empty()) {
        oss << "Open ports: -\n";
    } else {
        oss << "Open ports:\n";
        for (const auto& op : report.open_ports) {
            oss << "  - tcp/" << op.port << "  " << (op.service.empty() ? "-" : op.service) << "\n";
        }
    }
    return oss.str();
}

std::string ResultHandler::to_text(const std::vector<HostReport>& reports) const {
    std::ostringstream oss;
    for (const auto& r : reports) {
        oss << to_text(r);
    }
    oss << kRule << "\n";
    return oss.str();
}

// -------------- JSON 格式 --------------

std::string ResultHandler::to_json(const HostReport& report) const {
    return report_json(report).dump(2);
}

std::string ResultHandler::to_json(const std::vector<HostReport>& reports) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& r : reports) {
        j.push_back(report_json(r));
    }
    return j.dump(2) + "\n";
}

// -------------- 分发 --------------

std::string ResultHandler::report_to_string(const HostReport& report) const {
    switch (format_) {
        case OutputFormat::JSON: return to_json(report);
        case OutputFormat::TEXT: return to_text(report);
    }
    return to_text(report);
}

std::string ResultHandler::reports_to_string(const std::vector<HostReport>& reports) const {
    switch (format_) {
        case OutputFormat::JSON: return to_json(reports);
        case OutputFormat::TEXT: return to_text(reports);
    }
    return to_text(reports);
}

void ResultHandler::print_reports(const std::vector<HostReport>& reports, std::ostream& os) const {
    os << reports_to_string(reports);
    os.flush();
    LOG_OUTPUT_DEBUG("Printed {} report(s)", reports.size());
}

} // namespace netrecon
