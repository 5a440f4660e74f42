#ifndef NETRECON_LOGGER_H
#define NETRECON_LOGGER_H

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>
#include <iostream>
#include <array>
#include <filesystem>

namespace netrecon {

// 日志模块定义
enum class LogModule {
    CORE,          // 编排器与主机会话
    TARGET,        // 目标与端口展开
    LIVENESS,      // 存活探测
    PORT_SCAN,     // 端口扫描
    ENRICH,        // 主机名 / MAC / 指纹补充信息
    DNS,           // 反向 DNS
    OUTPUT,        // 结果输出
    CONFIG,        // 配置加载
};

constexpr std::size_t kLogModuleCount = 8;

// 日志系统管理类
// 所有 sink 写 stderr（及可选文件），stdout 只留给扫描报告
class Logger {
public:
    static Logger& get_instance() {
        static Logger instance;
        return instance;
    }

    // 初始化日志系统；log_file 为空时不写文件
    void init(const std::string& log_file = "",
              size_t max_file_size = 1024 * 1024 * 5,  // 5MB
              size_t max_files = 3,
              spdlog::level::level_enum level = spdlog::level::info) {
        if (m_initialized) {
            return;
        }

        try {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(level);
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%n] %v");

            std::vector<spdlog::sink_ptr> sinks {console_sink};

            if (!log_file.empty()) {
                std::filesystem::path log_path(log_file);
                if (log_path.has_parent_path() && !std::filesystem::exists(log_path.parent_path())) {
                    std::filesystem::create_directories(log_path.parent_path());
                }
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, max_file_size, max_files);
                file_sink->set_level(level);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%n] %v");
                sinks.push_back(file_sink);
            }

            static const std::array<const char*, kLogModuleCount> names = {
                "CORE", "TARGET", "LIVENESS", "PORT_SCAN", "ENRICH", "DNS", "OUTPUT", "CONFIG"
            };
            for (std::size_t i = 0; i < kLogModuleCount; ++i) {
                m_loggers[i] = std::make_shared<spdlog::logger>(names[i], sinks.begin(), sinks.end());
                m_loggers[i]->set_level(level);
            }

            // 设置默认 logger
            spdlog::set_default_logger(m_loggers[static_cast<size_t>(LogModule::CORE)]);
            spdlog::set_level(level);

            m_initialized = true;
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log init failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Log init failed: " << ex.what() << std::endl;
        }
    }

    // 获取指定模块的 logger；未初始化时退回默认 logger
    std::shared_ptr<spdlog::logger> get_logger(LogModule module) {
        size_t index = static_cast<size_t>(module);
        if (index < m_loggers.size() && m_loggers[index]) {
            return m_loggers[index];
        }
        return spdlog::default_logger();
    }

    void flush() {
        for (auto& logger : m_loggers) {
            if (logger) {
                logger->flush();
            }
        }
        spdlog::default_logger()->flush();
    }

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool m_initialized = false;
    std::array<std::shared_ptr<spdlog::logger>, kLogModuleCount> m_loggers;
};

// 便捷函数：获取 logger
inline std::shared_ptr<spdlog::logger> log(LogModule module) {
    return Logger::get_instance().get_logger(module);
}

} // namespace netrecon

// ==================== 模块化日志宏控制 ====================

// 各模块是否编译 trace/debug 日志
// CORE 与 ENRICH 默认开启：补充信息失败按 debug 级别记录
#define ENABLE_CORE_DEBUG_LOG 1
#define ENABLE_TARGET_DEBUG_LOG 0
#define ENABLE_LIVENESS_DEBUG_LOG 0
#define ENABLE_PORT_SCAN_DEBUG_LOG 0
#define ENABLE_ENRICH_DEBUG_LOG 1
#define ENABLE_DNS_DEBUG_LOG 0
#define ENABLE_OUTPUT_DEBUG_LOG 0
#define ENABLE_CONFIG_DEBUG_LOG 0

#define NETRECON_LOG_DEBUG_IMPL(ENABLED, MODULE, LEVEL, ...) \
    if constexpr (ENABLED) { \
        netrecon::log(netrecon::LogModule::MODULE)->LEVEL(__VA_ARGS__); \
    }

// ==================== 模块化日志宏定义 ====================

// CORE 模块日志
#define LOG_CORE_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_CORE_DEBUG_LOG, CORE, trace, __VA_ARGS__)
#define LOG_CORE_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_CORE_DEBUG_LOG, CORE, debug, __VA_ARGS__)
#define LOG_CORE_INFO(...) netrecon::log(netrecon::LogModule::CORE)->info(__VA_ARGS__)
#define LOG_CORE_WARN(...) netrecon::log(netrecon::LogModule::CORE)->warn(__VA_ARGS__)
#define LOG_CORE_ERROR(...) netrecon::log(netrecon::LogModule::CORE)->error(__VA_ARGS__)
#define LOG_CORE_CRITICAL(...) netrecon::log(netrecon::LogModule::CORE)->critical(__VA_ARGS__)

// TARGET 模块日志
#define LOG_TARGET_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_TARGET_DEBUG_LOG, TARGET, trace, __VA_ARGS__)
#define LOG_TARGET_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_TARGET_DEBUG_LOG, TARGET, debug, __VA_ARGS__)
#define LOG_TARGET_INFO(...) netrecon::log(netrecon::LogModule::TARGET)->info(__VA_ARGS__)
#define LOG_TARGET_WARN(...) netrecon::log(netrecon::LogModule::TARGET)->warn(__VA_ARGS__)
#define LOG_TARGET_ERROR(...) netrecon::log(netrecon::LogModule::TARGET)->error(__VA_ARGS__)

// LIVENESS 模块日志
#define LOG_LIVENESS_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_LIVENESS_DEBUG_LOG, LIVENESS, trace, __VA_ARGS__)
#define LOG_LIVENESS_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_LIVENESS_DEBUG_LOG, LIVENESS, debug, __VA_ARGS__)
#define LOG_LIVENESS_INFO(...) netrecon::log(netrecon::LogModule::LIVENESS)->info(__VA_ARGS__)
#define LOG_LIVENESS_WARN(...) netrecon::log(netrecon::LogModule::LIVENESS)->warn(__VA_ARGS__)
#define LOG_LIVENESS_ERROR(...) netrecon::log(netrecon::LogModule::LIVENESS)->error(__VA_ARGS__)

// PORT_SCAN 模块日志
#define LOG_PORT_SCAN_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_PORT_SCAN_DEBUG_LOG, PORT_SCAN, trace, __VA_ARGS__)
#define LOG_PORT_SCAN_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_PORT_SCAN_DEBUG_LOG, PORT_SCAN, debug, __VA_ARGS__)
#define LOG_PORT_SCAN_INFO(...) netrecon::log(netrecon::LogModule::PORT_SCAN)->info(__VA_ARGS__)
#define LOG_PORT_SCAN_WARN(...) netrecon::log(netrecon::LogModule::PORT_SCAN)->warn(__VA_ARGS__)
#define LOG_PORT_SCAN_ERROR(...) netrecon::log(netrecon::LogModule::PORT_SCAN)->error(__VA_ARGS__)

// ENRICH 模块日志
#define LOG_ENRICH_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_ENRICH_DEBUG_LOG, ENRICH, trace, __VA_ARGS__)
#define LOG_ENRICH_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_ENRICH_DEBUG_LOG, ENRICH, debug, __VA_ARGS__)
#define LOG_ENRICH_INFO(...) netrecon::log(netrecon::LogModule::ENRICH)->info(__VA_ARGS__)
#define LOG_ENRICH_WARN(...) netrecon::log(netrecon::LogModule::ENRICH)->warn(__VA_ARGS__)
#define LOG_ENRICH_ERROR(...) netrecon::log(netrecon::LogModule::ENRICH)->error(__VA_ARGS__)

// DNS 模块日志
#define LOG_DNS_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_DNS_DEBUG_LOG, DNS, trace, __VA_ARGS__)
#define LOG_DNS_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_DNS_DEBUG_LOG, DNS, debug, __VA_ARGS__)
#define LOG_DNS_INFO(...) netrecon::log(netrecon::LogModule::DNS)->info(__VA_ARGS__)
#define LOG_DNS_WARN(...) netrecon::log(netrecon::LogModule::DNS)->warn(__VA_ARGS__)
#define LOG_DNS_ERROR(...) netrecon::log(netrecon::LogModule::DNS)->error(__VA_ARGS__)

// OUTPUT 模块日志
#define LOG_OUTPUT_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_OUTPUT_DEBUG_LOG, OUTPUT, trace, __VA_ARGS__)
#define LOG_OUTPUT_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_OUTPUT_DEBUG_LOG, OUTPUT, debug, __VA_ARGS__)
#define LOG_OUTPUT_INFO(...) netrecon::log(netrecon::LogModule::OUTPUT)->info(__VA_ARGS__)
#define LOG_OUTPUT_WARN(...) netrecon::log(netrecon::LogModule::OUTPUT)->warn(__VA_ARGS__)
#define LOG_OUTPUT_ERROR(...) netrecon::log(netrecon::LogModule::OUTPUT)->error(__VA_ARGS__)

// CONFIG 模块日志
#define LOG_CONFIG_TRACE(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_CONFIG_DEBUG_LOG, CONFIG, trace, __VA_ARGS__)
#define LOG_CONFIG_DEBUG(...) NETRECON_LOG_DEBUG_IMPL(ENABLE_CONFIG_DEBUG_LOG, CONFIG, debug, __VA_ARGS__)
#define LOG_CONFIG_INFO(...) netrecon::log(netrecon::LogModule::CONFIG)->info(__VA_ARGS__)
#define LOG_CONFIG_WARN(...) netrecon::log(netrecon::LogModule::CONFIG)->warn(__VA_ARGS__)
#define LOG_CONFIG_ERROR(...) netrecon::log(netrecon::LogModule::CONFIG)->error(__VA_ARGS__)

#endif // NETRECON_LOGGER_H
