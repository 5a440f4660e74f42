#include "netrecon/core/errors.h"
#include "netrecon/core/orchestrator.h"
#include "netrecon/core/port_resolver.h"
#include "netrecon/core/scan_config.h"
#include "netrecon/core/target_expander.h"
#include "netrecon/common/connection_limiter.h"
#include "netrecon/common/io_thread_pool.h"
#include "netrecon/common/logger.h"
#include "netrecon/common/system_limits.h"
#include "netrecon/enrich/enricher.h"
#include "netrecon/network/liveness_prober.h"
#include "netrecon/network/port_scanner.h"
#include "netrecon/network/tcp_connector.h"
#include "netrecon/output/result_handler.h"
#include <utility>
#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <functional>
#include <stop_token>
#include <thread>

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace netrecon {

using namespace std;

constexpr const char* kVersion = "1.0.0";

// =====================
// 打印使用说明
// =====================

void print_usage(const char* program_name, const po::options_description& options) {
    cout << "netrecon v" << kVersion << endl;
    cout << "Concurrent TCP network reconnaissance" << endl;
    cout << endl;
    cout << "Usage:" << endl;
    cout << "  " << program_name << " (--host IP | --range A-B | --subnet CIDR | --input FILE) [OPTIONS]" << endl;
    cout << endl;
    cout << options << endl;
    cout << "Examples:" << endl;
    cout << "  # Scan the first 1024 ports of one host" << endl;
    cout << "  " << program_name << " --host 192.168.0.10" << endl;
    cout << "  # Sweep a subnet for a few ports, JSON output" << endl;
    cout << "  " << program_name << " --subnet 192.168.0.0/24 --ports 22,80,443 --format json" << endl;
    cout << "  # Range with a faster timeout and no nmap" << endl;
    cout << "  " << program_name << " --range 10.0.0.1-50 --timeout 0.3 --no-fingerprint" << endl;
    cout << endl;
}

// =====================
// 目标展开
// =====================

vector<Address> collect_targets(const po::variables_map& vm) {
    if (vm.count("host")) return expand_host(vm["host"].as<string>());
    if (vm.count("range")) return expand_range(vm["range"].as<string>());
    if (vm.count("subnet")) return expand_cidr(vm["subnet"].as<string>());

    const auto& path = vm["input"].as<string>();
    auto specs = load_target_specs(path);
    if (specs.empty()) {
        throw ConfigurationError("target file '" + path + "' contains no targets", path);
    }
    return expand_all(specs);
}

// =====================
// 命令行覆盖配置
// =====================

void apply_overrides(const po::variables_map& vm, ScanConfig& config) {
    if (vm.count("ports")) {
        config.ports = resolve_ports(vm["ports"].as<string>());
    }
    if (vm.count("timeout")) {
        double seconds = vm["timeout"].as<double>();
        if (!std::isfinite(seconds) || seconds <= 0) {
            throw ConfigurationError("timeout must be greater than zero", std::to_string(seconds));
        }
        config.timeout = Timeout(std::llround(seconds * 1000.0));
    }
    if (vm.count("workers")) config.workers = vm["workers"].as<std::size_t>();
    if (vm.count("port-concurrency")) config.port_concurrency = vm["port-concurrency"].as<std::size_t>();
    if (vm.count("max-in-flight")) config.max_in_flight = vm["max-in-flight"].as<std::size_t>();
    if (vm.count("max-runtime")) {
        double seconds = vm["max-runtime"].as<double>();
        if (!std::isfinite(seconds) || seconds < 0) {
            throw ConfigurationError("max runtime must not be negative", std::to_string(seconds));
        }
        config.max_runtime = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    }
    if (vm.count("no-ping")) config.liveness_enabled = false;
    if (vm.count("no-dns")) config.resolve_hostnames = false;
    if (vm.count("no-mac")) config.lookup_mac = false;
    if (vm.count("no-fingerprint")) config.fingerprint = false;
    if (vm.count("format")) config.output_format = vm["format"].as<string>();
    if (vm.count("log-file")) config.logging_file_path = vm["log-file"].as<string>();
}

int main(int argc, char* argv[]) {
    try {
        // 命令行参数
        po::options_description targets("Targets (exactly one)");
        targets.add_options()
            ("host", po::value<string>(), "Single IPv4 address")
            ("range", po::value<string>(), "Address range, e.g. 192.168.0.1-192.168.0.49 or 192.168.0.1-49")
            ("subnet", po::value<string>(), "CIDR block, e.g. 192.168.0.0/24")
            ("input,i", po::value<string>(), "File with one host/range/subnet per line");

        po::options_description scan("Scan");
        scan.add_options()
            ("ports,p", po::value<string>(), "Ports: 1-1024, 22,80,443 or 8080 (default: 1-1024)")
            ("timeout,t", po::value<double>(), "Connect timeout in seconds (default: 0.5)")
            ("workers,w", po::value<std::size_t>(), "Hosts scanned concurrently (default: 16)")
            ("port-concurrency", po::value<std::size_t>(), "Connects in flight per host (default: 128)")
            ("max-in-flight", po::value<std::size_t>(), "Global cap on open sockets (default: derived from FD limit)")
            ("max-runtime", po::value<double>(), "Stop the run after this many seconds (default: none)")
            ("no-ping", "Skip liveness probing, treat every target as up")
            ("no-dns", "Skip reverse DNS lookups")
            ("no-mac", "Skip neighbor table lookups")
            ("no-fingerprint", "Skip nmap service/OS detection");

        po::options_description general("General");
        general.add_options()
            ("help,h", "Show help message")
            ("version,v", "Show version information")
            ("format,f", po::value<string>(), "Output format (text,json)")
            ("config,c", po::value<string>(), "Configuration file")
            ("log-file", po::value<string>(), "Also write logs to this file")
            ("verbose", "Enable verbose output")
            ("quiet,q", "Suppress non-error output");

        po::options_description options("Options");
        options.add(targets).add(scan).add(general);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);

        // 显示帮助
        if (vm.count("help")) {
            print_usage(argv[0], options);
            return 0;
        }

        // 显示版本
        if (vm.count("version")) {
            cout << "netrecon v" << kVersion << endl;
            cout << "Built with: C++20, Boost.Asio, c-ares" << endl;
            return 0;
        }

        // 检查必需参数
        int target_options = static_cast<int>(vm.count("host") + vm.count("range") +
                                              vm.count("subnet") + vm.count("input"));
        if (target_options != 1) {
            cerr << "Error: exactly one of --host, --range, --subnet or --input is required" << endl;
            cerr << "Use --help for usage information" << endl;
            return 1;
        }

        // 配置加载期间的日志先写 stderr，stdout 只留给报告
        spdlog::set_default_logger(spdlog::stderr_color_mt("bootstrap"));

        ScanConfig config;
        config.ports = resolve_ports("1-1024");
        if (vm.count("config")) {
            config = load_config(vm["config"].as<string>(), config);
        }

        // 覆盖配置（命令行参数优先）
        apply_overrides(vm, config);
        validate_config(config);

        // 设置日志级别
        auto level = spdlog::level::from_str(config.logging_level);
        if (level == spdlog::level::off && config.logging_level != "off") {
            throw ConfigurationError("unknown log level '" + config.logging_level + "'", config.logging_level);
        }
        if (vm.count("verbose")) {
            level = spdlog::level::debug;
        } else if (vm.count("quiet")) {
            level = spdlog::level::err;
        }
        Logger::get_instance().init(config.logging_file_path, 1024 * 1024 * 5, 3, level);

        auto addresses = collect_targets(vm);
        LOG_CORE_INFO("{} target(s), ports {}", addresses.size(), config.ports.size());

        ResultHandler rh(parse_output_format(config.output_format));

        // 检查系统限制，推导全局在途连接上限
        std::size_t fd_limit = raise_descriptor_limit();
        std::size_t per_host = config.port_concurrency +
                               (config.liveness_enabled ? config.liveness_ports.size() : 0);
        std::size_t in_flight = derive_in_flight_ceiling(fd_limit, config.workers, per_host, config.max_in_flight);
        LOG_CORE_INFO("FD limit {}, max in-flight connections {}", fd_limit, in_flight);

        IoThreadPool io(std::max(1u, std::thread::hardware_concurrency()));
        ConnectionLimiter limiter(in_flight);
        TcpConnector connector(io, limiter);

        std::shared_ptr<ILivenessProber> prober;
        if (config.liveness_enabled) {
            prober = std::make_shared<TcpLivenessProber>(connector, config.liveness_ports);
        } else {
            prober = std::make_shared<AssumeUpProber>();
        }
        auto scanner = std::make_shared<TcpPortScanner>(connector);
        std::shared_ptr<IEnricher> enricher = EnricherFactory::create(config);

        // 取消：SIGINT / SIGTERM 与运行期限
        std::stop_source stop_source;

        asio::signal_set signals(io.get_context(), SIGINT, SIGTERM);
        std::function<void(const boost::system::error_code&, int)> on_signal;
        on_signal = [&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            if (stop_source.stop_requested()) {
                // 第二次信号直接退出
                std::_Exit(130);
            }
            LOG_CORE_WARN("Received signal {}, stopping (signal again to force exit)", signo);
            stop_source.request_stop();
            signals.async_wait(on_signal);
        };
        signals.async_wait(on_signal);

        asio::steady_timer deadline(io.get_context());
        if (config.max_runtime.count() > 0) {
            deadline.expires_after(config.max_runtime);
            deadline.async_wait([&](const boost::system::error_code& ec) {
                if (ec) return;
                LOG_CORE_WARN("Max runtime of {} ms reached, stopping", config.max_runtime.count());
                stop_source.request_stop();
            });
        }

        ScanOrchestrator orchestrator(prober, scanner, enricher);
        auto reports = orchestrator.run(addresses, config, stop_source.get_token());

        boost::system::error_code ignored;
        signals.cancel(ignored);
        deadline.cancel();

        rh.print_reports(reports, cout);

        auto stats = orchestrator.statistics();
        LOG_CORE_INFO("{} of {} host(s) up ({} reported), {} open port(s), peak {} connection(s) in flight, {:.2f}s",
                      stats.hosts_alive, stats.targets, stats.hosts_up, stats.open_ports, limiter.peak(),
                      stats.elapsed.count() / 1000.0);

        io.shutdown();
        Logger::get_instance().flush();
        return 0;

    } catch (const ConfigurationError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    } catch (const po::error& e) {
        cerr << "Error: " << e.what() << endl;
        cerr << "Use --help for usage information" << endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_CORE_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}

} // namespace netrecon

int main(int argc, char* argv[]) {
    return netrecon::main(argc, argv);
}
