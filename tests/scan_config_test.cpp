// 配置加载、校验与在途上限推导
#include "netrecon/core/scan_config.h"
#include "netrecon/core/errors.h"
#include "netrecon/core/port_resolver.h"
#include "netrecon/common/system_limits.h"
#include "netrecon/common/connection_limiter.h"
#include "test_support.h"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>
#include <thread>

using namespace netrecon;

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

ScanConfig valid_config() {
    ScanConfig c;
    c.ports = resolve_ports("1-1024");
    return c;
}

} // namespace

int main() {
    std::cout << "netrecon - Config Test" << std::endl;
    std::cout << "======================" << std::endl;

    netrecon_test::section("defaults");
    {
        ScanConfig c;
        CHECK(c.timeout == Timeout(500));
        CHECK(c.workers == 16);
        CHECK(c.port_concurrency == 128);
        CHECK(c.max_in_flight == 0);
        CHECK(c.liveness_enabled);
        CHECK((c.liveness_ports == std::vector<Port>{80, 443, 22, 445, 139}));
        CHECK(c.output_format == "text");
    }

    netrecon_test::section("json overlay");
    {
        std::string path = "netrecon_config_test.json";
        write_file(path, R"({
            "scan": {"timeout_ms": 250, "workers": 4, "port_concurrency": 32, "ports": "22,80"},
            "liveness": {"enabled": false, "ports": [22, 3389]},
            "enrichment": {"fingerprint": false, "nmap_path": "/opt/nmap/bin/nmap", "dns_timeout_ms": 300},
            "output": {"format": "json"},
            "logging": {"level": "debug", "file_path": "logs/netrecon.log"}
        })");

        auto c = load_config(path, valid_config());
        CHECK(c.timeout == Timeout(250));
        CHECK(c.workers == 4);
        CHECK(c.port_concurrency == 32);
        CHECK((c.ports == std::vector<Port>{22, 80}));
        CHECK(!c.liveness_enabled);
        CHECK((c.liveness_ports == std::vector<Port>{22, 3389}));
        CHECK(!c.fingerprint);
        CHECK(c.resolve_hostnames);
        CHECK(c.nmap_path == "/opt/nmap/bin/nmap");
        CHECK(c.dns_timeout == Timeout(300));
        CHECK(c.output_format == "json");
        CHECK(c.logging_level == "debug");
        CHECK(c.logging_file_path == "logs/netrecon.log");
        std::remove(path.c_str());
    }

    netrecon_test::section("bad json keeps defaults");
    {
        std::string path = "netrecon_config_bad.json";
        write_file(path, "{ \"scan\": { \"workers\": ");
        auto base = valid_config();
        base.workers = 9;
        auto c = load_config(path, base);
        CHECK(c.workers == 9);
        CHECK(c.ports.size() == 1024);
        std::remove(path.c_str());
    }

    netrecon_test::section("bad values in config");
    {
        std::string path = "netrecon_config_ports.json";
        write_file(path, R"({"scan": {"ports": "80-20"}})");
        CHECK_THROWS(load_config(path, valid_config()), InvalidPortRange);
        write_file(path, R"({"liveness": {"ports": [80, 70000]}})");
        CHECK_THROWS(load_config(path, valid_config()), ConfigurationError);
        // 负数不能回绕成巨大的计数
        write_file(path, R"({"scan": {"workers": -1}})");
        CHECK_THROWS(load_config(path, valid_config()), ConfigurationError);
        write_file(path, R"({"scan": {"port_concurrency": 0}})");
        CHECK_THROWS(load_config(path, valid_config()), ConfigurationError);
        write_file(path, R"({"scan": {"max_in_flight": -5}})");
        CHECK_THROWS(load_config(path, valid_config()), ConfigurationError);
        write_file(path, R"({"scan": {"max_in_flight": 0, "workers": 2}})");
        auto zero = load_config(path, valid_config());
        CHECK(zero.max_in_flight == 0);
        CHECK(zero.workers == 2);
        std::remove(path.c_str());

        CHECK_THROWS(load_config("/nonexistent/netrecon.json"), ConfigurationError);
    }

    netrecon_test::section("validation");
    {
        auto ok = valid_config();
        bool passed = true;
        try {
            validate_config(ok);
        } catch (const ConfigurationError&) {
            passed = false;
        }
        CHECK(passed);

        auto c = valid_config();
        c.timeout = Timeout(0);
        CHECK_THROWS(validate_config(c), ConfigurationError);

        c = valid_config();
        c.workers = 0;
        CHECK_THROWS(validate_config(c), ConfigurationError);

        c = valid_config();
        c.port_concurrency = 0;
        CHECK_THROWS(validate_config(c), ConfigurationError);

        // 命令行 "-1" 被转换成 size_t 后的值
        c = valid_config();
        c.workers = static_cast<std::size_t>(-1);
        CHECK_THROWS(validate_config(c), ConfigurationError);

        c = valid_config();
        c.port_concurrency = kMaxCount + 1;
        CHECK_THROWS(validate_config(c), ConfigurationError);

        c = valid_config();
        c.ports.clear();
        CHECK_THROWS(validate_config(c), ConfigurationError);

        c = valid_config();
        c.liveness_ports.clear();
        CHECK_THROWS(validate_config(c), ConfigurationError);
        c.liveness_enabled = false;
        validate_config(c);

        c = valid_config();
        c.output_format = "xml";
        CHECK_THROWS(validate_config(c), ConfigurationError);

        c = valid_config();
        c.max_runtime = std::chrono::milliseconds(-1);
        CHECK_THROWS(validate_config(c), ConfigurationError);
    }

    netrecon_test::section("in-flight ceiling");
    {
        // 需求小于 FD：取需求
        CHECK(derive_in_flight_ceiling(65535, 16, 133, 0) == 16 * 133);
        // FD 不足：取可用 FD
        CHECK(derive_in_flight_ceiling(1024, 16, 133, 0) == 1024 - kReservedDescriptors);
        // 显式请求受 FD 约束
        CHECK(derive_in_flight_ceiling(1024, 16, 133, 100) == 100);
        CHECK(derive_in_flight_ceiling(1024, 16, 133, 5000) == 1024 - kReservedDescriptors);
        // 极小 FD 上限仍然可用
        CHECK(derive_in_flight_ceiling(100, 1, 1, 0) == 1);
        CHECK(derive_in_flight_ceiling(100, 4, 8, 0) == 16);
        // 乘积溢出时饱和到可用 FD 数
        std::size_t huge = static_cast<std::size_t>(-1);
        CHECK(derive_in_flight_ceiling(65535, huge, huge, 0) == 65535 - kReservedDescriptors);
        CHECK(derive_in_flight_ceiling(65535, huge, 2, 0) == 65535 - kReservedDescriptors);
        CHECK(raise_descriptor_limit() > 0);
    }

    netrecon_test::section("connection limiter");
    {
        ConnectionLimiter limiter(2);
        std::stop_source ss;
        CHECK(limiter.acquire(ss.get_token()));
        CHECK(limiter.try_acquire());
        CHECK(!limiter.try_acquire());
        CHECK(limiter.in_flight() == 2);

        // 满时阻塞，release 后唤醒
        auto waiter = std::async(std::launch::async, [&]() { return limiter.acquire(ss.get_token()); });
        CHECK(waiter.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
        limiter.release();
        CHECK(waiter.get());
        CHECK(limiter.in_flight() == 2);
        CHECK(limiter.peak() == 2);

        // 满时 stop 打断等待
        auto cancelled = std::async(std::launch::async, [&]() { return limiter.acquire(ss.get_token()); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ss.request_stop();
        CHECK(!cancelled.get());

        limiter.release();
        limiter.release();
        CHECK(limiter.in_flight() == 0);

        ConnectionLimiter zero(0);
        CHECK(zero.capacity() == 1);
    }

    return netrecon_test::finish("scan_config_test");
}
