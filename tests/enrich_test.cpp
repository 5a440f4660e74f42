// 补充信息：邻居表、nmap 子进程与输出解析、数据源选择
#include "netrecon/enrich/enricher.h"
#include "netrecon/enrich/fingerprinter.h"
#include "netrecon/enrich/neighbor_table.h"
#include "netrecon/enrich/reverse_resolver.h"
#include "test_support.h"
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace netrecon;

namespace {

Address ip(const char* s) {
    return boost::asio::ip::make_address_v4(s);
}

const char* kArpSample =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.1.1      0x1         0x2         A4:91:B1:0c:22:7e     *        wlan0\n"
    "192.168.1.23     0x1         0x0         00:00:00:00:00:00     *        wlan0\n"
    "192.168.1.40     0x1         0x2         00:00:00:00:00:00     *        wlan0\n"
    "garbage line\n"
    "192.168.1.77     0x1         0x2         3c:22:fb:91:0a:11     *        eth0\n";

const char* kGrepableSample =
    "# Nmap 7.80 scan initiated Sat Oct 17 10:02:11 2026 as: nmap -Pn -sV -O -p 22,80,8443 -oG - 192.168.1.77\n"
    "Host: 192.168.1.77 (nas.lan)\tStatus: Up\n"
    "Host: 192.168.1.77 (nas.lan)\tPorts: 22/open/tcp//ssh//OpenSSH 8.2p1 Ubuntu 4ubuntu0.5 (Ubuntu Linux; protocol 2.0)/, "
    "80/open/tcp//http//nginx 1.18.0 (Ubuntu)/, 8443/open/tcp//https-alt?///, 9000/closed/tcp//cslistener///\t"
    "Ignored State: closed (997)\tOS: Linux 4.15 - 5.6\tSeq Index: 257\tIP ID Seq: All zeros\n"
    "# Nmap done at Sat Oct 17 10:02:31 2026 -- 1 IP address (1 host up) scanned in 20.11 seconds\n";

long long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

// 临时目录中的假 nmap 脚本
struct FakeNmapDir {
    FakeNmapDir() {
        char tmpl[] = "/tmp/netrecon_nmap_XXXXXX";
        if (::mkdtemp(tmpl)) dir = tmpl;
    }
    ~FakeNmapDir() {
        for (const auto& f : files) std::remove(f.c_str());
        if (!dir.empty()) ::rmdir(dir.c_str());
    }

    std::string write(const std::string& name, const std::string& content, bool executable) {
        std::string path = dir + "/" + name;
        {
            std::ofstream out(path);
            out << content;
        }
        if (executable) ::chmod(path.c_str(), 0755);
        files.push_back(path);
        return path;
    }

    std::string dir;
    std::vector<std::string> files;
};

// 忽略常见信号并长时间不退出
const char* kHangingScript =
    "#!/bin/sh\n"
    "trap '' INT TERM HUP\n"
    "sleep 20\n";

} // namespace

int main() {
    std::cout << "netrecon - Enrichment Test" << std::endl;
    std::cout << "==========================" << std::endl;

    netrecon_test::section("neighbor table parser");
    {
        std::istringstream in1(kArpSample);
        auto mac = parse_arp_table(in1, ip("192.168.1.1"));
        CHECK(mac.has_value());
        CHECK(mac.value_or("") == "a4:91:b1:0c:22:7e");

        std::istringstream in2(kArpSample);
        CHECK(!parse_arp_table(in2, ip("192.168.1.23")).has_value());   // 未完成

        std::istringstream in3(kArpSample);
        CHECK(!parse_arp_table(in3, ip("192.168.1.40")).has_value());   // 全零

        std::istringstream in4(kArpSample);
        CHECK(parse_arp_table(in4, ip("192.168.1.77")).value_or("") == "3c:22:fb:91:0a:11");

        std::istringstream in5(kArpSample);
        CHECK(!parse_arp_table(in5, ip("10.9.9.9")).has_value());

        // 同一地址在一个接口上未完成，在另一个接口上完整
        std::istringstream in6(
            "IP address       HW type     Flags       HW address            Mask     Device\n"
            "192.168.1.23     0x1         0x0         00:00:00:00:00:00     *        wlan0\n"
            "192.168.1.23     0x1         0x2         02:42:ac:11:00:17     *        docker0\n");
        CHECK(parse_arp_table(in6, ip("192.168.1.23")).value_or("") == "02:42:ac:11:00:17");

        std::istringstream empty("");
        CHECK(!parse_arp_table(empty, ip("192.168.1.1")).has_value());
    }

    netrecon_test::section("neighbor table file");
    {
        std::string path = "netrecon_arp_test.txt";
        {
            std::ofstream out(path);
            out << kArpSample;
        }
        NeighborTable table(path);
        CHECK(table.lookup(ip("192.168.1.77")).value_or("") == "3c:22:fb:91:0a:11");
        std::remove(path.c_str());

        NeighborTable missing("/nonexistent/netrecon/arp");
        CHECK(!missing.lookup(ip("192.168.1.77")).has_value());
    }

    netrecon_test::section("nmap grepable parser");
    {
        auto r = parse_grepable(kGrepableSample);
        CHECK(r.os_guess.value_or("") == "Linux 4.15 - 5.6");
        CHECK(r.services.size() == 3);
        CHECK(r.services[22] == "ssh");
        CHECK(r.services[80] == "http");
        CHECK(r.services[8443] == "https-alt");
        CHECK(r.services.count(9000) == 0);

        auto no_os = parse_grepable("Host: 10.0.0.2 ()\tPorts: 53/open/tcp//domain//dnsmasq 2.80/\n");
        CHECK(!no_os.os_guess.has_value());
        CHECK(no_os.services.size() == 1);
        CHECK(no_os.services[53] == "domain");

        auto garbage = parse_grepable("this is not nmap output\nHost: \tPorts: x/y/z\n\n");
        CHECK(!garbage.os_guess.has_value());
        CHECK(garbage.services.empty());

        CHECK(parse_grepable("").services.empty());
    }

    netrecon_test::section("nmap command line");
    {
        NmapFingerprinter service_only("/usr/bin/nmap", Timeout(30000), false);
        auto args = service_only.build_arguments(ip("10.0.0.2"), {22, 80});
        std::vector<std::string> expected = {
            "/usr/bin/nmap", "-Pn", "-sV", "-p", "22,80", "--host-timeout", "30000ms", "-oG", "-", "10.0.0.2"
        };
        CHECK(args == expected);

        NmapFingerprinter with_os("/usr/bin/nmap", Timeout(30000), true);
        auto os_args = with_os.build_arguments(ip("10.0.0.2"), {22});
        CHECK(std::find(os_args.begin(), os_args.end(), "-O") != os_args.end());
        CHECK(std::find(os_args.begin(), os_args.end(), "--osscan-guess") != os_args.end());
    }

    netrecon_test::section("nmap child process");
    {
        FakeNmapDir fake;
        CHECK(!fake.dir.empty());

        std::string sample = fake.write("grepable.txt", kGrepableSample, false);
        std::string good = fake.write("nmap-good", "#!/bin/sh\ncat '" + sample + "'\n", true);
        std::string failing = fake.write("nmap-fail", "#!/bin/sh\necho 'Host: 10.0.0.2 ()'\nexit 3\n", true);
        std::string hanging = fake.write("nmap-hang", kHangingScript, true);

        // 只保留请求的端口
        NmapFingerprinter ok(good, Timeout(5000), false);
        auto r = ok.run(ip("192.168.1.77"), {22, 80}, {});
        CHECK(r.os_guess.value_or("") == "Linux 4.15 - 5.6");
        CHECK(r.services.size() == 2);
        CHECK(r.services[22] == "ssh");
        CHECK(r.services.count(8443) == 0);

        NmapFingerprinter bad_exit(failing, Timeout(5000), false);
        auto f = bad_exit.run(ip("10.0.0.2"), {22}, {});
        CHECK(!f.os_guess.has_value());
        CHECK(f.services.empty());

        // 没有开放端口且不做系统识别时不启动 nmap
        CHECK(ok.run(ip("192.168.1.77"), {}, {}).services.empty());

        // 取消时杀死仍在运行的 nmap
        NmapFingerprinter stuck(hanging, Timeout(60000), false);
        std::stop_source ss;
        std::jthread canceller([&ss]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            ss.request_stop();
        });
        auto start = std::chrono::steady_clock::now();
        auto cancelled = stuck.run(ip("10.0.0.2"), {22}, ss.get_token());
        auto ms = elapsed_ms(start);
        std::cout << "  (cancelled nmap returned after " << ms << " ms)" << std::endl;
        CHECK(cancelled.services.empty());
        CHECK(!cancelled.os_guess.has_value());
        CHECK(ms >= 250);
        CHECK(ms < 3000);

        // 未取消时 host-timeout 加余量后强制结束
        NmapFingerprinter slow(hanging, Timeout(300), false);
        start = std::chrono::steady_clock::now();
        auto timed_out = slow.run(ip("10.0.0.2"), {22}, {});
        ms = elapsed_ms(start);
        std::cout << "  (overdue nmap killed after " << ms << " ms)" << std::endl;
        CHECK(timed_out.services.empty());
        CHECK(ms >= 300);
        CHECK(ms < 8000);
    }

    netrecon_test::section("enricher stops a hanging nmap found on PATH");
    {
        FakeNmapDir fake;
        fake.write("nmap", kHangingScript, true);

        const char* old_path = std::getenv("PATH");
        std::string saved = old_path ? old_path : "";
        ::setenv("PATH", (fake.dir + ":" + saved).c_str(), 1);

        ScanConfig config;
        config.resolve_hostnames = false;
        config.lookup_mac = false;
        config.nmap_path = "nmap";
        config.fingerprint_timeout = Timeout(60000);
        auto enricher = EnricherFactory::create(config);
        ::setenv("PATH", saved.c_str(), 1);

        auto* se = dynamic_cast<SystemEnricher*>(enricher.get());
        CHECK(se != nullptr && se->has_fingerprinter());

        std::stop_source ss;
        std::jthread canceller([&ss]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            ss.request_stop();
        });
        auto start = std::chrono::steady_clock::now();
        auto fp = enricher->detect_service_and_os(ip("10.0.0.2"), {22, 80}, ss.get_token());
        auto ms = elapsed_ms(start);
        CHECK(fp.services.empty());
        CHECK(!fp.os_guess.has_value());
        CHECK(ms < 3000);
    }

    netrecon_test::section("executable lookup");
    {
        CHECK(NmapFingerprinter::find_executable("sh").has_value());
        CHECK(!NmapFingerprinter::find_executable("netrecon-no-such-tool").has_value());
        CHECK(!NmapFingerprinter::find_executable("/nonexistent/nmap").has_value());
        CHECK(!NmapFingerprinter::find_executable("").has_value());
    }

    netrecon_test::section("enricher selection");
    {
        ScanConfig off;
        off.resolve_hostnames = false;
        off.lookup_mac = false;
        off.fingerprint = false;
        auto null_enricher = EnricherFactory::create(off);
        CHECK(dynamic_cast<NullEnricher*>(null_enricher.get()) != nullptr);
        CHECK(!null_enricher->resolve_hostname(ip("10.0.0.1")).has_value());
        CHECK(null_enricher->detect_service_and_os(ip("10.0.0.1"), {22}, {}).services.empty());

        ScanConfig no_nmap;
        no_nmap.resolve_hostnames = false;
        no_nmap.nmap_path = "netrecon-no-such-tool";
        no_nmap.neighbor_table_path = "/nonexistent/netrecon/arp";
        auto system = EnricherFactory::create(no_nmap);
        auto* se = dynamic_cast<SystemEnricher*>(system.get());
        CHECK(se != nullptr);
        CHECK(se != nullptr && !se->has_fingerprinter());
        auto fp = system->detect_service_and_os(ip("10.0.0.1"), {22, 80}, {});
        CHECK(!fp.os_guess.has_value());
        CHECK(fp.services.empty());
        CHECK(!system->lookup_link_layer_address(ip("10.0.0.1")).has_value());
        CHECK(!system->resolve_hostname(ip("10.0.0.1")).has_value());
    }

    netrecon_test::section("reverse dns stays within timeout");
    {
        CAresReverseResolver resolver(Timeout(300));
        auto start = std::chrono::steady_clock::now();
        auto name = resolver.lookup(ip("192.0.2.1"));
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::cout << "  (PTR 192.0.2.1 -> " << name.value_or("-") << " in " << ms << " ms)" << std::endl;
        CHECK(ms < 1500);
    }

    return netrecon_test::finish("enrich_test");
}
