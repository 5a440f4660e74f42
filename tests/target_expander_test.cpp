// 目标展开与端口解析：纯计算，无网络
#include "netrecon/core/target_expander.h"
#include "netrecon/core/port_resolver.h"
#include "netrecon/core/errors.h"
#include "test_support.h"
#include <cstdio>
#include <fstream>
#include <set>

using namespace netrecon;

namespace {

Address ip(const char* s) {
    return boost::asio::ip::make_address_v4(s);
}

bool strictly_increasing(const std::vector<Address>& ips) {
    for (std::size_t i = 1; i < ips.size(); ++i) {
        if (!(ips[i - 1].to_uint() < ips[i].to_uint())) return false;
    }
    return true;
}

} // namespace

int main() {
    std::cout << "netrecon - Target Expander Test" << std::endl;
    std::cout << "===============================" << std::endl;

    netrecon_test::section("single host");
    {
        auto ips = expand_host("192.168.0.10");
        CHECK(ips.size() == 1);
        CHECK(ips[0] == ip("192.168.0.10"));
        CHECK_THROWS(expand_host("192.168.0.300"), InvalidAddress);
        CHECK_THROWS(expand_host("not-an-ip"), InvalidAddress);
        CHECK_THROWS(expand_host(""), InvalidAddress);
    }

    netrecon_test::section("range");
    {
        auto ips = expand_range("192.168.0.1-192.168.0.49");
        CHECK(ips.size() == 49);
        CHECK(ips.front() == ip("192.168.0.1"));
        CHECK(ips.back() == ip("192.168.0.49"));
        CHECK(strictly_increasing(ips));

        auto short_form = expand_range("192.168.0.1-49");
        CHECK(short_form == ips);

        auto one = expand_range("10.0.0.7-10.0.0.7");
        CHECK(one.size() == 1);

        auto full = expand_range("10.1.2.0-255");
        CHECK(full.size() == 256);

        CHECK_THROWS(expand_range("192.168.0.50-192.168.0.1"), InvalidRange);
        CHECK_THROWS(expand_range("192.168.0.1-192.168.1.5"), InvalidRange);
        CHECK_THROWS(expand_range("192.168.0.1-256"), InvalidRange);
        CHECK_THROWS(expand_range("192.168.0.1-"), InvalidRange);
        CHECK_THROWS(expand_range("192.168.0.1-2-3"), InvalidRange);
        CHECK_THROWS(expand_range("bogus-192.168.0.3"), InvalidRange);
    }

    netrecon_test::section("cidr");
    {
        auto ips = expand_cidr("192.168.0.0/24");
        CHECK(ips.size() == 254);
        CHECK(ips.front() == ip("192.168.0.1"));
        CHECK(ips.back() == ip("192.168.0.254"));
        CHECK(strictly_increasing(ips));

        // 主机位被屏蔽
        auto masked = expand_cidr("192.168.0.77/24");
        CHECK(masked == ips);

        auto s30 = expand_cidr("10.0.0.0/30");
        CHECK(s30.size() == 2);
        CHECK(s30[0] == ip("10.0.0.1"));
        CHECK(s30[1] == ip("10.0.0.2"));

        auto s31 = expand_cidr("10.0.0.0/31");
        CHECK(s31.size() == 2);
        CHECK(s31[0] == ip("10.0.0.0"));

        auto s32 = expand_cidr("10.0.0.9/32");
        CHECK(s32.size() == 1);
        CHECK(s32[0] == ip("10.0.0.9"));

        auto s20 = expand_cidr("172.16.0.0/20");
        CHECK(s20.size() == (1u << 12) - 2);

        CHECK_THROWS(expand_cidr("10.0.0.0/33"), InvalidCIDR);
        CHECK_THROWS(expand_cidr("10.0.0.0/"), InvalidCIDR);
        CHECK_THROWS(expand_cidr("10.0.0/24"), InvalidCIDR);
        CHECK_THROWS(expand_cidr("10.0.0.0/7"), InvalidCIDR);
    }

    netrecon_test::section("auto detect and dedup");
    {
        CHECK(expand("10.0.0.1").size() == 1);
        CHECK(expand("10.0.0.1-3").size() == 3);
        CHECK(expand("10.0.0.0/29").size() == 6);

        auto all = expand_all({"10.0.0.2", "10.0.0.1-3", "10.0.0.0/30"});
        CHECK(all.size() == 3);
        CHECK(all[0] == ip("10.0.0.2"));
        CHECK(all[1] == ip("10.0.0.1"));
        CHECK(all[2] == ip("10.0.0.3"));

        CHECK_THROWS(expand_all({"10.0.0.1", "10.0.0.x"}), InvalidAddress);
    }

    netrecon_test::section("target file");
    {
        std::string path = "netrecon_targets_test.txt";
        {
            std::ofstream out(path);
            out << "# lab hosts\n\n10.0.0.1\n  10.0.0.5-6  \n; old\n10.0.0.0/30\n";
        }
        auto specs = load_target_specs(path);
        CHECK(specs.size() == 3);
        CHECK(specs[1] == "10.0.0.5-6");
        auto all = expand_all(specs);
        CHECK(all.size() == 4);
        std::remove(path.c_str());

        CHECK_THROWS(load_target_specs("/nonexistent/netrecon/targets.txt"), ConfigurationError);
    }

    netrecon_test::section("port specs");
    {
        auto range = resolve_ports("1-1024");
        CHECK(range.size() == 1024);
        CHECK(range.front() == 1);
        CHECK(range.back() == 1024);

        auto list = resolve_ports("22,80,443");
        CHECK((list == std::vector<Port>{22, 80, 443}));

        auto dup = resolve_ports("80, 22,80 ,443,22");
        CHECK((dup == std::vector<Port>{80, 22, 443}));

        CHECK((resolve_ports("8080") == std::vector<Port>{8080}));
        CHECK((resolve_ports("65535") == std::vector<Port>{65535}));
        CHECK(resolve_ports("1-65535").size() == 65535);

        std::set<Port> unique(range.begin(), range.end());
        CHECK(unique.size() == range.size());

        CHECK_THROWS(resolve_ports("100-10"), InvalidPortRange);
        CHECK_THROWS(resolve_ports("0-10"), InvalidPortRange);
        CHECK_THROWS(resolve_ports("1-65536"), InvalidPortRange);
        CHECK_THROWS(resolve_ports("1-2-3"), InvalidPortRange);
        CHECK_THROWS(resolve_ports("22,abc,80"), InvalidPortList);
        CHECK_THROWS(resolve_ports("22,,80"), InvalidPortList);
        CHECK_THROWS(resolve_ports("22,70000"), InvalidPortList);
        CHECK_THROWS(resolve_ports("22,1-5"), InvalidPortList);
        CHECK_THROWS(resolve_ports("0"), InvalidPortList);
        CHECK_THROWS(resolve_ports("-5"), InvalidPortRange);
        CHECK_THROWS(resolve_ports(""), InvalidPortList);
    }

    return netrecon_test::finish("target_expander_test");
}
