#include "netrecon/enrich/reverse_resolver.h"
#include "netrecon/common/logger.h"
#include <ares.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/time.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <vector>

namespace netrecon {

namespace {

// ares_library_init 非线程安全，进程内只调用一次
bool ensure_library() {
    static std::once_flag once;
    static int status = ARES_SUCCESS;
    std::call_once(once, []() {
        status = ares_library_init(ARES_LIB_INIT_ALL);
        if (status != ARES_SUCCESS) {
            LOG_DNS_ERROR("c-ares library init failed: {}", ares_strerror(status));
        }
    });
    return status == ARES_SUCCESS;
}

// 查询回调写入的结果
struct PtrQuery {
    bool done = false;
    int status = ARES_EDESTRUCTION;
    std::string name;
};

void on_host(void* arg, int status, int /*timeouts*/, struct hostent* host) {
    auto* query = static_cast<PtrQuery*>(arg);
    query->done = true;
    query->status = status;
    if (status == ARES_SUCCESS && host && host->h_name) {
        query->name = host->h_name;
    }
}

// channel 的 RAII 包装；析构时未完成的查询以 ARES_EDESTRUCTION 回调
class Channel {
public:
    Channel() {
        ares_options opts{};
        int optmask = 0;
        status_ = ares_init_options(&channel_, &opts, optmask);
        if (status_ != ARES_SUCCESS) {
            channel_ = nullptr;
        }
    }
    ~Channel() {
        if (channel_) ares_destroy(channel_);
    }
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    ares_channel get() const { return channel_; }
    int status() const { return status_; }

private:
    ares_channel channel_ = nullptr;
    int status_ = ARES_SUCCESS;
};

// 事件循环直到查询完成或超时；超时返回 false
// 用 poll 而不是 select：提升后的 FD 上限可能超过 FD_SETSIZE
bool run_event_loop(ares_channel channel, Timeout timeout, const PtrQuery& query) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!query.done) {
        ares_socket_t socks[ARES_GETSOCK_MAXNUM];
        int bitmask = ares_getsock(channel, socks, ARES_GETSOCK_MAXNUM);
        if (bitmask == 0) {
            break;
        }

        std::vector<pollfd> fds;
        for (int i = 0; i < ARES_GETSOCK_MAXNUM; ++i) {
            short events = 0;
            if (ARES_GETSOCK_READABLE(bitmask, i)) events |= POLLIN;
            if (ARES_GETSOCK_WRITABLE(bitmask, i)) events |= POLLOUT;
            if (events != 0) {
                fds.push_back(pollfd{socks[i], events, 0});
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        // 取 c-ares 建议的重传间隔与剩余时间中的较小者
        timeval max_tv{};
        max_tv.tv_sec = static_cast<long>(remaining.count() / 1000);
        max_tv.tv_usec = static_cast<long>((remaining.count() % 1000) * 1000);
        timeval tv{};
        timeval* tvp = ares_timeout(channel, &max_tv, &tv);
        int wait_ms = static_cast<int>(tvp->tv_sec * 1000 + tvp->tv_usec / 1000);

        int ready = poll(fds.data(), fds.size(), std::max(wait_ms, 1));
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_DNS_ERROR("poll failed: {}", std::strerror(errno));
            return false;
        }

        if (ready == 0) {
            // 处理超时重传
            ares_process_fd(channel, ARES_SOCKET_BAD, ARES_SOCKET_BAD);
            continue;
        }

        for (const auto& p : fds) {
            ares_socket_t rfd = (p.revents & (POLLIN | POLLERR | POLLHUP)) ? p.fd : ARES_SOCKET_BAD;
            ares_socket_t wfd = (p.revents & POLLOUT) ? p.fd : ARES_SOCKET_BAD;
            if (rfd != ARES_SOCKET_BAD || wfd != ARES_SOCKET_BAD) {
                ares_process_fd(channel, rfd, wfd);
            }
        }
    }
    return true;
}

} // namespace

CAresReverseResolver::CAresReverseResolver(Timeout timeout)
    : timeout_(timeout) {}

std::optional<std::string> CAresReverseResolver::lookup(const Address& address) const {
    if (!ensure_library()) {
        return std::nullopt;
    }

    // query 须在 channel 之后析构：channel 析构时仍可能回调
    PtrQuery query;
    Channel channel;
    if (!channel.get()) {
        LOG_DNS_ERROR("c-ares init failed: {}", ares_strerror(channel.status()));
        return std::nullopt;
    }

    in_addr addr{};
    addr.s_addr = htonl(address.to_uint());

    ares_gethostbyaddr(channel.get(), &addr, sizeof(addr), AF_INET, on_host, &query);

    if (!run_event_loop(channel.get(), timeout_, query)) {
        LOG_DNS_DEBUG("PTR lookup for {} timed out", address.to_string());
        return std::nullopt;
    }
    if (!query.done || query.status != ARES_SUCCESS || query.name.empty()) {
        LOG_DNS_DEBUG("PTR lookup for {} failed: {}", address.to_string(),
                      ares_strerror(query.status));
        return std::nullopt;
    }

    LOG_DNS_TRACE("{} -> {}", address.to_string(), query.name);
    return query.name;
}

} // namespace netrecon
