#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>

namespace netrecon {

// =====================
// 在途连接数上限
// =====================
// 计数信号量：每个 socket 发起连接前 acquire，完成后 release
// acquire 可被 stop_token 打断

class ConnectionLimiter {
public:
    explicit ConnectionLimiter(std::size_t capacity);

    ConnectionLimiter(const ConnectionLimiter&) = delete;
    ConnectionLimiter& operator=(const ConnectionLimiter&) = delete;

    // 阻塞直到获得一个槽位；stop 被请求时返回 false
    bool acquire(std::stop_token stop);

    // 非阻塞尝试
    bool try_acquire();

    void release();

    std::size_t capacity() const { return capacity_; }
    std::size_t in_flight() const;
    // 运行期间观测到的最大在途数
    std::size_t peak() const;

private:
    const std::size_t capacity_;
    std::size_t in_flight_ = 0;
    std::size_t peak_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

} // namespace netrecon
