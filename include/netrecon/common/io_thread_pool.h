#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <vector>
#include <memory>
#include <thread>
#include <atomic>

namespace netrecon {

namespace asio = boost::asio;

// 每个线程独占一个 io_context，同一 socket 的所有 handler 天然串行
class IoThreadPool {
public:
    explicit IoThreadPool(std::size_t io_count = std::thread::hardware_concurrency());
    ~IoThreadPool();

    IoThreadPool(const IoThreadPool&) = delete;
    IoThreadPool& operator=(const IoThreadPool&) = delete;


    // 轮询选择一个 io_context
    asio::io_context& get_context();

    // 轮询选择一个执行器，用于新建 socket / timer
    asio::any_io_executor get_executor();

    // 停止并等待线程退出
    void shutdown();

private:
    std::size_t next_index();

    std::vector<std::unique_ptr<asio::io_context>> contexts_;
    std::vector<std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>>> guards_;
    std::vector<std::thread> threads_;

    std::atomic<std::size_t> rr_{0};
};

} // namespace netrecon
