#include "netrecon/common/io_thread_pool.h"
#include "netrecon/common/logger.h"

namespace netrecon {

IoThreadPool::IoThreadPool(std::size_t io_count) {
    if (io_count == 0) io_count = 1;
    contexts_.reserve(io_count);
    guards_.reserve(io_count);
    threads_.reserve(io_count);

    for (std::size_t i = 0; i < io_count; ++i) {
        contexts_.emplace_back(std::make_unique<asio::io_context>(1));
        guards_.emplace_back(std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            contexts_.back()->get_executor()));
    }
    for (std::size_t i = 0; i < io_count; ++i) {
        threads_.emplace_back([ctx = contexts_[i].get()]() {
            // handler 抛出的异常会从 run() 传出；记录后继续运行该 context
            while (true) {
                try {
                    ctx->run();
                    return;
                } catch (const std::exception& e) {
                    LOG_CORE_ERROR("Unhandled exception in I/O thread: {}", e.what());
                }
            }
        });
    }
}

IoThreadPool::~IoThreadPool() {
    shutdown();
}

std::size_t IoThreadPool::next_index() {
    return rr_.fetch_add(1, std::memory_order_relaxed) % contexts_.size();
}

asio::io_context& IoThreadPool::get_context() {
    return *contexts_[next_index()];
}

asio::any_io_executor IoThreadPool::get_executor() {
    return contexts_[next_index()]->get_executor();
}

void IoThreadPool::shutdown() {
    // 先释放 work guard，让 run() 在队列排空后自然返回
    for (auto& g : guards_) {
        if (g) g->reset();
    }
    for (auto& c : contexts_) {
        if (c) c->stop();
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    guards_.clear();
    threads_.clear();
    contexts_.clear();
}

} // namespace netrecon
