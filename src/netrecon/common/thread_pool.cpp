#include "netrecon/common/thread_pool.h"

namespace netrecon {

// 编排器按 min(workers, 目标数) 建池，每个工作线程同一时刻只运行一个 HostSession，
// 因此线程数即同时处于探测 / 扫描 / 补充信息阶段的主机数上限
ThreadPool::ThreadPool(std::size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

// 取消不经过线程池：已排队的主机任务仍会被取出，
// 在 HostSession::run 入口看到 stop_token 后立即以 CANCELLED 结束
void ThreadPool::shutdown() {
    bool expected = false;
    if (!stop_.compare_exchange_strong(expected, true)) {
        return; // already stopped
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        // packaged_task 把会话异常存入 future，由编排器按目标计入 hosts_failed
        task();
    }
}

} // namespace netrecon
