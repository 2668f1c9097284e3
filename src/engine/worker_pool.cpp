#include <quarry/engine/worker_pool.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace quarry::engine {

WorkerPool::WorkerPool(std::size_t threads) : io_(static_cast<int>(threads == 0 ? 1 : threads)) {
    if (threads == 0)
        threads = 1;
    guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { runThread(); });
        active_.fetch_add(1, std::memory_order_relaxed);
    }
    spdlog::debug("WorkerPool started with {} threads", threads_.size());
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    // Releasing the guard lets run() return once the queue drains
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    for (std::size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error& e) {
                spdlog::warn("WorkerPool::stop() thread {} join failed: {}", i, e.what());
            }
        }
    }
    threads_.clear();
    active_.store(0, std::memory_order_relaxed);
}

void WorkerPool::runThread() {
    try {
        io_.run();
    } catch (const std::exception& e) {
        spdlog::error("WorkerPool thread exited: {}", e.what());
    }
    active_.fetch_sub(1, std::memory_order_relaxed);
}

} // namespace quarry::engine
