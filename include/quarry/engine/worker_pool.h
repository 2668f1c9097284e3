#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace quarry::engine {

// Fixed-size pool of threads running one io_context
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() const { return io_.get_executor(); }

    template <typename F> void post(F&& task) { boost::asio::post(io_, std::forward<F>(task)); }

    // Finishes queued work, then joins; idempotent
    void stop();

    std::size_t threads() const noexcept { return active_.load(std::memory_order_relaxed); }

private:
    void runThread();

    mutable boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> guard_;
    std::vector<std::jthread> threads_;
    std::atomic<std::size_t> active_{0};
};

} // namespace quarry::engine
