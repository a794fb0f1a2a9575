#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace ocr_layout {

// Fixed-size worker pool used to lay out independent documents in parallel
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto submit(F&& task) -> std::future<typename std::invoke_result<F>::type>;

    void wait_idle();
    size_t pending() const;
    size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;

    mutable std::mutex mutex_;
    std::condition_variable task_ready_;
    std::condition_variable idle_;
    bool stopping_ = false;
    std::atomic<size_t> in_flight_{0};
};

template<typename F>
auto ThreadPool::submit(F&& task) -> std::future<typename std::invoke_result<F>::type> {
    using result_type = typename std::invoke_result<F>::type;

    auto packaged = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(task));
    std::future<result_type> result = packaged->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        in_flight_++;
        queue_.emplace([packaged]() { (*packaged)(); });
    }
    task_ready_.notify_one();
    return result;
}

} // namespace ocr_layout
