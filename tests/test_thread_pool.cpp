#include <gtest/gtest.h>
#include <ocr_layout/thread_pool.h>
#include <chrono>
#include <atomic>
#include <string>

TEST(ThreadPoolTest, BasicConstruction) {
    EXPECT_NO_THROW(ocr_layout::ThreadPool pool(4));
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
    ocr_layout::ThreadPool pool(0);
    EXPECT_EQ(pool.worker_count(), 1u);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ResultsInSubmissionSlots) {
    ocr_layout::ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, WaitIdle) {
    ocr_layout::ThreadPool pool(2);
    std::atomic<int> completed{0};

    for (int i = 0; i < 5; ++i) {
        pool.submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            completed++;
        });
    }

    pool.wait_idle();
    EXPECT_EQ(completed, 5);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, PendingWhileBlocked) {
    ocr_layout::ThreadPool pool(1);
    std::atomic<bool> release{false};

    pool.submit([&release]() {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    for (int i = 0; i < 5; ++i) {
        pool.submit([]() {});
    }

    EXPECT_GT(pool.pending(), 0u);
    release = true;
    pool.wait_idle();
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ocr_layout::ThreadPool pool(2);

    auto future = pool.submit([]() -> int {
        throw std::runtime_error("Test exception");
    });

    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DifferentReturnTypes) {
    ocr_layout::ThreadPool pool(2);

    auto int_future = pool.submit([]() { return 42; });
    auto string_future = pool.submit([]() { return std::string("hello"); });
    auto void_future = pool.submit([]() {});

    EXPECT_EQ(int_future.get(), 42);
    EXPECT_EQ(string_future.get(), "hello");
    EXPECT_NO_THROW(void_future.get());
}
