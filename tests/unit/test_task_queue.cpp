#include "core/task_queue.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace voiceguard::core;

class TaskQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<TaskQueue>();
    }

    void TearDown() override {
        task_queue->shutdown();
    }

    std::shared_ptr<TaskQueue> task_queue;
};

// Test basic task enqueueing and dequeueing
TEST_F(TaskQueueTest, BasicEnqueueDequeue) {
    std::atomic<int> counter{0};

    EXPECT_TRUE(task_queue->enqueue([&counter]() {
        counter++;
    }));

    EXPECT_EQ(task_queue->size(), 1u);
    EXPECT_FALSE(task_queue->empty());

    auto task = task_queue->tryDequeue();
    ASSERT_TRUE(static_cast<bool>(task));
    task();

    EXPECT_EQ(counter.load(), 1);
    EXPECT_TRUE(task_queue->empty());
}

// Tasks come out in submission order
TEST_F(TaskQueueTest, FifoOrdering) {
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        task_queue->enqueue([&order, i]() { order.push_back(i); });
    }

    while (auto task = task_queue->tryDequeue()) {
        task();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(TaskQueueTest, RejectsEmptyAndLateTasks) {
    EXPECT_FALSE(task_queue->enqueue(TaskQueue::Task()));

    task_queue->shutdown();
    EXPECT_TRUE(task_queue->isShuttingDown());
    EXPECT_FALSE(task_queue->enqueue([]() {}));
}

// dequeue() wakes up with an empty task once shut down and drained
TEST_F(TaskQueueTest, ShutdownWakesBlockedConsumer) {
    std::atomic<bool> woke{false};
    std::thread consumer([this, &woke]() {
        auto task = task_queue->dequeue();
        woke = !task;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    task_queue->shutdown();
    consumer.join();

    EXPECT_TRUE(woke.load());
}

TEST_F(TaskQueueTest, ClearDropsPendingTasks) {
    task_queue->enqueue([]() {});
    task_queue->enqueue([]() {});
    task_queue->clear();
    EXPECT_EQ(task_queue->size(), 0u);
}

TEST(BackgroundWorkerTest, SubmitReturnsResult) {
    BackgroundWorker worker;
    auto future = worker.submit([]() { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);
    EXPECT_TRUE(worker.isRunning());
}

TEST(BackgroundWorkerTest, ExceptionsSurfaceThroughFuture) {
    BackgroundWorker worker;
    auto future = worker.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // Worker keeps running after a failed task
    EXPECT_EQ(worker.submit([]() { return 1; }).get(), 1);
}

TEST(BackgroundWorkerTest, RunsTasksSequentiallyInOrder) {
    BackgroundWorker worker;
    std::vector<int> order;
    std::mutex order_mutex;
    std::atomic<int> concurrent{0};
    std::atomic<int> maxConcurrent{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(worker.submit([&, i]() {
            int now = ++concurrent;
            if (now > maxConcurrent) {
                maxConcurrent = now;
            }
            {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            }
            --concurrent;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(maxConcurrent.load(), 1);
    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(BackgroundWorkerTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> completed{0};
    {
        BackgroundWorker worker;
        for (int i = 0; i < 5; ++i) {
            worker.submit([&completed]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                ++completed;
            });
        }
        worker.shutdown();
        EXPECT_FALSE(worker.isRunning());
        EXPECT_THROW(worker.submit([]() {}), std::runtime_error);
    }
    EXPECT_EQ(completed.load(), 5);
}
