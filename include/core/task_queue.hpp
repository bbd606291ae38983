#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace voiceguard {
namespace core {

/**
 * Thread-safe FIFO of work items
 */
class TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue();
    ~TaskQueue();

    // Non-copyable, non-movable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * Add a task to the queue
     * @return false if the queue is shutting down and the task was dropped
     */
    bool enqueue(Task task);

    /**
     * Get the next task (blocks while empty).
     * Returns an empty function once the queue is shut down and drained.
     */
    Task dequeue();

    /**
     * Get the next task without blocking; empty function if none
     */
    Task tryDequeue();

    size_t size() const;
    bool empty() const;
    void clear();

    /**
     * Stop accepting tasks and wake up all waiting threads
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> queue_;
    std::atomic<bool> shutdown_;
};

/**
 * Single background thread draining a TaskQueue in submission order.
 *
 * Enrollment and verification run here so the interactive surface stays
 * responsive; with one thread, commits from consecutive workflows never
 * overlap.
 */
class BackgroundWorker {
public:
    BackgroundWorker();
    ~BackgroundWorker();

    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    /**
     * Run f on the worker. Exceptions thrown by f surface through the future.
     * @throws std::runtime_error if the worker has been shut down
     */
    template<typename F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type>;

    /**
     * Finish queued tasks, then join the thread. Safe to call twice.
     */
    void shutdown();

    bool isRunning() const { return running_; }
    size_t pendingTasks() const { return queue_.size(); }

private:
    void workerLoop();
    void post(TaskQueue::Task task);

    TaskQueue queue_;
    std::thread thread_;
    std::atomic<bool> running_;
};

template<typename F>
auto BackgroundWorker::submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
    using return_type = typename std::invoke_result<F>::type;

    auto task_ptr = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task_ptr->get_future();

    post([task_ptr]() { (*task_ptr)(); });

    return result;
}

} // namespace core
} // namespace voiceguard
