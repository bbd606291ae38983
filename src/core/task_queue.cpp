#include "core/task_queue.hpp"
#include "utils/logging.hpp"
#include <stdexcept>

namespace voiceguard {
namespace core {

TaskQueue::TaskQueue() : shutdown_(false) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(Task task) {
    if (!task) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false; // Don't accept new tasks when shutting down
        }
        queue_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

TaskQueue::Task TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);

    condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

    if (queue_.empty()) {
        return Task();
    }

    Task task = std::move(queue_.front());
    queue_.pop_front();
    return task;
}

TaskQueue::Task TaskQueue::tryDequeue() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        return Task();
    }

    Task task = std::move(queue_.front());
    queue_.pop_front();
    return task;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

void TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condition_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    return shutdown_;
}

// BackgroundWorker implementation

BackgroundWorker::BackgroundWorker() : running_(true) {
    thread_ = std::thread(&BackgroundWorker::workerLoop, this);
}

BackgroundWorker::~BackgroundWorker() {
    shutdown();
}

void BackgroundWorker::shutdown() {
    running_ = false;
    queue_.shutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void BackgroundWorker::post(TaskQueue::Task task) {
    if (!queue_.enqueue(std::move(task))) {
        throw std::runtime_error("Background worker is shut down");
    }
}

void BackgroundWorker::workerLoop() {
    while (true) {
        TaskQueue::Task task = queue_.dequeue();
        if (!task) {
            // Queue shut down and drained
            break;
        }

        try {
            task();
        } catch (const std::exception& e) {
            // submit() wraps tasks in packaged_task, so this only sees faults
            // in the wrapper itself
            utils::Logger::error("Background task failed: " + std::string(e.what()));
        }
    }
}

} // namespace core
} // namespace voiceguard
