#include "tts_queue/utils/async.hpp"

#include <utility>

#include "tts_queue/logging.hpp"

namespace tts_queue::utils {

TaskQueue::TaskQueue(std::string name)
    : name_(std::move(name)),
      thread_([this]() { run(); }) {}

TaskQueue::~TaskQueue() {
    stop();
}

bool TaskQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    task_available_.notify_one();
    return true;
}

void TaskQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return tasks_.empty() && !running_task_; });
}

void TaskQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    task_available_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

std::size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + (running_task_ ? 1 : 0);
}

void TaskQueue::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_available_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                // Only reached when stopping; pending tasks are drained first.
                idle_.notify_all();
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            running_task_ = true;
        }

        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Background task failed",
                {kv("queue", name_),
                 kv("error", ex.what())});
        } catch (...) {
            logging::error(
                "Background task failed",
                {kv("queue", name_),
                 kv("error", "non-standard exception")});
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_task_ = false;
            if (tasks_.empty()) {
                idle_.notify_all();
            }
        }
    }
}

}
