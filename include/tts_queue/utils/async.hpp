#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tts_queue {
namespace utils {

// Single background thread running fire-and-forget tasks in post order.
// Tasks are best effort: an exception thrown by one is logged and the queue
// keeps going.
class TaskQueue {
public:
    explicit TaskQueue(std::string name);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Returns false once the queue has been stopped.
    bool post(std::function<void()> task);
    void wait_idle();
    void stop();
    std::size_t pending() const;

private:
    void run();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable task_available_;
    std::condition_variable idle_;
    std::deque<std::function<void()>> tasks_;
    bool running_task_ = false;
    bool stopping_ = false;
    std::thread thread_;
};

}
}
