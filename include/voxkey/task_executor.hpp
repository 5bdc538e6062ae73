#pragma once

#include "voxkey/event_channel.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace voxkey {

// Single worker thread running posted tasks in FIFO order
class TaskExecutor {
public:
    using Task = std::function<void()>;

    TaskExecutor();

    // Joins the worker. When the last owner lets go from inside one of its
    // own tasks the worker is detached instead; it keeps only the queue alive,
    // so tasks still queued must not capture the destroyed owner.
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // Returns false after shutdown()
    bool post(Task task);

    // Runs the tasks already queued, then joins the worker. From a task it
    // only stops new posts; the owner's thread joins later.
    void shutdown();

    bool on_worker_thread() const { return std::this_thread::get_id() == worker_id_.load(); }

private:
    using TaskChannel = EventChannel<Task>;

    static void run_loop(const std::shared_ptr<TaskChannel>& tasks);

    std::shared_ptr<TaskChannel> tasks_;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_;
};

} // namespace voxkey
