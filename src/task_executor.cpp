#include "voxkey/task_executor.hpp"
#include <iostream>

namespace voxkey {

TaskExecutor::TaskExecutor()
    : tasks_(std::make_shared<TaskChannel>()) {
    // The worker holds the queue, never the executor
    std::shared_ptr<TaskChannel> tasks = tasks_;
    worker_ = std::thread([tasks]() {
        run_loop(tasks);
    });
    worker_id_.store(worker_.get_id());
}

TaskExecutor::~TaskExecutor() {
    shutdown();
    if (worker_.joinable()) {
        std::cerr << "Executor destroyed from its own task, detaching worker" << std::endl;
        worker_.detach();
    }
}

bool TaskExecutor::post(Task task) {
    return tasks_->push(std::move(task));
}

void TaskExecutor::shutdown() {
    tasks_->close();
    if (!worker_.joinable() || on_worker_thread()) return;
    worker_.join();
}

void TaskExecutor::run_loop(const std::shared_ptr<TaskChannel>& tasks) {
    while (auto task = tasks->pop()) {
        try {
            (*task)();
        } catch (const std::exception& e) {
            std::cerr << "Executor task failed: " << e.what() << std::endl;
        }
    }
}

} // namespace voxkey
