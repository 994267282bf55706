#include "task_executor.h"

#include <stdexcept>
#include <glog/logging.h>

namespace Rendezvous {

TaskExecutor::TaskExecutor(size_t num_threads) {
    if (num_threads == 0) {
        LOG(FATAL) << "TaskExecutor: needs at least one worker thread";
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&TaskExecutor::WorkerThread, this);
    }
    VLOG(1) << "TaskExecutor started with " << num_threads << " workers";
}

TaskExecutor::~TaskExecutor() {
    Stop();
}

void TaskExecutor::Submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("TaskExecutor: submit after stop");
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

void TaskExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void TaskExecutor::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace Rendezvous
