#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include <glog/logging.h>
#include "async_value.h"

namespace Rendezvous {

/**
 * Fixed-size worker pool. Tasks run in submission order on whichever
 * worker is free; there is no cancellation once a task is queued.
 */
class TaskExecutor {
public:
    explicit TaskExecutor(size_t num_threads = 2);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /**
     * Queue a task. Throws std::runtime_error once the executor is stopped.
     */
    void Submit(std::function<void()> task);

    /**
     * Run `callback(args...)` on a worker and expose its result as an AsyncValue.
     * A thrown exception becomes the failure of the value; a void callback yields Unit.
     */
    template<typename Callback, typename... Args>
    auto ExecuteAsync(Callback&& callback, Args&&... args) {
        using ReturnType = std::invoke_result_t<Callback&, Args&...>;
        using ValueType = std::conditional_t<std::is_void_v<ReturnType>, Unit, ReturnType>;

        // std::function needs a copyable target
        auto promise = std::make_shared<Promise<ValueType>>();
        AsyncValue<ValueType> result = promise->GetAsyncValue();

        Submit([promise,
                callback = std::forward<Callback>(callback),
                ... args = std::forward<Args>(args)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    callback(args...);
                    promise->SetValue(Unit{});
                } else {
                    promise->SetValue(callback(args...));
                }
            } catch (...) {
                if (!promise->SetException(std::current_exception())) {
                    LOG(ERROR) << "TaskExecutor: task failed after its value was set: "
                               << DescribeError(std::current_exception());
                }
            }
        });
        return result;
    }

    /**
     * Finish queued tasks and join the workers. Idempotent.
     */
    void Stop();

    size_t num_threads() const { return workers_.size(); }

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

} // namespace Rendezvous
