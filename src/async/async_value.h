#ifndef RENDEZVOUS_ASYNC_ASYNC_VALUE_H_
#define RENDEZVOUS_ASYNC_ASYNC_VALUE_H_

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "../common/errors.h"

namespace Rendezvous {

/**
 * Result type of asynchronous operations that produce nothing
 */
struct Unit {
    bool operator==(const Unit&) const { return true; }
};

/**
 * Final result of an asynchronous value: either a T or a captured failure
 */
template<typename T>
class Outcome {
public:
    static Outcome Success(T value) {
        Outcome outcome;
        outcome.value_.emplace(std::move(value));
        return outcome;
    }

    static Outcome Failure(std::exception_ptr error) {
        Outcome outcome;
        outcome.error_ = std::move(error);
        return outcome;
    }

    bool ok() const { return value_.has_value(); }

    // Rethrows the failure if there is no value
    const T& value() const {
        if (!value_.has_value()) {
            std::rethrow_exception(error_);
        }
        return *value_;
    }

    const std::exception_ptr& error() const { return error_; }

private:
    Outcome() = default;

    std::optional<T> value_;
    std::exception_ptr error_;
};

namespace internal {

/**
 * State shared between a Promise and its AsyncValue handles.
 * Pending until the first Complete(), fixed afterwards.
 */
template<typename T>
class SharedState {
public:
    using Callback = std::function<void(const Outcome<T>&)>;

    // Returns false if the state was already completed.
    bool Complete(Outcome<T> outcome) {
        std::shared_ptr<const Outcome<T>> result;
        std::vector<Callback> callbacks;
        {
            absl::MutexLock lock(&mu_);
            if (outcome_) {
                return false;
            }
            outcome_ = std::make_shared<const Outcome<T>>(std::move(outcome));
            result = outcome_;
            callbacks.swap(callbacks_);
        }
        // Callbacks run outside the lock so they may register further callbacks
        // One failing observer must not starve the ones registered after it
        for (auto& callback : callbacks) {
            try {
                callback(*result);
            } catch (...) {
                LOG(ERROR) << "AsyncValue: completion callback threw: " << DescribeError(std::current_exception());
            }
        }
        return true;
    }

    void OnComplete(Callback callback) {
        std::shared_ptr<const Outcome<T>> result;
        {
            absl::MutexLock lock(&mu_);
            if (!outcome_) {
                callbacks_.push_back(std::move(callback));
                return;
            }
            result = outcome_;
        }
        callback(*result);
    }

    bool IsCompleted() const {
        absl::MutexLock lock(&mu_);
        return outcome_ != nullptr;
    }

    std::shared_ptr<const Outcome<T>> Wait() const {
        mu_.LockWhen(absl::Condition(this, &SharedState::HasOutcome));
        std::shared_ptr<const Outcome<T>> result = outcome_;
        mu_.Unlock();
        return result;
    }

    // nullptr if the timeout expired first
    std::shared_ptr<const Outcome<T>> WaitFor(absl::Duration timeout) const {
        std::shared_ptr<const Outcome<T>> result;
        if (mu_.LockWhenWithTimeout(absl::Condition(this, &SharedState::HasOutcome), timeout)) {
            result = outcome_;
        }
        mu_.Unlock();
        return result;
    }

private:
    bool HasOutcome() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return outcome_ != nullptr; }

    mutable absl::Mutex mu_;
    std::shared_ptr<const Outcome<T>> outcome_ ABSL_GUARDED_BY(mu_);
    std::vector<Callback> callbacks_ ABSL_GUARDED_BY(mu_);
};

} // namespace internal

/**
 * Consumer handle of a single-assignment asynchronous value.
 * Copies share the same state. Consumers can only observe:
 * register callbacks, poll, or block until the value is there.
 */
template<typename T>
class AsyncValue {
public:
    using value_type = T;
    using Callback = typename internal::SharedState<T>::Callback;

    AsyncValue() = default;

    bool IsCompleted() const { return state_->IsCompleted(); }

    /**
     * Invokes the callback exactly once with the final outcome.
     * If the value is already complete the callback runs inline,
     * otherwise it runs on the thread that completes the value; an exception
     * thrown there is logged and the remaining callbacks still run.
     */
    void OnComplete(Callback callback) const { state_->OnComplete(std::move(callback)); }

    /**
     * Blocks until complete and returns the value or rethrows the failure
     */
    T Get() const { return state_->Wait()->value(); }

    /**
     * Blocks at most `timeout`; throws a kTimeout PipelineError on expiry.
     */
    T GetFor(std::chrono::milliseconds timeout) const {
        auto result = state_->WaitFor(absl::FromChrono(timeout));
        if (!result) {
            throw TimeoutError("value not available after " + std::to_string(timeout.count()) + " ms");
        }
        return result->value();
    }

    /**
     * Blocks until complete and returns the outcome without throwing
     */
    Outcome<T> Wait() const { return *state_->Wait(); }

    static AsyncValue Ready(T value) {
        AsyncValue result(std::make_shared<internal::SharedState<T>>());
        result.state_->Complete(Outcome<T>::Success(std::move(value)));
        return result;
    }

    static AsyncValue Failed(std::exception_ptr error) {
        AsyncValue result(std::make_shared<internal::SharedState<T>>());
        result.state_->Complete(Outcome<T>::Failure(std::move(error)));
        return result;
    }

private:
    template<typename> friend class Promise;

    explicit AsyncValue(std::shared_ptr<internal::SharedState<T>> state) : state_(std::move(state)) {}

    std::shared_ptr<internal::SharedState<T>> state_;
};

/**
 * Producer side. Only the holder of the Promise can complete the value.
 * A promise dropped while pending fails its value instead of leaving waiters hanging.
 */
template<typename T>
class Promise {
public:
    Promise() : state_(std::make_shared<internal::SharedState<T>>()) {}

    ~Promise() { Abandon(); }

    Promise(const Promise&) = delete;
    Promise& operator=(const Promise&) = delete;
    Promise(Promise&&) noexcept = default;
    Promise& operator=(Promise&& other) noexcept {
        if (this != &other) {
            Abandon();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    AsyncValue<T> GetAsyncValue() const { return AsyncValue<T>(state_); }

    // Each returns false if the value was already completed
    bool Complete(Outcome<T> outcome) { return state_->Complete(std::move(outcome)); }
    bool SetValue(T value) { return Complete(Outcome<T>::Success(std::move(value))); }
    bool SetException(std::exception_ptr error) { return Complete(Outcome<T>::Failure(std::move(error))); }

private:
    void Abandon() {
        if (state_ && !state_->IsCompleted()) {
            state_->Complete(Outcome<T>::Failure(
                std::make_exception_ptr(std::logic_error("broken promise: producer went away"))));
        }
    }

    std::shared_ptr<internal::SharedState<T>> state_;
};

} // namespace Rendezvous

#endif // RENDEZVOUS_ASYNC_ASYNC_VALUE_H_
