#ifndef RENDEZVOUS_ASYNC_JOIN_H_
#define RENDEZVOUS_ASYNC_JOIN_H_

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include <glog/logging.h>
#include "absl/synchronization/mutex.h"
#include "async_value.h"

namespace Rendezvous {

template<typename V>
struct IsAsyncValue : std::false_type {};

template<typename T>
struct IsAsyncValue<AsyncValue<T>> : std::true_type {};

namespace internal {

/**
 * Rendezvous record shared by the two completion callbacks of one Join.
 * Both producers may complete concurrently, so every field is under mu.
 */
template<typename A, typename B, typename R>
struct JoinState : std::enable_shared_from_this<JoinState<A, B, R>> {
    absl::Mutex mu;
    std::optional<A> left ABSL_GUARDED_BY(mu);
    std::optional<B> right ABSL_GUARDED_BY(mu);
    // Set by the single callback allowed to finish the join
    bool fired ABSL_GUARDED_BY(mu) = false;

    std::function<AsyncValue<R>(A, B)> on_both;
    Promise<R> result;

    // Called when one side failed. Only the first failure is surfaced.
    void Fail(const std::exception_ptr& error, const char* side) {
        {
            absl::MutexLock lock(&mu);
            if (fired) {
                VLOG(2) << "Join: discarding late " << side << " failure: " << DescribeError(error);
                return;
            }
            fired = true;
        }
        VLOG(1) << "Join: " << side << " input failed first: " << DescribeError(error);
        result.SetException(error);
    }

    // Called with both values once the second side arrived
    void Combine(A a, B b) {
        AsyncValue<R> combined;
        try {
            combined = on_both(std::move(a), std::move(b));
        } catch (...) {
            result.SetException(std::current_exception());
            return;
        }
        // Keep the state (and its promise) alive until the combined value completes
        auto self = this->shared_from_this();
        combined.OnComplete([self](const Outcome<R>& outcome) { self->result.Complete(outcome); });
    }
};

} // namespace internal

/**
 * Waits for two independently completing values and then runs `on_both`
 * exactly once with both results. The joined value completes with the
 * outcome of `on_both`.
 *
 * If either input fails, the joined value fails with the first failure to
 * arrive and `on_both` never runs; a second failure is dropped.
 */
template<typename A, typename B, typename F>
auto Join(AsyncValue<A> a, AsyncValue<B> b, F on_both) {
    using Combined = std::invoke_result_t<F&, A, B>;
    static_assert(IsAsyncValue<Combined>::value, "on_both must return an AsyncValue");
    using R = typename Combined::value_type;
    using State = internal::JoinState<A, B, R>;

    auto state = std::make_shared<State>();
    state->on_both = std::move(on_both);
    AsyncValue<R> joined = state->result.GetAsyncValue();

    a.OnComplete([state](const Outcome<A>& outcome) {
        if (!outcome.ok()) {
            state->Fail(outcome.error(), "left");
            return;
        }
        std::optional<B> other;
        {
            absl::MutexLock lock(&state->mu);
            if (state->fired) {
                return;
            }
            if (!state->right) {
                state->left = outcome.value();
                return;
            }
            state->fired = true;
            other = std::move(state->right);
        }
        state->Combine(outcome.value(), std::move(*other));
    });

    b.OnComplete([state](const Outcome<B>& outcome) {
        if (!outcome.ok()) {
            state->Fail(outcome.error(), "right");
            return;
        }
        std::optional<A> other;
        {
            absl::MutexLock lock(&state->mu);
            if (state->fired) {
                return;
            }
            if (!state->left) {
                state->right = outcome.value();
                return;
            }
            state->fired = true;
            other = std::move(state->left);
        }
        state->Combine(std::move(*other), outcome.value());
    });

    return joined;
}

/**
 * Maps the value of `input` through `f` once it is available.
 * Failures of `input` and exceptions thrown by `f` fail the result.
 * `f` runs on the thread that completes `input`.
 */
template<typename T, typename F>
auto Then(AsyncValue<T> input, F f) {
    using R = std::invoke_result_t<F&, const T&>;
    auto promise = std::make_shared<Promise<R>>();
    AsyncValue<R> result = promise->GetAsyncValue();

    input.OnComplete([promise, f = std::move(f)](const Outcome<T>& outcome) mutable {
        if (!outcome.ok()) {
            promise->SetException(outcome.error());
            return;
        }
        try {
            promise->SetValue(f(outcome.value()));
        } catch (...) {
            promise->SetException(std::current_exception());
        }
    });
    return result;
}

} // namespace Rendezvous

#endif // RENDEZVOUS_ASYNC_JOIN_H_
