#include <gtest/gtest.h>
#include "../../src/async/async_value.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace Rendezvous;
using namespace std::chrono_literals;

TEST(AsyncValueTest, CompletesOnce) {
    Promise<int> promise;
    AsyncValue<int> value = promise.GetAsyncValue();
    EXPECT_FALSE(value.IsCompleted());

    EXPECT_TRUE(promise.SetValue(1));
    EXPECT_FALSE(promise.SetValue(2));
    EXPECT_FALSE(promise.SetException(std::make_exception_ptr(std::runtime_error("late"))));

    EXPECT_TRUE(value.IsCompleted());
    EXPECT_EQ(value.Get(), 1);
}

TEST(AsyncValueTest, CallbackBeforeCompletionRunsOnCompletingThread) {
    Promise<std::string> promise;
    AsyncValue<std::string> value = promise.GetAsyncValue();

    std::thread::id callback_thread;
    int calls = 0;
    value.OnComplete([&](const Outcome<std::string>& outcome) {
        callback_thread = std::this_thread::get_id();
        ++calls;
        EXPECT_EQ(outcome.value(), "done");
    });
    EXPECT_EQ(calls, 0);

    std::thread producer([&promise] { promise.SetValue("done"); });
    std::thread::id producer_id = producer.get_id();
    producer.join();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(callback_thread, producer_id);
}

TEST(AsyncValueTest, CallbackAfterCompletionRunsInline) {
    AsyncValue<int> value = AsyncValue<int>::Ready(7);
    int seen = 0;
    value.OnComplete([&seen](const Outcome<int>& outcome) { seen = outcome.value(); });
    EXPECT_EQ(seen, 7);
}

TEST(AsyncValueTest, EveryCallbackRunsExactlyOnce) {
    Promise<int> promise;
    AsyncValue<int> value = promise.GetAsyncValue();
    std::atomic<int> calls{0};
    for (int i = 0; i < 5; ++i) {
        value.OnComplete([&calls](const Outcome<int>&) { calls++; });
    }
    promise.SetValue(3);
    promise.SetValue(4);
    value.OnComplete([&calls](const Outcome<int>&) { calls++; });
    EXPECT_EQ(calls, 6);
}

TEST(AsyncValueTest, ThrowingCallbackDoesNotStarveLaterOnes) {
    Promise<int> promise;
    AsyncValue<int> value = promise.GetAsyncValue();
    int calls = 0;
    value.OnComplete([](const Outcome<int>&) { throw std::runtime_error("boom"); });
    value.OnComplete([&calls](const Outcome<int>& outcome) {
        calls++;
        EXPECT_EQ(outcome.value(), 1);
    });

    EXPECT_TRUE(promise.SetValue(1));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(value.Get(), 1);
}

TEST(AsyncValueTest, FailureIsRethrownByGet) {
    Promise<int> promise;
    promise.SetException(std::make_exception_ptr(InvalidInputError("nope")));
    AsyncValue<int> value = promise.GetAsyncValue();

    EXPECT_THROW(value.Get(), PipelineError);
    Outcome<int> outcome = value.Wait();
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(DescribeError(outcome.error()), "InvalidInput: nope");
}

TEST(AsyncValueTest, GetBlocksUntilCompleted) {
    Promise<int> promise;
    AsyncValue<int> value = promise.GetAsyncValue();
    std::thread producer([&promise] {
        std::this_thread::sleep_for(20ms);
        promise.SetValue(42);
    });
    EXPECT_EQ(value.Get(), 42);
    producer.join();
}

TEST(AsyncValueTest, GetForTimesOut) {
    Promise<int> promise;
    AsyncValue<int> value = promise.GetAsyncValue();
    try {
        value.GetFor(10ms);
        FAIL() << "expected a timeout";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kTimeout);
    }
    EXPECT_FALSE(value.IsCompleted());

    promise.SetValue(5);
    EXPECT_EQ(value.GetFor(10ms), 5);
}

TEST(AsyncValueTest, DroppedPromiseBreaksValue) {
    AsyncValue<int> value;
    {
        Promise<int> promise;
        value = promise.GetAsyncValue();
    }
    ASSERT_TRUE(value.IsCompleted());
    EXPECT_THROW(value.Get(), std::logic_error);
}

TEST(AsyncValueTest, MovedPromiseStillCompletes) {
    Promise<int> first;
    AsyncValue<int> value = first.GetAsyncValue();
    Promise<int> second = std::move(first);
    EXPECT_FALSE(value.IsCompleted());
    second.SetValue(9);
    EXPECT_EQ(value.Get(), 9);
}

TEST(AsyncValueTest, MoveAssignBreaksOverwrittenValue) {
    Promise<int> target;
    AsyncValue<int> overwritten = target.GetAsyncValue();
    Promise<int> source;
    AsyncValue<int> kept = source.GetAsyncValue();

    target = std::move(source);
    EXPECT_THROW(overwritten.Get(), std::logic_error);
    target.SetValue(1);
    EXPECT_EQ(kept.Get(), 1);
}

TEST(AsyncValueTest, UnitValues) {
    AsyncValue<Unit> value = AsyncValue<Unit>::Ready(Unit{});
    EXPECT_TRUE(value.IsCompleted());
    EXPECT_EQ(value.Get(), Unit{});

    AsyncValue<Unit> failed = AsyncValue<Unit>::Failed(std::make_exception_ptr(IOError("disk")));
    EXPECT_THROW(failed.Get(), PipelineError);
}
