#ifndef RENDEZVOUS_PIPELINE_UPDATE_PIPELINE_H_
#define RENDEZVOUS_PIPELINE_UPDATE_PIPELINE_H_

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>

#include "absl/synchronization/mutex.h"
#include "../async/async_value.h"
#include "../io/interfaces.h"
#include "../record/transform.h"

namespace Rendezvous {

/**
 * Lifecycle of one run.
 * Idle -> Gathering (read || prompt) -> Joined -> Transforming -> Writing -> Done,
 * Failed is terminal and reachable from Gathering, Transforming and Writing.
 */
enum class RunState {
    kIdle,
    kGathering,
    kJoined,
    kTransforming,
    kWriting,
    kDone,
    kFailed
};

const char* RunStateName(RunState state);

struct RunReport {
    size_t records_written = 0;
    int64_t adjustment = 0;
};

/**
 * Read -> parse -> prompt -> transform -> write, once.
 *
 * The providers and the sink are injected; the pipeline holds references
 * and never owns them. One pipeline object performs exactly one run, in
 * either the joined or the sequential style.
 */
class UpdatePipeline {
public:
    UpdatePipeline(ISourceProvider& source, IAdjustmentProvider& adjustment, IRecordSink& sink,
                   AgeChangeListener listener = LogAgeChange);

    UpdatePipeline(const UpdatePipeline&) = delete;
    UpdatePipeline& operator=(const UpdatePipeline&) = delete;

    /**
     * Starts the joined run without blocking: lines and adjustment are
     * fetched concurrently, and transform + write happen once both are in.
     * Throws std::logic_error if this pipeline already ran.
     */
    AsyncValue<RunReport> Start();

    /**
     * Joined run, blocking until it completes. A zero timeout waits forever.
     * Throws a kTimeout PipelineError when the timeout expires:
     *  - still gathering: the run fails with kTimeout and the sink is never
     *    called for it;
     *  - already joined: the write keeps going in the background and its late
     *    outcome lands in state() / failure().
     * Rethrows the run failure otherwise.
     */
    RunReport Run(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * Direct-style run on the calling thread: each step waits for the one before.
     */
    RunReport RunSequential();

    RunState state() const;
    std::exception_ptr failure() const;

private:
    /**
     * Run bookkeeping shared with the completion callbacks; they can fire
     * after a timed out Run() returned.
     */
    struct RunContext {
        mutable absl::Mutex mu;
        RunState state ABSL_GUARDED_BY(mu) = RunState::kIdle;
        std::exception_ptr failure ABSL_GUARDED_BY(mu);
        // The caller stopped waiting after the inputs were joined
        bool caller_gave_up ABSL_GUARDED_BY(mu) = false;

        // Moves forward from `from` only; false if the run left `from` already
        bool Advance(RunState from, RunState to);
        void Set(RunState to);
        // No-op if the run already failed (first failure wins)
        void Fail(std::exception_ptr error);
        // Gathering -> Failed(error). Once the inputs have been joined the run
        // keeps going, caller_gave_up is set and false is returned.
        bool Abandon(std::exception_ptr error);
        bool CallerGaveUp() const;
    };

    void BeginRun();

    ISourceProvider& source_;
    IAdjustmentProvider& adjustment_;
    IRecordSink& sink_;
    AgeChangeListener listener_;
    std::shared_ptr<RunContext> context_;
};

} // namespace Rendezvous

#endif // RENDEZVOUS_PIPELINE_UPDATE_PIPELINE_H_
