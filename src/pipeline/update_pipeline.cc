#include "update_pipeline.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "../async/join.h"
#include "../common/errors.h"
#include "../record/record.h"

namespace Rendezvous {

namespace {

std::vector<std::string> TransformBatch(const std::vector<Record>& records, int64_t adjustment,
                                        const AgeChangeListener& listener) {
    return SerializeRecords(ApplyAdjustment(records, adjustment, listener));
}

} // namespace

const char* RunStateName(RunState state) {
    switch (state) {
        case RunState::kIdle:
            return "Idle";
        case RunState::kGathering:
            return "Gathering";
        case RunState::kJoined:
            return "Joined";
        case RunState::kTransforming:
            return "Transforming";
        case RunState::kWriting:
            return "Writing";
        case RunState::kDone:
            return "Done";
        case RunState::kFailed:
            return "Failed";
    }
    return "Unknown";
}

bool UpdatePipeline::RunContext::Advance(RunState from, RunState to) {
    absl::MutexLock lock(&mu);
    if (state != from) {
        return false;
    }
    VLOG(2) << "Run state " << RunStateName(from) << " -> " << RunStateName(to);
    state = to;
    return true;
}

void UpdatePipeline::RunContext::Set(RunState to) {
    absl::MutexLock lock(&mu);
    VLOG(2) << "Run state " << RunStateName(state) << " -> " << RunStateName(to);
    state = to;
}

void UpdatePipeline::RunContext::Fail(std::exception_ptr error) {
    absl::MutexLock lock(&mu);
    if (state == RunState::kFailed) {
        return;
    }
    VLOG(2) << "Run state " << RunStateName(state) << " -> Failed";
    state = RunState::kFailed;
    failure = std::move(error);
}

bool UpdatePipeline::RunContext::Abandon(std::exception_ptr error) {
    absl::MutexLock lock(&mu);
    if (state != RunState::kGathering) {
        caller_gave_up = true;
        return false;
    }
    state = RunState::kFailed;
    failure = std::move(error);
    return true;
}

bool UpdatePipeline::RunContext::CallerGaveUp() const {
    absl::MutexLock lock(&mu);
    return caller_gave_up;
}

UpdatePipeline::UpdatePipeline(ISourceProvider& source, IAdjustmentProvider& adjustment,
                               IRecordSink& sink, AgeChangeListener listener)
    : source_(source),
      adjustment_(adjustment),
      sink_(sink),
      listener_(std::move(listener)),
      context_(std::make_shared<RunContext>()) {}

void UpdatePipeline::BeginRun() {
    if (!context_->Advance(RunState::kIdle, RunState::kGathering)) {
        throw std::logic_error("UpdatePipeline: a pipeline performs a single run");
    }
}

AsyncValue<RunReport> UpdatePipeline::Start() {
    BeginRun();

    std::shared_ptr<RunContext> context = context_;
    IRecordSink* sink = &sink_;
    AgeChangeListener listener = listener_;

    // Both fetches are issued before either is waited on
    AsyncValue<std::vector<Record>> records =
        Then(source_.FetchLines(), [](const std::vector<std::string>& lines) { return ParseRecords(lines); });
    AsyncValue<int64_t> adjustment = adjustment_.FetchAdjustment();

    AsyncValue<RunReport> joined = Join(records, adjustment,
        [context, sink, listener](std::vector<Record> batch, int64_t n) {
            if (!context->Advance(RunState::kGathering, RunState::kJoined)) {
                throw TimeoutError("inputs arrived after the run was abandoned");
            }
            VLOG(1) << "Inputs joined: " << batch.size() << " records, adjustment " << n;

            context->Set(RunState::kTransforming);
            std::vector<std::string> lines = TransformBatch(batch, n, listener);
            const size_t count = lines.size();

            context->Set(RunState::kWriting);
            return Then(sink->Write(std::move(lines)), [count, n](const Unit&) {
                return RunReport{count, n};
            });
        });

    auto done = std::make_shared<Promise<RunReport>>();
    AsyncValue<RunReport> result = done->GetAsyncValue();
    // State is settled before anyone waiting on `result` wakes up
    joined.OnComplete([context, done](const Outcome<RunReport>& outcome) {
        const char* late = context->CallerGaveUp() ? " after the caller timed out" : "";
        if (outcome.ok()) {
            context->Advance(RunState::kWriting, RunState::kDone);
            LOG(INFO) << "Run done" << late << ": wrote " << outcome.value().records_written
                      << " records (adjustment " << outcome.value().adjustment << ")";
        } else {
            context->Fail(outcome.error());
            LOG(ERROR) << "Run failed" << late << ": " << DescribeError(outcome.error());
        }
        done->Complete(outcome);
    });
    return result;
}

RunReport UpdatePipeline::Run(std::chrono::milliseconds timeout) {
    AsyncValue<RunReport> result = Start();
    if (timeout.count() <= 0) {
        return result.Get();
    }

    try {
        return result.GetFor(timeout);
    } catch (const PipelineError& e) {
        if (e.kind() != ErrorKind::kTimeout) {
            throw;
        }
        // Completed right after the wait expired
        if (result.IsCompleted()) {
            return result.Get();
        }
        if (context_->Abandon(std::current_exception())) {
            LOG(ERROR) << "Run abandoned: inputs not joined within " << timeout.count() << " ms";
        } else {
            LOG(ERROR) << "Run exceeded " << timeout.count()
                       << " ms after inputs were joined, the write continues in the background";
        }
        throw;
    }
}

RunReport UpdatePipeline::RunSequential() {
    BeginRun();
    try {
        std::vector<std::string> lines = source_.FetchLines().Get();
        std::vector<Record> records = ParseRecords(lines);
        int64_t n = adjustment_.FetchAdjustment().Get();
        context_->Set(RunState::kJoined);

        context_->Set(RunState::kTransforming);
        std::vector<std::string> updated = TransformBatch(records, n, listener_);
        RunReport report{updated.size(), n};

        context_->Set(RunState::kWriting);
        sink_.Write(std::move(updated)).Get();
        context_->Set(RunState::kDone);

        LOG(INFO) << "Sequential run done: wrote " << report.records_written
                  << " records (adjustment " << report.adjustment << ")";
        return report;
    } catch (...) {
        context_->Fail(std::current_exception());
        LOG(ERROR) << "Sequential run failed: " << DescribeError(std::current_exception());
        throw;
    }
}

RunState UpdatePipeline::state() const {
    absl::MutexLock lock(&context_->mu);
    return context_->state;
}

std::exception_ptr UpdatePipeline::failure() const {
    absl::MutexLock lock(&context_->mu);
    return context_->failure;
}

} // namespace Rendezvous
