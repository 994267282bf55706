#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/pipeline/update_pipeline.h"
#include "../../src/common/errors.h"
#include "mock_providers.h"

#include <chrono>
#include <thread>

using namespace Rendezvous;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;

class UpdatePipelineTest : public ::testing::Test {
protected:
    AgeChangeListener Recorder() {
        return [this](const AgeChange& change) { changes_.push_back(change); };
    }

    std::unique_ptr<UpdatePipeline> MakePipeline() {
        return std::make_unique<UpdatePipeline>(source_, adjustment_, sink_, Recorder());
    }

    // Runs the pipeline and returns the failure it threw
    std::exception_ptr RunExpectingFailure(UpdatePipeline& pipeline) {
        try {
            pipeline.Run();
        } catch (...) {
            return std::current_exception();
        }
        ADD_FAILURE() << "expected the run to fail";
        return nullptr;
    }

    MockSourceProvider source_;
    MockAdjustmentProvider adjustment_;
    MockRecordSink sink_;
    std::vector<AgeChange> changes_;
};

TEST_F(UpdatePipelineTest, AddsAdjustmentToEveryRecord) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kComputingPioneers)));
    EXPECT_CALL(adjustment_, FetchAdjustment()).Times(1).WillOnce(Return(ReadyAdjustment(2)));
    EXPECT_CALL(sink_, Write(kComputingPioneersPlusTwo)).Times(1).WillOnce(Return(WriteDone()));

    auto pipeline = MakePipeline();
    RunReport report = pipeline->Run();

    EXPECT_EQ(report.records_written, 3u);
    EXPECT_EQ(report.adjustment, 2);
    EXPECT_EQ(pipeline->state(), RunState::kDone);
    EXPECT_FALSE(pipeline->failure());
    ASSERT_EQ(changes_.size(), 3u);
    EXPECT_EQ(FormatAgeChange(changes_[0]), "The age of Ada Lovelace changes from 36 to 38");
}

TEST_F(UpdatePipelineTest, NegativeAdjustment) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kFellowship)));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(-2)));
    EXPECT_CALL(sink_, Write(kFellowshipMinusTwo)).WillOnce(Return(WriteDone()));

    EXPECT_EQ(MakePipeline()->Run().records_written, 2u);
}

TEST_F(UpdatePipelineTest, EmptyInputWritesEmptyBatch) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines({})));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(5)));
    EXPECT_CALL(sink_, Write(std::vector<std::string>{})).WillOnce(Return(WriteDone()));

    EXPECT_EQ(MakePipeline()->Run().records_written, 0u);
    EXPECT_TRUE(changes_.empty());
}

TEST_F(UpdatePipelineTest, ZeroAdjustmentStillWrites) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kFellowship)));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(0)));
    EXPECT_CALL(sink_, Write(kFellowship)).WillOnce(Return(WriteDone()));

    MakePipeline()->Run();
    EXPECT_EQ(changes_.size(), 2u);
}

TEST_F(UpdatePipelineTest, SourceFailureNeverWrites) {
    EXPECT_CALL(source_, FetchLines())
        .WillOnce(Return(FailedWith<std::vector<std::string>>(IOError("cannot open people.csv"))));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(2)));
    EXPECT_CALL(sink_, Write(_)).Times(0);

    auto pipeline = MakePipeline();
    EXPECT_EQ(KindOf(RunExpectingFailure(*pipeline)), ErrorKind::kIOError);
    EXPECT_EQ(pipeline->state(), RunState::kFailed);
    EXPECT_EQ(KindOf(pipeline->failure()), ErrorKind::kIOError);
    EXPECT_TRUE(changes_.empty());
}

TEST_F(UpdatePipelineTest, MalformedLineNeverWrites) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines({"Ada,Lovelace,36", "Alan,Turing"})));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(2)));
    EXPECT_CALL(sink_, Write(_)).Times(0);

    auto pipeline = MakePipeline();
    EXPECT_EQ(KindOf(RunExpectingFailure(*pipeline)), ErrorKind::kMalformedRecord);
}

TEST_F(UpdatePipelineTest, InvalidAdjustmentNeverWrites) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kFellowship)));
    EXPECT_CALL(adjustment_, FetchAdjustment())
        .WillOnce(Return(FailedWith<int64_t>(InvalidInputError("'abc' is not an integer"))));
    EXPECT_CALL(sink_, Write(_)).Times(0);

    auto pipeline = MakePipeline();
    EXPECT_EQ(KindOf(RunExpectingFailure(*pipeline)), ErrorKind::kInvalidInput);
}

TEST_F(UpdatePipelineTest, OverflowFailsInTransform) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines({"Old,Timer,9223372036854775807"})));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(1)));
    EXPECT_CALL(sink_, Write(_)).Times(0);

    auto pipeline = MakePipeline();
    EXPECT_EQ(KindOf(RunExpectingFailure(*pipeline)), ErrorKind::kInvalidInput);
    EXPECT_EQ(pipeline->state(), RunState::kFailed);
}

TEST_F(UpdatePipelineTest, SinkFailureFailsRun) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kFellowship)));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(1)));
    EXPECT_CALL(sink_, Write(_)).WillOnce(Return(FailedWith<Unit>(IOError("disk full"))));

    auto pipeline = MakePipeline();
    EXPECT_EQ(KindOf(RunExpectingFailure(*pipeline)), ErrorKind::kIOError);
    EXPECT_EQ(pipeline->state(), RunState::kFailed);
}

TEST_F(UpdatePipelineTest, WaitsForBothInputsInAnyOrder) {
    for (bool lines_first : {true, false}) {
        ::testing::Mock::VerifyAndClearExpectations(&sink_);
        Promise<std::vector<std::string>> lines;
        Promise<int64_t> adjustment;
        EXPECT_CALL(source_, FetchLines()).WillOnce(Return(lines.GetAsyncValue()));
        EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(adjustment.GetAsyncValue()));
        EXPECT_CALL(sink_, Write(kComputingPioneersPlusTwo)).WillOnce(Return(WriteDone()));

        auto pipeline = MakePipeline();
        AsyncValue<RunReport> result = pipeline->Start();
        EXPECT_EQ(pipeline->state(), RunState::kGathering);

        if (lines_first) {
            lines.SetValue(kComputingPioneers);
        } else {
            adjustment.SetValue(2);
        }
        EXPECT_EQ(pipeline->state(), RunState::kGathering);
        EXPECT_FALSE(result.IsCompleted());

        if (lines_first) {
            adjustment.SetValue(2);
        } else {
            lines.SetValue(kComputingPioneers);
        }
        EXPECT_EQ(result.Get().records_written, 3u);
        EXPECT_EQ(pipeline->state(), RunState::kDone);
    }
}

TEST_F(UpdatePipelineTest, InputsFetchedConcurrently) {
    // Both fetches are issued before either input is available
    Promise<std::vector<std::string>> lines;
    Promise<int64_t> adjustment;
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(lines.GetAsyncValue()));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(adjustment.GetAsyncValue()));
    EXPECT_CALL(sink_, Write(_)).WillOnce(Return(WriteDone()));

    auto pipeline = MakePipeline();
    AsyncValue<RunReport> result = pipeline->Start();
    ::testing::Mock::VerifyAndClearExpectations(&source_);
    ::testing::Mock::VerifyAndClearExpectations(&adjustment_);

    std::thread prompt([&adjustment] { adjustment.SetValue(1); });
    std::thread reader([&lines] { lines.SetValue(kFellowship); });
    prompt.join();
    reader.join();
    EXPECT_EQ(result.Get().adjustment, 1);
}

TEST_F(UpdatePipelineTest, TimeoutBeforeJoinAbandonsRun) {
    Promise<std::vector<std::string>> lines;
    Promise<int64_t> adjustment;
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(lines.GetAsyncValue()));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(adjustment.GetAsyncValue()));
    EXPECT_CALL(sink_, Write(_)).Times(0);

    auto pipeline = MakePipeline();
    lines.SetValue(kFellowship);
    try {
        pipeline->Run(20ms);
        FAIL() << "expected a timeout";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kTimeout);
    }
    EXPECT_EQ(pipeline->state(), RunState::kFailed);

    // A late answer must not reach the sink
    adjustment.SetValue(2);
    EXPECT_EQ(pipeline->state(), RunState::kFailed);
    EXPECT_EQ(KindOf(pipeline->failure()), ErrorKind::kTimeout);
    EXPECT_TRUE(changes_.empty());
}

TEST_F(UpdatePipelineTest, TimeoutAfterJoinStillBoundsWait) {
    Promise<Unit> write_done;
    AsyncValue<Unit> write_value = write_done.GetAsyncValue();
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kFellowship)));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(-2)));
    EXPECT_CALL(sink_, Write(kFellowshipMinusTwo)).Times(1).WillOnce(Return(write_value));

    auto pipeline = MakePipeline();
    auto start = std::chrono::steady_clock::now();
    try {
        pipeline->Run(20ms);
        FAIL() << "expected a timeout";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kTimeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    EXPECT_EQ(pipeline->state(), RunState::kWriting);

    // The write finishes in the background and its outcome is kept
    std::thread slow_disk([&write_done] { write_done.SetValue(Unit{}); });
    slow_disk.join();
    EXPECT_EQ(pipeline->state(), RunState::kDone);
    EXPECT_FALSE(pipeline->failure());
}

TEST_F(UpdatePipelineTest, LateWriteFailureIsRecorded) {
    Promise<Unit> write_done;
    AsyncValue<Unit> write_value = write_done.GetAsyncValue();
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kFellowship)));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(1)));
    EXPECT_CALL(sink_, Write(_)).Times(1).WillOnce(Return(write_value));

    auto pipeline = MakePipeline();
    EXPECT_THROW(pipeline->Run(10ms), PipelineError);

    write_done.SetException(std::make_exception_ptr(IOError("disk full")));
    EXPECT_EQ(pipeline->state(), RunState::kFailed);
    EXPECT_EQ(KindOf(pipeline->failure()), ErrorKind::kIOError);
}

TEST_F(UpdatePipelineTest, SequentialRunsStepByStep) {
    {
        InSequence steps;
        EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines(kComputingPioneers)));
        EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(2)));
        EXPECT_CALL(sink_, Write(kComputingPioneersPlusTwo)).WillOnce(Return(WriteDone()));
    }

    auto pipeline = MakePipeline();
    RunReport report = pipeline->RunSequential();
    EXPECT_EQ(report.records_written, 3u);
    EXPECT_EQ(pipeline->state(), RunState::kDone);
    EXPECT_EQ(changes_.size(), 3u);
}

TEST_F(UpdatePipelineTest, SequentialSourceFailureSkipsPrompt) {
    EXPECT_CALL(source_, FetchLines())
        .WillOnce(Return(FailedWith<std::vector<std::string>>(IOError("cannot open people.csv"))));
    EXPECT_CALL(adjustment_, FetchAdjustment()).Times(0);
    EXPECT_CALL(sink_, Write(_)).Times(0);

    auto pipeline = MakePipeline();
    EXPECT_THROW(pipeline->RunSequential(), PipelineError);
    EXPECT_EQ(pipeline->state(), RunState::kFailed);
}

TEST_F(UpdatePipelineTest, RunsOnlyOnce) {
    EXPECT_CALL(source_, FetchLines()).WillOnce(Return(ReadyLines({})));
    EXPECT_CALL(adjustment_, FetchAdjustment()).WillOnce(Return(ReadyAdjustment(0)));
    EXPECT_CALL(sink_, Write(_)).WillOnce(Return(WriteDone()));

    auto pipeline = MakePipeline();
    pipeline->Run();
    EXPECT_THROW(pipeline->Start(), std::logic_error);
    EXPECT_THROW(pipeline->RunSequential(), std::logic_error);
    EXPECT_EQ(pipeline->state(), RunState::kDone);
}

TEST(RunStateTest, Names) {
    EXPECT_STREQ(RunStateName(RunState::kIdle), "Idle");
    EXPECT_STREQ(RunStateName(RunState::kGathering), "Gathering");
    EXPECT_STREQ(RunStateName(RunState::kFailed), "Failed");
}
