/**
 * @file test_parallel_dispatcher.cpp
 * @brief Unit tests for ParallelDispatcher and CancellationToken
 *
 * Tests cover:
 * 1. Rows ordered by task index for any worker count
 * 2. Fail-fast on task exceptions and wrong row lengths
 * 3. Cancellation and timeout
 * 4. Error hierarchy
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "core/Errors.hpp"
#include "core/ParallelDispatcher.hpp"

using namespace AnnoEnrich;

static std::vector<Position> row_for(int i) {
    return {static_cast<Position>(i), static_cast<Position>(i) * 10, 7};
}

TEST(ParallelDispatcherTest, RowsFollowTaskIndex) {
    for (int workers : {1, 2, 4}) {
        ParallelDispatcher dispatcher(workers);
        Eigen::MatrixXd m = dispatcher.run(50, 3, row_for);

        ASSERT_EQ(m.rows(), 50);
        ASSERT_EQ(m.cols(), 3);
        for (int i = 0; i < 50; ++i) {
            EXPECT_EQ(m(i, 0), i);
            EXPECT_EQ(m(i, 1), i * 10);
            EXPECT_EQ(m(i, 2), 7);
        }
    }
}

TEST(ParallelDispatcherTest, SequentialAndParallelIdentical) {
    auto task = [](int i) {
        // uneven work so that completion order differs from task order
        std::this_thread::sleep_for(std::chrono::microseconds((i % 5) * 200));
        return row_for(i);
    };
    Eigen::MatrixXd seq = ParallelDispatcher(1).run(40, 3, task);
    Eigen::MatrixXd par = ParallelDispatcher(4).run(40, 3, task);
    EXPECT_TRUE(seq == par);
}

TEST(ParallelDispatcherTest, ZeroTasks) {
    Eigen::MatrixXd m = ParallelDispatcher(2).run(0, 3, row_for);
    EXPECT_EQ(m.rows(), 0);
    EXPECT_EQ(m.cols(), 3);
}

TEST(ParallelDispatcherTest, TaskFailureAbortsRun) {
    auto task = [](int i) -> std::vector<Position> {
        if (i == 13) throw std::runtime_error("boom");
        return row_for(i);
    };
    for (int workers : {1, 3}) {
        try {
            ParallelDispatcher(workers).run(30, 3, task);
            FAIL() << "expected WorkerFailure";
        } catch (const WorkerFailure& e) {
            EXPECT_EQ(e.task_index(), 13);
            EXPECT_EQ(e.cause(), "boom");
            EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
        }
    }
}

TEST(ParallelDispatcherTest, WrongRowLengthIsAFailure) {
    auto task = [](int i) -> std::vector<Position> {
        if (i == 2) return {1, 2};
        return row_for(i);
    };
    EXPECT_THROW(ParallelDispatcher(2).run(5, 3, task), WorkerFailure);
}

TEST(ParallelDispatcherTest, CancelledTokenStopsRun) {
    CancellationToken token;
    std::atomic<int> calls{0};
    auto task = [&](int i) {
        if (++calls == 5) token.request_cancel();
        return row_for(i);
    };

    ParallelDispatcher dispatcher(1, &token);
    EXPECT_THROW(dispatcher.run(100, 3, task), CancelledError);
    EXPECT_LT(calls.load(), 100);
    EXPECT_EQ(token.reason(), "cancelled");
}

TEST(ParallelDispatcherTest, TimeoutStopsRun) {
    CancellationToken token;
    token.set_timeout(0.05);
    auto task = [](int i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return row_for(i);
    };

    ParallelDispatcher dispatcher(2, &token);
    EXPECT_THROW(dispatcher.run(200, 3, task), CancelledError);
    EXPECT_EQ(token.reason(), "timeout");
}

TEST(CancellationTokenTest, States) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_EQ(token.reason(), "");

    token.set_timeout(0.0);
    EXPECT_FALSE(token.is_cancelled());

    token.request_cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(token.reason(), "cancelled");
}

TEST(ParallelDispatcherTest, DefaultWorkersAtLeastOne) {
    EXPECT_GE(ParallelDispatcher::default_workers(), 1);
    EXPECT_EQ(ParallelDispatcher(0).num_workers(), 1);
}

TEST(ErrorsTest, HierarchyAndMessages) {
    const WorkerFailure failure(4, "bad row");
    EXPECT_EQ(failure.task_index(), 4);
    EXPECT_EQ(failure.cause(), "bad row");
    EXPECT_STREQ(failure.what(), "Worker failed on sample 4: bad row");

    EXPECT_THROW(throw SamplingExhaustionError("no island"), EnrichError);
    EXPECT_THROW(throw MalformedInputError("row"), EnrichError);
    EXPECT_THROW(throw ConfigurationError("option"), std::runtime_error);
    EXPECT_THROW(throw CancelledError("stop"), EnrichError);
}
