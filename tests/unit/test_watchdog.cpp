#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <thread>

#include "grid_test_utils.h"
#include "mocks/mock_store.h"
#include "watchdog.h"

namespace {

using namespace promptgrid;
using namespace promptgrid::testing_support;
using namespace testing;
using namespace std::chrono_literals;

class WatchdogTest : public Test {
protected:
    void SetUp() override {
        config.stale_threshold = 60s;
        config.interval = 1s;
        config.max_retries = 3;
    }

    FakeClock clock;
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>(clock.Fn());
    WatchdogConfig config;
};

TEST_F(WatchdogTest, ResetsTaskClaimedPastThreshold) {
    auto s = SeedCell(*store, 1);
    store->ClaimEligibleCell({"ollama"}, false);
    ASSERT_EQ(store->ClaimTaskBatch(s.cell_id, 10).size(), 1u);

    Watchdog watchdog(store, config);

    clock.Advance(30s);
    auto early = watchdog.RunPass();
    EXPECT_EQ(early.tasks_requeued, 0);

    clock.Advance(31s);
    auto report = watchdog.RunPass();
    EXPECT_EQ(report.tasks_requeued, 1);
    EXPECT_EQ(report.errors, 0);

    auto task = store->ListTasks(s.cell_id)[0];
    EXPECT_EQ(task.status, TaskStatus::PENDING);
    EXPECT_EQ(task.retry_count, 1);
    EXPECT_EQ(watchdog.PassCount(), 2);
}

TEST_F(WatchdogTest, FourthResetFailsTask) {
    auto s = SeedCell(*store, 1);
    Watchdog watchdog(store, config);

    for (int i = 1; i <= 4; ++i) {
        ASSERT_EQ(store->ClaimTaskBatch(s.cell_id, 10).size(), 1u) << "attempt " << i;
        clock.Advance(61s);
        auto report = watchdog.RunPass();
        if (i < 4) {
            EXPECT_EQ(report.tasks_requeued, 1);
        } else {
            EXPECT_EQ(report.tasks_failed, 1);
        }
    }

    auto task = store->ListTasks(s.cell_id)[0];
    EXPECT_EQ(task.status, TaskStatus::FAILED);
    EXPECT_EQ(task.retry_count, 4);
    EXPECT_TRUE(store->ClaimTaskBatch(s.cell_id, 10).empty());
}

TEST_F(WatchdogTest, ReopensDoneCellWithPendingTask) {
    auto s = SeedCell(*store, 2);
    auto tasks = store->ListTasks(s.cell_id);
    InMemoryStoreTestPeer::ForceTaskStatus(*store, tasks[0].task_id, TaskStatus::DONE);
    InMemoryStoreTestPeer::ForceCell(*store, s.cell_id, CellStatus::DONE, 0);

    Watchdog watchdog(store, config);
    auto report = watchdog.ReconcileStartup();
    EXPECT_EQ(report.cells_reopened, 1);
    EXPECT_EQ(store->GetCell(s.cell_id)->status, CellStatus::AVAILABLE);

    // A worker can now pick it up again
    EXPECT_TRUE(store->ClaimEligibleCell({"ollama"}, false).has_value());
}

TEST_F(WatchdogTest, DoneCellWithTerminalTasksStaysDone) {
    auto s = SeedCell(*store, 1);
    store->ClaimEligibleCell({"ollama"}, false);
    auto batch = store->ClaimTaskBatch(s.cell_id, 10);
    store->FailTaskAttempt(batch[0], 0, "fatal");
    ASSERT_EQ(store->ReleaseCell(s.cell_id), CellStatus::DONE);

    Watchdog watchdog(store, config);
    auto report = watchdog.RunPass();
    EXPECT_EQ(report.cells_reopened, 0);
    EXPECT_EQ(store->GetCell(s.cell_id)->status, CellStatus::DONE);
}

TEST_F(WatchdogTest, CompletionRacingResetIsSkipped) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    StaleTaskRef ref{1, 10, TimePoint{}};
    EXPECT_CALL(*mock, ListStaleTasks(config.stale_threshold)).WillOnce(Return(std::vector<StaleTaskRef>{ref}));
    EXPECT_CALL(*mock, ResetStaleTask(_, 3)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*mock, ListDoneCellsWithPendingTasks()).WillOnce(Return(std::vector<long long>{}));

    Watchdog watchdog(mock, config);
    auto report = watchdog.RunPass();
    EXPECT_EQ(report.tasks_requeued, 0);
    EXPECT_EQ(report.tasks_failed, 0);
    EXPECT_EQ(report.errors, 0);
}

TEST_F(WatchdogTest, ErrorsAreIsolatedPerEntity) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    std::vector<StaleTaskRef> stale{{1, 10, TimePoint{}}, {2, 10, TimePoint{}}, {3, 11, TimePoint{}}};
    EXPECT_CALL(*mock, ListStaleTasks(_)).WillOnce(Return(stale));
    EXPECT_CALL(*mock, ResetStaleTask(Field(&StaleTaskRef::task_id, 1), _))
        .WillOnce(Return(TaskResetOutcome{TaskStatus::PENDING, 1}));
    EXPECT_CALL(*mock, ResetStaleTask(Field(&StaleTaskRef::task_id, 2), _))
        .WillOnce(Throw(std::runtime_error("deadlock detected")));
    EXPECT_CALL(*mock, ResetStaleTask(Field(&StaleTaskRef::task_id, 3), _))
        .WillOnce(Return(TaskResetOutcome{TaskStatus::FAILED, 4}));

    EXPECT_CALL(*mock, ListDoneCellsWithPendingTasks()).WillOnce(Return(std::vector<long long>{10, 11}));
    EXPECT_CALL(*mock, ReopenCell(10)).WillOnce(Throw(std::runtime_error("lock timeout")));
    EXPECT_CALL(*mock, ReopenCell(11)).WillOnce(Return(CellStatus::IN_USE));

    Watchdog watchdog(mock, config);
    auto report = watchdog.RunPass();
    EXPECT_EQ(report.tasks_requeued, 1);
    EXPECT_EQ(report.tasks_failed, 1);
    EXPECT_EQ(report.cells_reopened, 1);
    EXPECT_EQ(report.errors, 2);
}

TEST_F(WatchdogTest, ScanFailureDoesNotAbortReopen) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    EXPECT_CALL(*mock, ListStaleTasks(_)).WillOnce(Throw(std::runtime_error("db down")));
    EXPECT_CALL(*mock, ListDoneCellsWithPendingTasks()).WillOnce(Return(std::vector<long long>{5}));
    EXPECT_CALL(*mock, ReopenCell(5)).WillOnce(Return(CellStatus::AVAILABLE));

    Watchdog watchdog(mock, config);
    auto report = watchdog.RunPass();
    EXPECT_EQ(report.errors, 1);
    EXPECT_EQ(report.cells_reopened, 1);
}

TEST_F(WatchdogTest, PeriodicSweepRunsUntilStopped) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    EXPECT_CALL(*mock, ListStaleTasks(_)).Times(AtLeast(1));
    EXPECT_CALL(*mock, ListDoneCellsWithPendingTasks()).Times(AtLeast(1));

    config.interval = 1s;
    Watchdog watchdog(mock, config);
    watchdog.Start();
    std::this_thread::sleep_for(1500ms);
    watchdog.Stop();

    EXPECT_GE(watchdog.PassCount(), 1);
    auto after_stop = watchdog.PassCount();
    std::this_thread::sleep_for(1200ms);
    EXPECT_EQ(watchdog.PassCount(), after_stop);
}

TEST(WatchdogConstructionTest, RequiresStore) {
    EXPECT_THROW(Watchdog(nullptr, WatchdogConfig{}), std::invalid_argument);
}

} // namespace
