#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "grid_test_utils.h"
#include "mocks/mock_store.h"
#include "worker_loop.h"

namespace {

using namespace promptgrid;
using namespace promptgrid::testing_support;
using namespace testing;
using namespace std::chrono_literals;

// Records the size of every batch claim.
class RecordingStore : public InMemoryStore {
public:
    auto ClaimTaskBatch(long long cell_id, int batch_size) -> std::vector<ClaimedTask> override {
        auto batch = InMemoryStore::ClaimTaskBatch(cell_id, batch_size);
        std::lock_guard<std::mutex> lk(mutex_);
        batch_sizes_.push_back(batch.size());
        return batch;
    }

    auto BatchSizes() -> std::vector<size_t> {
        std::lock_guard<std::mutex> lk(mutex_);
        return batch_sizes_;
    }

private:
    std::mutex mutex_;
    std::vector<size_t> batch_sizes_;
};

// Fails the first attempt for every row, succeeds afterwards.
class FlakyPredictor : public IPredictor {
public:
    auto Predict(const Model&, const Prompt&, const Row& row) -> PredictResult override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (attempted_.insert(row.row_id).second) {
            throw std::runtime_error("connection reset");
        }
        return {"ok", 2.0};
    }

private:
    std::mutex mutex_;
    std::set<long long> attempted_;
};

class WorkerLoopTest : public Test {
protected:
    void SetUp() override {
        config.families = {"ollama"};
        config.batch_size = 10;
        config.max_retries = 3;
        config.predict_timeout = 5s;
        config.exit_when_idle = true;
        registry.Register("ollama", predictor);
    }

    auto MakeLoop(std::shared_ptr<IStore> s) -> WorkerLoop {
        return WorkerLoop(std::move(s), registry, config, "worker-test");
    }

    std::shared_ptr<RecordingStore> store = std::make_shared<RecordingStore>();
    std::shared_ptr<ScriptedPredictor> predictor = std::make_shared<ScriptedPredictor>();
    PredictorRegistry registry;
    WorkerConfig config;
};

TEST_F(WorkerLoopTest, DrainsCellInBatchesAndMarksDone) {
    auto s = SeedCell(*store, 25);
    auto loop = MakeLoop(store);

    EXPECT_TRUE(loop.RunOnce());
    EXPECT_THAT(store->BatchSizes(), ElementsAre(10u, 10u, 5u, 0u));

    auto cell = store->GetCell(s.cell_id);
    EXPECT_EQ(cell->status, CellStatus::DONE);
    EXPECT_EQ(cell->active_worker_count, 0);

    auto progress = store->GetCellProgress(s.cell_id);
    EXPECT_EQ(progress->done, 25);
    EXPECT_EQ(predictor->Calls(), 25);

    auto stats = loop.Stats();
    EXPECT_EQ(stats.cells_processed, 1);
    EXPECT_EQ(stats.batches, 3);
    EXPECT_EQ(stats.tasks_completed, 25);

    // Nothing left to do
    EXPECT_FALSE(loop.RunOnce());
}

TEST_F(WorkerLoopTest, PredictionsCarryCellCoordinatesAndWorker) {
    auto s = SeedCell(*store, 2);
    auto loop = MakeLoop(store);
    ASSERT_TRUE(loop.RunOnce());

    for (const auto& task : store->ListTasks(s.cell_id)) {
        auto p = store->GetLatestPrediction(s.cell_id, task.row_id);
        ASSERT_TRUE(p.has_value());
        EXPECT_EQ(p->worker_id, "worker-test");
        EXPECT_EQ(p->model_id, s.model_id);
        EXPECT_EQ(p->prompt_id, s.prompt_id);
        EXPECT_EQ(p->dataset_id, s.dataset_id);
        EXPECT_GT(p->latency_ms, 0.0);
    }
}

TEST_F(WorkerLoopTest, FailingRowIsIsolatedAndHitsRetryCeiling) {
    auto s = SeedCell(*store, 5);
    predictor->FailFor("row 2");
    auto loop = MakeLoop(store);

    ASSERT_TRUE(loop.RunOnce());

    auto progress = store->GetCellProgress(s.cell_id);
    EXPECT_EQ(progress->done, 4);
    EXPECT_EQ(progress->failed, 1);
    EXPECT_EQ(store->GetCell(s.cell_id)->status, CellStatus::DONE);

    auto failed = store->ListFailedTasks(s.cell_id, 10);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].retry_count, config.max_retries + 1);
    EXPECT_EQ(failed[0].last_error, "backend unavailable");

    auto seen = predictor->Seen();
    EXPECT_EQ(std::count(seen.begin(), seen.end(), "row 2"), config.max_retries + 1);

    auto stats = loop.Stats();
    EXPECT_EQ(stats.tasks_requeued, config.max_retries);
    EXPECT_EQ(stats.tasks_failed, 1);
}

TEST_F(WorkerLoopTest, TransientFailureIsRetriedInSameDrain) {
    auto s = SeedCell(*store, 3);
    PredictorRegistry flaky;
    flaky.Register("ollama", std::make_shared<FlakyPredictor>());
    WorkerLoop loop(store, flaky, config, "worker-flaky");

    ASSERT_TRUE(loop.RunOnce());

    for (const auto& task : store->ListTasks(s.cell_id)) {
        EXPECT_EQ(task.status, TaskStatus::DONE);
        EXPECT_EQ(task.retry_count, 1);
    }
    EXPECT_EQ(store->GetCell(s.cell_id)->status, CellStatus::DONE);
}

TEST_F(WorkerLoopTest, TimeoutCountsAsFailedAttempt) {
    auto s = SeedCell(*store, 1);
    config.max_retries = 0;
    config.predict_timeout = 1s;
    predictor->SetDelay(1500ms);
    auto loop = MakeLoop(store);

    ASSERT_TRUE(loop.RunOnce());

    auto failed = store->ListFailedTasks(s.cell_id, 10);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_NE(failed[0].last_error.find("timed out"), std::string::npos);
    EXPECT_FALSE(store->GetLatestPrediction(s.cell_id, failed[0].row_id).has_value());

    // Let the abandoned call finish before the predictor goes away.
    std::this_thread::sleep_for(700ms);
}

TEST_F(WorkerLoopTest, IgnoresCellsOfOtherFamilies) {
    SeedCell(*store, 3, "chat");
    auto loop = MakeLoop(store);
    EXPECT_FALSE(loop.RunOnce());
    EXPECT_EQ(predictor->Calls(), 0);
}

TEST_F(WorkerLoopTest, RejectsFamilyWithoutBackend) {
    config.families = {"ollama", "chat"};
    EXPECT_THROW(MakeLoop(store), std::invalid_argument);
}

TEST_F(WorkerLoopTest, FamiliesDefaultToRegisteredBackends) {
    config.families.clear();
    auto loop = MakeLoop(store);
    EXPECT_EQ(loop.Families(), std::set<std::string>{"ollama"});
}

TEST_F(WorkerLoopTest, GeneratesWorkerIdWhenNoneGiven) {
    WorkerLoop loop(store, registry, config);
    EXPECT_EQ(loop.WorkerId().size(), 36u);
}

TEST_F(WorkerLoopTest, RunExitsWhenIdle) {
    SeedCell(*store, 3, "ollama", "-a");
    SeedCell(*store, 4, "ollama", "-b");
    auto loop = MakeLoop(store);

    std::atomic<bool> stop{false};
    loop.Run(&stop);

    EXPECT_EQ(loop.Stats().cells_processed, 2);
    EXPECT_EQ(predictor->Calls(), 7);
}

TEST_F(WorkerLoopTest, RunStopsOnFlagWhilePolling) {
    config.exit_when_idle = false;
    config.idle_poll = 10s;
    auto loop = MakeLoop(store);

    std::atomic<bool> stop{false};
    std::thread t([&]() { loop.Run(&stop); });
    std::this_thread::sleep_for(200ms);
    auto begin = std::chrono::steady_clock::now();
    stop = true;
    t.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
}

TEST_F(WorkerLoopTest, LostClaimWritesNothingAndStillReleases) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    WorkCell cell{7, 1, 2, 3, CellStatus::IN_USE, 1};
    ClaimedTask task;
    task.task_id = 11;
    task.cell_id = 7;
    task.row.row_id = 5;
    task.row.content = "fine";

    EXPECT_CALL(*mock, ClaimEligibleCell(_, false)).WillOnce(Return(cell));
    EXPECT_CALL(*mock, GetModel(1)).WillOnce(Return(Model{1, "llama3", "ollama"}));
    EXPECT_CALL(*mock, GetPrompt(2)).WillOnce(Return(Prompt{2, "{text}"}));
    EXPECT_CALL(*mock, ClaimTaskBatch(7, 10))
        .WillOnce(Return(std::vector<ClaimedTask>{task}))
        .WillOnce(Return(std::vector<ClaimedTask>{}));
    EXPECT_CALL(*mock, CompleteTask(_, _)).WillOnce(Return(false));
    EXPECT_CALL(*mock, ReleaseCell(7)).WillOnce(Return(CellStatus::DONE));

    auto loop = MakeLoop(mock);
    EXPECT_TRUE(loop.RunOnce());
    EXPECT_EQ(loop.Stats().claims_lost, 1);
    EXPECT_EQ(loop.Stats().tasks_completed, 0);
}

TEST_F(WorkerLoopTest, StoreFailureMidDrainReleasesAndPropagates) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    WorkCell cell{7, 1, 2, 3, CellStatus::IN_USE, 1};

    EXPECT_CALL(*mock, ClaimEligibleCell(_, _)).WillOnce(Return(cell));
    EXPECT_CALL(*mock, GetModel(1)).WillOnce(Return(Model{1, "llama3", "ollama"}));
    EXPECT_CALL(*mock, GetPrompt(2)).WillOnce(Return(Prompt{2, "{text}"}));
    EXPECT_CALL(*mock, ClaimTaskBatch(7, _)).WillOnce(Throw(std::runtime_error("connection lost")));
    EXPECT_CALL(*mock, ReleaseCell(7)).WillOnce(Return(CellStatus::AVAILABLE));

    auto loop = MakeLoop(mock);
    EXPECT_THROW(loop.RunOnce(), std::runtime_error);
}

TEST_F(WorkerLoopTest, CellHeldByCrashedWorkerDoesNotStarveOthers) {
    // Cell A's only task stays in_progress under a worker that died.
    auto a = SeedCell(*store, 1, "ollama", "-a");
    auto b = SeedCell(*store, 3, "ollama", "-b");
    ASSERT_EQ(store->ClaimEligibleCell({"ollama"}, false)->cell_id, a.cell_id);
    ASSERT_EQ(store->ClaimTaskBatch(a.cell_id, 10).size(), 1u);
    ASSERT_EQ(store->ReleaseCell(a.cell_id), CellStatus::AVAILABLE);

    auto loop = MakeLoop(store);
    EXPECT_TRUE(loop.RunOnce());
    EXPECT_FALSE(loop.RunOnce());

    EXPECT_EQ(store->GetCellProgress(b.cell_id)->done, 3);
    EXPECT_EQ(store->GetCell(b.cell_id)->status, CellStatus::DONE);
    EXPECT_EQ(store->GetCell(a.cell_id)->status, CellStatus::AVAILABLE);
    EXPECT_EQ(store->GetCellProgress(a.cell_id)->in_progress, 1);
    EXPECT_EQ(predictor->Calls(), 3);

    // An exit_when_idle worker terminates instead of re-claiming cell A.
    std::atomic<bool> stop{false};
    auto runner = std::async(std::launch::async, [&]() { MakeLoop(store).Run(&stop); });
    auto status = runner.wait_for(5s);
    stop = true;
    EXPECT_EQ(status, std::future_status::ready);
}

TEST_F(WorkerLoopTest, CellThatYieldsNoTaskCountsAsIdle) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    WorkCell cell{7, 1, 2, 3, CellStatus::IN_USE, 1};

    EXPECT_CALL(*mock, ClaimEligibleCell(_, _)).WillOnce(Return(cell));
    EXPECT_CALL(*mock, GetModel(1)).WillOnce(Return(Model{1, "llama3", "ollama"}));
    EXPECT_CALL(*mock, GetPrompt(2)).WillOnce(Return(Prompt{2, "{text}"}));
    EXPECT_CALL(*mock, ClaimTaskBatch(7, _)).WillOnce(Return(std::vector<ClaimedTask>{}));
    EXPECT_CALL(*mock, ReleaseCell(7)).WillOnce(Return(CellStatus::AVAILABLE));

    auto loop = MakeLoop(mock);
    EXPECT_FALSE(loop.RunOnce());
}

TEST_F(WorkerLoopTest, RunOutlivesStoreFailure) {
    auto mock = std::make_shared<NiceMock<MockStore>>();
    EXPECT_CALL(*mock, ClaimEligibleCell(_, _)).WillOnce(Throw(std::runtime_error("connection refused")));

    auto loop = MakeLoop(mock);
    std::atomic<bool> stop{false};
    EXPECT_NO_THROW(loop.Run(&stop));
    EXPECT_EQ(loop.Stats().cells_processed, 0);
}

TEST_F(WorkerLoopTest, CapacityRejectionIsRequeued) {
    for (int i = 0; i < 200 && InFlightPredicts() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    auto s = SeedCell(*store, 3);
    size_t previous = MaxInFlightPredicts();
    SetMaxInFlightPredicts(2);
    predictor->SetDelay(200ms);
    auto loop = MakeLoop(store);

    bool worked = loop.RunOnce();
    SetMaxInFlightPredicts(previous);
    ASSERT_TRUE(worked);

    EXPECT_EQ(store->GetCellProgress(s.cell_id)->done, 3);
    EXPECT_EQ(loop.Stats().tasks_requeued, 1);
    EXPECT_EQ(predictor->Calls(), 3);
}

} // namespace
