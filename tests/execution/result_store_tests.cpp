#include <gtest/gtest.h>
#include "genoflow/execution/result_store.hpp"
#include "test_helpers.hpp"
#include <thread>

using namespace genoflow;
using namespace genoflow_test;

class ResultStoreTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_plan = make_plan({make_task("A"), make_task("B", {"A"})});
    }

    std::shared_ptr<const Plan> m_plan;
};

TEST_F(ResultStoreTests, Construct_AllPendingWithPlanIds)
{
    ResultStore store{*m_plan};
    ASSERT_EQ(store.size(), 2u);
    auto all = store.snapshot_all();
    EXPECT_EQ(all[0].task_id, "A");
    EXPECT_EQ(all[1].task_id, "B");
    EXPECT_EQ(all[0].status, TaskStatus::Pending);
    EXPECT_EQ(all[0].attempt, 1);
    EXPECT_EQ(store.index_of("B"), std::optional<TaskIdx>{1});
    EXPECT_FALSE(store.index_of("Z").has_value());
}

TEST_F(ResultStoreTests, Transitions_PendingRunningSucceeded)
{
    ResultStore store{*m_plan};
    auto t = now_timestamp();
    EXPECT_FALSE(store.mark_succeeded(0, {}, t));
    EXPECT_TRUE(store.mark_running(0, t));
    EXPECT_FALSE(store.mark_running(0, t));
    EXPECT_TRUE(store.mark_succeeded(0, {{"k", 1}}, t));

    auto result = store.snapshot(0);
    EXPECT_EQ(result.status, TaskStatus::Succeeded);
    EXPECT_EQ(result.outputs.at("k"), Value{1});
    EXPECT_TRUE(result.started_at.has_value());
    EXPECT_TRUE(result.finished_at.has_value());
}

TEST_F(ResultStoreTests, Transitions_TerminalStatusIsFinal)
{
    ResultStore store{*m_plan};
    auto t = now_timestamp();
    EXPECT_TRUE(store.mark_skipped(1, "A", t));
    EXPECT_FALSE(store.mark_running(1, t));
    EXPECT_FALSE(store.mark_failed(1, TaskFailure{"x", "y"}, t));
    EXPECT_FALSE(store.mark_skipped(1, "again", t));
    EXPECT_EQ(store.snapshot(1).skip_reason, "A");
}

TEST_F(ResultStoreTests, MarkFailed_FromPending_SetsStartTime)
{
    ResultStore store{*m_plan};
    auto t = now_timestamp();
    EXPECT_TRUE(store.mark_failed(0, TaskFailure{"MissingOutputKey", "no key"}, t));
    auto result = store.snapshot(0);
    EXPECT_EQ(result.status, TaskStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, "MissingOutputKey");
    EXPECT_EQ(result.started_at, result.finished_at);
}

TEST_F(ResultStoreTests, LookupOutput_ReportsStatusAndValue)
{
    ResultStore store{*m_plan};
    auto t = now_timestamp();

    auto unknown = store.lookup_output("Z", "k");
    EXPECT_FALSE(unknown.known_task);

    auto pending = store.lookup_output("A", "k");
    EXPECT_TRUE(pending.known_task);
    EXPECT_EQ(pending.status, TaskStatus::Pending);
    EXPECT_FALSE(pending.value.has_value());

    ASSERT_TRUE(store.mark_running(0, t));
    ASSERT_TRUE(store.mark_succeeded(0, {{"k", "v"}}, t));
    auto found = store.lookup_output("A", "k");
    ASSERT_TRUE(found.value.has_value());
    EXPECT_EQ(*found.value, Value{"v"});
    EXPECT_FALSE(store.lookup_output("A", "other").value.has_value());
}

TEST_F(ResultStoreTests, Restore_SucceededReusedOtherwiseNextAttempt)
{
    ResultStore store{*m_plan};

    TaskResult done;
    done.task_id = "A";
    done.status = TaskStatus::Succeeded;
    done.outputs = {{"k", 7}};
    done.attempt = 2;
    store.restore(0, done);

    TaskResult failed;
    failed.task_id = "B";
    failed.status = TaskStatus::Failed;
    failed.error = TaskFailure{"boom", "exploded"};
    failed.attempt = 2;
    store.restore(1, failed);

    EXPECT_EQ(store.snapshot(0), done);
    auto retry = store.snapshot(1);
    EXPECT_EQ(retry.status, TaskStatus::Pending);
    EXPECT_EQ(retry.attempt, 3);
    EXPECT_FALSE(retry.error.has_value());
}

TEST_F(ResultStoreTests, Snapshot_BadIndex_Throws)
{
    ResultStore store{*m_plan};
    EXPECT_THROW((void)store.snapshot(TaskIdx{9}), std::out_of_range);
}

TEST_F(ResultStoreTests, ConcurrentWriters_DistinctTasksAllRecorded)
{
    std::vector<TaskSpec> tasks;
    for (int i = 0; i < 64; ++i)
    {
        tasks.push_back(make_task("T" + std::to_string(i)));
    }
    auto plan = make_plan(tasks);
    ResultStore store{*plan};

    std::vector<std::thread> threads;
    for (int w = 0; w < 4; ++w)
    {
        threads.emplace_back([&store, w] {
            for (TaskIdx i = static_cast<TaskIdx>(w); i < store.size(); i += 4)
            {
                auto t = now_timestamp();
                EXPECT_TRUE(store.mark_running(i, t));
                EXPECT_TRUE(store.mark_succeeded(i, {{"index", static_cast<std::int64_t>(i)}}, t));
            }
        });
    }
    for (auto& th : threads)
    {
        th.join();
    }

    for (TaskIdx i = 0; i < store.size(); ++i)
    {
        auto result = store.snapshot(i);
        EXPECT_EQ(result.status, TaskStatus::Succeeded);
        EXPECT_EQ(result.outputs.at("index"), Value{static_cast<std::int64_t>(i)});
    }
}
