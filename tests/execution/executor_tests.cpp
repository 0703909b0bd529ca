#include <gtest/gtest.h>
#include "genoflow/execution/executable_graph.hpp"
#include "genoflow/execution/single_threaded_executor.hpp"
#include "genoflow/execution/thread_pool_executor.hpp"
#include "genoflow/io/plan_io.hpp"
#include "test_helpers.hpp"
#include <random>

using namespace genoflow;
using namespace genoflow_test;

// =============================================================================
// Test Fixture
// =============================================================================

class ExecutorTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_registry = std::make_shared<TaskRegistry>();
        m_log = std::make_shared<InvocationLog>();
    }

    std::shared_ptr<RecordingTask> add(const std::string& type, RecordingBehavior behavior = {})
    {
        return add_recording_task(*m_registry, m_log, type, std::move(behavior));
    }

    std::shared_ptr<Executor> single(ExecutorConfig config = {})
    {
        config.thread_count = 1;
        return make_executor(m_registry, std::move(config));
    }

    std::shared_ptr<Executor> pool(size_t threads, ExecutorConfig config = {})
    {
        config.thread_count = threads;
        return make_executor(m_registry, std::move(config));
    }

    static const TaskResult& result(const RunOutcome& outcome, const std::string& id)
    {
        const TaskResult* r = outcome.find(id);
        if (!r)
        {
            throw std::runtime_error("no result for " + id);
        }
        return *r;
    }

    std::shared_ptr<TaskRegistry> m_registry;
    std::shared_ptr<InvocationLog> m_log;
};

// =============================================================================
// ExecutableGraph
// =============================================================================

TEST_F(ExecutorTests, ExecutableGraph_InitialReadyTasks)
{
    add("A");
    add("B");
    add("C");
    auto plan = make_plan({make_task("A"), make_task("B", {"A"}), make_task("C")});
    auto graph = build_executable_graph(plan, m_registry.get());

    EXPECT_EQ(graph->task_count(), 3u);
    EXPECT_EQ(graph->get_initial_ready_tasks(), (std::vector<TaskIdx>{0, 2}));
    EXPECT_EQ(graph->topological_order, (std::vector<TaskIdx>{0, 1, 2}));
    EXPECT_EQ(graph->predecessor_counts, (std::vector<size_t>{0, 1, 0}));
}

TEST_F(ExecutorTests, ExecutableGraph_InvalidPlan_Throws)
{
    auto plan = make_plan({make_task("A", {"B"}), make_task("B", {"A"})});
    EXPECT_THROW(build_executable_graph(plan, nullptr), PlanError);
}

// =============================================================================
// Single-threaded execution
// =============================================================================

TEST_F(ExecutorTests, SingleThreaded_AllSucceed_OutputsAndResolvedConfig)
{
    add("A", outputs({{"ids", Value::List{"v1", "v2"}}}));
    auto b = add("B", outputs({{"score", 0.5}}));
    auto plan = make_plan({
        make_task("A"),
        make_task("B", {"A"}, {{"ids", output_ref("A", "ids")}, {"fixed", 3}}),
    });

    auto outcome = single()->run(plan);

    EXPECT_EQ(outcome.status, RunStatus::AllSucceeded);
    EXPECT_TRUE(outcome.success());
    EXPECT_FALSE(outcome.stopped);
    EXPECT_EQ(outcome.count(TaskStatus::Succeeded), 2u);
    EXPECT_EQ(result(outcome, "B").outputs, (Value::Map{{"score", 0.5}}));
    EXPECT_EQ(b->last_config(),
              (Value::Map{{"ids", Value::List{"v1", "v2"}}, {"fixed", 3}}));
}

TEST_F(ExecutorTests, SingleThreaded_InvokesInTopologicalOrder)
{
    for (const char* id : {"A", "B", "C", "D", "E"})
    {
        add(id);
    }
    // Declared out of dependency order
    auto plan = make_plan({
        make_task("D", {"B", "C"}),
        make_task("B", {"A"}),
        make_task("E"),
        make_task("C", {"A"}),
        make_task("A"),
    });

    auto outcome = single()->run(plan);
    ASSERT_EQ(outcome.status, RunStatus::AllSucceeded);
    EXPECT_EQ(m_log->order(), (std::vector<std::string>{"E", "A", "B", "C", "D"}));
}

TEST_F(ExecutorTests, SingleThreaded_RepeatedRuns_SameOrder)
{
    for (const char* id : {"A", "B", "C", "D"})
    {
        add(id);
    }
    auto plan = make_plan({make_task("A"), make_task("B"), make_task("C", {"A"}), make_task("D", {"B"})});

    single()->run(plan);
    auto first = m_log->order();
    m_log = std::make_shared<InvocationLog>();
    m_registry = std::make_shared<TaskRegistry>();
    for (const char* id : {"A", "B", "C", "D"})
    {
        add(id);
    }
    single()->run(plan);
    EXPECT_EQ(m_log->order(), first);
}

TEST_F(ExecutorTests, SingleThreaded_FailureSkipsDependentsOnly)
{
    // A -> B -> D, A -> C; B fails
    add("A");
    add("B", failing("scoring_error"));
    add("C");
    add("D");
    auto plan = make_plan({
        make_task("A"),
        make_task("B", {"A"}),
        make_task("C", {"A"}),
        make_task("D", {"B"}),
    });

    auto outcome = single()->run(plan);

    EXPECT_EQ(outcome.status, RunStatus::PartiallyFailed);
    EXPECT_EQ(result(outcome, "A").status, TaskStatus::Succeeded);
    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Failed);
    EXPECT_EQ(result(outcome, "C").status, TaskStatus::Succeeded);
    EXPECT_EQ(result(outcome, "D").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "D").skip_reason, "B");

    const auto& error = result(outcome, "B").error;
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, "scoring_error");
    EXPECT_EQ(error->message, "B failed on purpose");
    EXPECT_EQ(m_log->count("D"), 0u);
}

TEST_F(ExecutorTests, SingleThreaded_SkipPropagatesTransitively)
{
    add("A", failing());
    add("B");
    add("C");
    auto plan = make_plan({make_task("A"), make_task("B", {"A"}), make_task("C", {"B"})});

    auto outcome = single()->run(plan);

    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "C").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "C").skip_reason, "A");
    EXPECT_EQ(m_log->order(), std::vector<std::string>{"A"});
}

TEST_F(ExecutorTests, SingleThreaded_NonTaskErrorExceptions_Captured)
{
    m_registry->register_function("std", [](const Value::Map&, RunContext&) -> Value::Map {
        throw std::runtime_error("disk full");
    });
    m_registry->register_function("odd", [](const Value::Map&, RunContext&) -> Value::Map {
        throw 42;
    });
    auto plan = make_plan({make_task("S", {}, {}, "std"), make_task("O", {}, {}, "odd")});

    auto outcome = single()->run(plan);

    ASSERT_TRUE(result(outcome, "S").error.has_value());
    EXPECT_EQ(result(outcome, "S").error->kind, "exception");
    EXPECT_EQ(result(outcome, "S").error->message, "disk full");
    ASSERT_TRUE(result(outcome, "O").error.has_value());
    EXPECT_EQ(result(outcome, "O").error->kind, "unknown");
}

TEST_F(ExecutorTests, SingleThreaded_MissingOutputKey_FailsConsumer)
{
    add("A", outputs({{"present", 1}}));
    add("B");
    add("C");
    auto plan = make_plan({
        make_task("A"),
        make_task("B", {"A"}, {{"x", output_ref("A", "absent")}}),
        make_task("C", {"B"}),
    });

    auto outcome = single()->run(plan);

    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Failed);
    ASSERT_TRUE(result(outcome, "B").error.has_value());
    EXPECT_EQ(result(outcome, "B").error->kind, "MissingOutputKey");
    EXPECT_EQ(result(outcome, "C").status, TaskStatus::Skipped);
    EXPECT_EQ(m_log->count("B"), 0u);
}

TEST_F(ExecutorTests, SingleThreaded_HaltOnError_SkipsEverythingNotStarted)
{
    add("A", failing());
    add("B");
    add("C");
    auto plan = make_plan({make_task("A"), make_task("B"), make_task("C")});

    ExecutorConfig config;
    config.halt_on_error = true;
    auto outcome = single(config)->run(plan);

    EXPECT_EQ(outcome.status, RunStatus::HaltedOnError);
    EXPECT_TRUE(outcome.stopped);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "B").skip_reason, "run halted");
    EXPECT_EQ(m_log->order(), std::vector<std::string>{"A"});
}

TEST_F(ExecutorTests, SingleThreaded_RequestStopFromTask_HaltsRun)
{
    std::weak_ptr<Executor> weak;
    m_registry->register_function("stopper", [&weak](const Value::Map&, RunContext&) {
        if (auto exec = weak.lock())
        {
            exec->request_stop();
        }
        return Value::Map{{"done", true}};
    });
    add("B");
    auto plan = make_plan({make_task("A", {}, {}, "stopper"), make_task("B", {"A"})});

    auto executor = single();
    weak = executor;
    auto outcome = executor->run(plan);

    EXPECT_TRUE(executor->stop_requested());
    EXPECT_EQ(outcome.status, RunStatus::HaltedOnError);
    EXPECT_EQ(result(outcome, "A").status, TaskStatus::Succeeded);
    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "B").skip_reason, "run halted");
}

TEST_F(ExecutorTests, SingleThreaded_Timeout_SkipsNotYetRunning)
{
    add("A", delayed(std::chrono::milliseconds(100), {{"v", 1}}));
    add("B");
    add("C");
    auto plan = make_plan({make_task("A"), make_task("B"), make_task("C", {"A"})});

    ExecutorConfig config;
    config.run_timeout = std::chrono::milliseconds(20);
    auto outcome = single(config)->run(plan);

    EXPECT_EQ(outcome.status, RunStatus::HaltedOnError);
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(result(outcome, "A").status, TaskStatus::Succeeded);
    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "B").skip_reason, "run timeout");
    EXPECT_EQ(result(outcome, "C").skip_reason, "run timeout");
}

TEST_F(ExecutorTests, SingleThreaded_InvalidPlan_ThrowsBeforeAnyTask)
{
    add("A");
    add("B");
    auto plan = make_plan({make_task("A", {"B"}), make_task("B", {"A"})});
    try
    {
        single()->run(plan);
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::CyclicDependency);
    }
    EXPECT_TRUE(m_log->order().empty());
}

TEST_F(ExecutorTests, SingleThreaded_EmptyPlan_AllSucceeded)
{
    auto outcome = single()->run(make_plan({}));
    EXPECT_EQ(outcome.status, RunStatus::AllSucceeded);
    EXPECT_TRUE(outcome.results.empty());
}

// =============================================================================
// Resume
// =============================================================================

TEST_F(ExecutorTests, Resume_ReusesSucceededOutputsVerbatim)
{
    add("A");
    add("B");
    auto c = add("C", outputs({{"c", 3}}));
    add("D");
    auto plan = make_plan({
        make_task("A"),
        make_task("B", {"A"}),
        make_task("C", {"B"}, {{"from_b", output_ref("B", "b")}}),
        make_task("D", {"C"}),
    });

    TaskResult a;
    a.task_id = "A";
    a.status = TaskStatus::Succeeded;
    a.outputs = {{"a", 1}};
    TaskResult b;
    b.task_id = "B";
    b.status = TaskStatus::Succeeded;
    b.outputs = {{"b", ArtifactLocator{"file:///tmp/b.tsv"}}};
    TaskResult stale;
    stale.task_id = "no_longer_in_plan";
    stale.status = TaskStatus::Succeeded;

    auto outcome = single()->run(plan, {a, b, stale});

    EXPECT_EQ(outcome.status, RunStatus::AllSucceeded);
    EXPECT_EQ(m_log->order(), (std::vector<std::string>{"C", "D"}));
    EXPECT_EQ(result(outcome, "A"), a);
    EXPECT_EQ(result(outcome, "B"), b);
    EXPECT_EQ(c->last_config().at("from_b"), Value{ArtifactLocator{"file:///tmp/b.tsv"}});
    EXPECT_EQ(outcome.results.size(), 4u);
}

TEST_F(ExecutorTests, Resume_FailedTaskRunsAgainWithNextAttempt)
{
    add("A");
    add("B");
    auto plan = make_plan({make_task("A"), make_task("B", {"A"})});

    TaskResult a;
    a.task_id = "A";
    a.status = TaskStatus::Succeeded;
    TaskResult b;
    b.task_id = "B";
    b.status = TaskStatus::Failed;
    b.error = TaskFailure{"timeout", "server did not answer"};
    b.attempt = 1;

    auto outcome = single()->run(plan, {a, b});

    EXPECT_EQ(m_log->order(), std::vector<std::string>{"B"});
    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Succeeded);
    EXPECT_EQ(result(outcome, "B").attempt, 2);
    EXPECT_FALSE(result(outcome, "B").error.has_value());
}

// =============================================================================
// Result journal
// =============================================================================

TEST_F(ExecutorTests, Journal_WrittenWithFinalResults)
{
    ScratchDir dir{"journal"};
    add("A", outputs({{"k", "v"}}));
    add("B", failing());
    auto plan = make_plan({make_task("A"), make_task("B", {"A"})});

    ExecutorConfig config;
    config.results_path = dir.file("nested/results.yaml");
    auto outcome = single(config)->run(plan);

    EXPECT_TRUE(outcome.journal_error.empty());
    auto stored = load_results_file(config.results_path);
    EXPECT_EQ(stored, outcome.results);
}

// =============================================================================
// Thread pool
// =============================================================================

TEST_F(ExecutorTests, ThreadPool_FactorySelectsByThreadCount)
{
    EXPECT_NE(std::dynamic_pointer_cast<SingleThreadedExecutor>(single()), nullptr);
    auto p = std::dynamic_pointer_cast<ThreadPoolExecutor>(pool(3));
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->worker_count(), 3u);
    auto hw = std::dynamic_pointer_cast<ThreadPoolExecutor>(pool(0));
    ASSERT_NE(hw, nullptr);
    EXPECT_GE(hw->worker_count(), 1u);
}

TEST_F(ExecutorTests, ThreadPool_FailureSkipsDependentsOnly)
{
    add("A");
    add("B", failing());
    add("C", delayed(std::chrono::milliseconds(5)));
    add("D");
    auto plan = make_plan({
        make_task("A"),
        make_task("B", {"A"}),
        make_task("C", {"A"}),
        make_task("D", {"B"}),
    });

    auto outcome = pool(4)->run(plan);

    EXPECT_EQ(outcome.status, RunStatus::PartiallyFailed);
    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Failed);
    EXPECT_EQ(result(outcome, "C").status, TaskStatus::Succeeded);
    EXPECT_EQ(result(outcome, "D").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "D").skip_reason, "B");
}

TEST_F(ExecutorTests, ThreadPool_RandomDelays_OutputsIntactAndDependenciesHonored)
{
    std::mt19937 rng(2024);
    const int task_count = 30;

    std::vector<TaskSpec> tasks;
    std::vector<std::shared_ptr<RecordingTask>> bodies;
    for (int i = 0; i < task_count; ++i)
    {
        std::string id = "T" + std::to_string(i);
        std::vector<std::string> deps;
        Value::Map config;
        for (int d = 0; d < 3 && i > 0; ++d)
        {
            std::string dep = "T" + std::to_string(rng() % i);
            if (std::find(deps.begin(), deps.end(), dep) == deps.end())
            {
                deps.push_back(dep);
                config[dep] = output_ref(dep, "value");
            }
        }
        bodies.push_back(add(id, delayed(std::chrono::milliseconds(rng() % 6),
                                         {{"value", static_cast<std::int64_t>(i)}, {"name", id}})));
        tasks.push_back(make_task(id, deps, config));
    }
    auto plan = make_plan(tasks);

    auto outcome = pool(4)->run(plan);

    ASSERT_EQ(outcome.status, RunStatus::AllSucceeded);
    std::set<std::int64_t> seen;
    for (int i = 0; i < task_count; ++i)
    {
        const auto& r = result(outcome, "T" + std::to_string(i));
        EXPECT_EQ(r.outputs.at("value"), Value{static_cast<std::int64_t>(i)});
        EXPECT_EQ(r.outputs.at("name"), Value{"T" + std::to_string(i)});
        seen.insert(r.outputs.at("value").as<std::int64_t>());

        // Each consumer saw the producer's output, so the producer finished first
        for (const auto& [dep, value] : bodies[i]->last_config())
        {
            EXPECT_EQ(value, Value{static_cast<std::int64_t>(std::stoi(dep.substr(1)))});
        }
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(task_count));

    auto order = m_log->order();
    ASSERT_EQ(order.size(), static_cast<size_t>(task_count));
    for (const auto& task : plan->tasks)
    {
        auto pos = std::find(order.begin(), order.end(), task.id);
        for (const auto& dep : task.depends_on)
        {
            EXPECT_LT(std::find(order.begin(), order.end(), dep), pos);
        }
    }
}

TEST_F(ExecutorTests, ThreadPool_HaltOnError)
{
    add("A", failing());
    add("B", {});
    add("C");
    auto plan = make_plan({make_task("A"), make_task("B", {"A"}), make_task("C", {"B"})});

    ExecutorConfig config;
    config.halt_on_error = true;
    auto outcome = pool(2, config)->run(plan);

    EXPECT_EQ(outcome.status, RunStatus::HaltedOnError);
    EXPECT_EQ(result(outcome, "A").status, TaskStatus::Failed);
    EXPECT_EQ(result(outcome, "C").status, TaskStatus::Skipped);
}

TEST_F(ExecutorTests, ThreadPool_Timeout_RunningTaskFinishes)
{
    add("A", delayed(std::chrono::milliseconds(150), {{"v", 1}}));
    add("B");
    auto plan = make_plan({make_task("A"), make_task("B", {"A"})});

    ExecutorConfig config;
    config.run_timeout = std::chrono::milliseconds(30);
    auto outcome = pool(2, config)->run(plan);

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.status, RunStatus::HaltedOnError);
    EXPECT_EQ(result(outcome, "A").status, TaskStatus::Succeeded);
    EXPECT_EQ(result(outcome, "B").status, TaskStatus::Skipped);
    EXPECT_EQ(result(outcome, "B").skip_reason, "run timeout");
}
