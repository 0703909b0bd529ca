#include <gtest/gtest.h>
#include "genoflow/plan/plan_compiler.hpp"
#include "genoflow/plan/plan_diagnostics.hpp"
#include "genoflow/plan/plan_validator.hpp"
#include "genoflow/tasks/simulated_tasks.hpp"
#include "test_helpers.hpp"

using namespace genoflow;
using namespace genoflow_test;

// =============================================================================
// Test Fixture
// =============================================================================

class PlanCompilerTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto registry = std::make_shared<TaskRegistry>();
        register_simulated_tasks(*registry);
        m_registry = registry;

        m_params.input_vcf = "data/sample.vcf";
        m_params.output_dir = "out";
        m_params.sample_name = "NA12878";
        m_params.phenotype = "cardiomyopathy";
    }

    std::vector<std::string> task_ids(const Plan& plan) const
    {
        std::vector<std::string> ids;
        for (const auto& task : plan.tasks)
        {
            ids.push_back(task.id);
        }
        return ids;
    }

    /// Compile a one-off template registered under "custom".
    Plan compile_custom(std::vector<TaskSpec> tasks)
    {
        PlanCompiler compiler{nullptr};
        compiler.register_template("custom", [tasks](const RunParameters&) { return tasks; });
        RunParameters params = m_params;
        params.analysis_type = "custom";
        return compiler.compile(params);
    }

    std::shared_ptr<const TaskRegistry> m_registry;
    RunParameters m_params;
};

// =============================================================================
// Built-in templates
// =============================================================================

TEST_F(PlanCompilerTests, Compile_VariantAnalysis_SixTasksInPipelineOrder)
{
    PlanCompiler compiler{m_registry};
    Plan plan = compiler.compile(m_params);

    EXPECT_EQ(task_ids(plan), (std::vector<std::string>{
                                  "variant_filter", "sequence_context", "genos_embedding",
                                  "scoring", "evidence_rag", "report_generation"}));
    EXPECT_FALSE(plan.created_at.empty());
    EXPECT_EQ(plan.format_version, k_plan_format_version);
}

TEST_F(PlanCompilerTests, Compile_VariantScreening_StopsAtScoring)
{
    PlanCompiler compiler{m_registry};
    m_params.analysis_type = "variant_screening";
    Plan plan = compiler.compile(m_params);
    EXPECT_EQ(plan.task_count(), 4u);
    EXPECT_EQ(plan.tasks.back().id, "scoring");
}

TEST_F(PlanCompilerTests, Compile_RecordsRunParameters)
{
    PlanCompiler compiler{m_registry};
    Plan plan = compiler.compile(m_params);

    EXPECT_EQ(plan.run_parameters, m_params.to_value());
    const Value* sample = find_key(plan.run_parameters, "sample_name");
    ASSERT_NE(sample, nullptr);
    EXPECT_EQ(*sample, Value{"NA12878"});
}

TEST_F(PlanCompilerTests, Compile_ConfigCarriesTypedReferences)
{
    PlanCompiler compiler{m_registry};
    Plan plan = compiler.compile(m_params);

    const TaskSpec* scoring = plan.find_task("scoring");
    ASSERT_NE(scoring, nullptr);
    const Value* ids = find_key(scoring->config, "variant_ids");
    ASSERT_NE(ids, nullptr);
    EXPECT_EQ(*ids, output_ref("genos_embedding", "variant_ids"));

    const Value* path = find_key(scoring->config, "scores_path");
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(*path, Value{"out/scores.tsv"});
}

TEST_F(PlanCompilerTests, Compile_Twice_EquivalentUpToTimestamp)
{
    PlanCompiler compiler{m_registry};
    Plan a = compiler.compile(m_params);
    Plan b = compiler.compile(m_params);
    EXPECT_TRUE(a.equivalent(b));

    b.created_at = a.created_at;
    EXPECT_EQ(a, b);
}

TEST_F(PlanCompilerTests, Compile_StampsUtcTimestampWithMilliseconds)
{
    Plan plan = PlanCompiler{m_registry}.compile(m_params);
    const std::string& stamp = plan.created_at;

    ASSERT_EQ(stamp.size(), 24u) << stamp;
    EXPECT_EQ(stamp[4], '-');
    EXPECT_EQ(stamp[10], 'T');
    EXPECT_EQ(stamp[19], '.');
    EXPECT_EQ(stamp.back(), 'Z');
    EXPECT_EQ(stamp.substr(0, 2), "20");
    EXPECT_TRUE(std::all_of(stamp.begin() + 20, stamp.begin() + 23,
                            [](char c) { return c >= '0' && c <= '9'; }));
}

TEST_F(PlanCompilerTests, AnalysisTypes_ListsBuiltins)
{
    PlanCompiler compiler;
    EXPECT_EQ(compiler.analysis_types(),
              (std::vector<std::string>{"variant_analysis", "variant_screening"}));
}

// =============================================================================
// Parameter checks
// =============================================================================

TEST_F(PlanCompilerTests, Compile_MissingInput_InvalidConfiguration)
{
    PlanCompiler compiler{m_registry};
    m_params.input_vcf.clear();
    try
    {
        compiler.compile(m_params);
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::InvalidConfiguration);
        EXPECT_NE(std::string(e.what()).find("input_vcf"), std::string::npos);
    }
}

TEST_F(PlanCompilerTests, Compile_UnknownAnalysisType_InvalidConfiguration)
{
    PlanCompiler compiler{m_registry};
    m_params.analysis_type = "structural_variants";
    try
    {
        compiler.compile(m_params);
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::InvalidConfiguration);
    }
}

TEST_F(PlanCompilerTests, Compile_OutOfRangeParameters_InvalidConfiguration)
{
    PlanCompiler compiler{m_registry};

    RunParameters freq = m_params;
    freq.variant_filter.max_population_freq = 1.5;
    EXPECT_THROW(compiler.compile(freq), PlanError);

    RunParameters window = m_params;
    window.sequence_context.window_size = 0;
    EXPECT_THROW(compiler.compile(window), PlanError);

    RunParameters batch = m_params;
    batch.embedding.batch_size = -1;
    EXPECT_THROW(compiler.compile(batch), PlanError);
}

TEST_F(PlanCompilerTests, Compile_UnregisteredTaskType_InvalidConfiguration)
{
    auto partial = std::make_shared<TaskRegistry>();
    partial->register_function("variant_filter",
                               [](const Value::Map&, RunContext&) { return Value::Map{}; });
    PlanCompiler compiler{partial};
    try
    {
        compiler.compile(m_params);
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::InvalidConfiguration);
        ASSERT_NE(e.diagnostics(), nullptr);
        EXPECT_TRUE(e.diagnostics()->has_error(DiagnosticCategory::UnknownTaskType));
    }
}

// =============================================================================
// Structural validation
// =============================================================================

TEST_F(PlanCompilerTests, Compile_UndeclaredDependency_EvenIfProducerPrecedes)
{
    // B precedes D by coincidence, but D only declares A
    std::vector<TaskSpec> tasks{
        make_task("A"),
        make_task("B", {"A"}),
        make_task("D", {"A"}, {{"input", output_ref("B", "score")}}),
    };
    try
    {
        compile_custom(tasks);
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::UndeclaredDependency);
        ASSERT_NE(e.diagnostics(), nullptr);
        ASSERT_EQ(e.diagnostics()->errors().size(), 1u);
        const auto& item = e.diagnostics()->errors().front();
        EXPECT_EQ(item.involved_tasks, (std::vector<std::string>{"D", "B"}));
        EXPECT_EQ(item.output_key, "score");
    }
}

TEST_F(PlanCompilerTests, Compile_UnknownDependency)
{
    try
    {
        compile_custom({make_task("A", {"ghost"})});
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::UnknownDependency);
    }
}

TEST_F(PlanCompilerTests, Compile_Cycle_ReportsOnlyTasksOnCycle)
{
    std::vector<TaskSpec> tasks{
        make_task("A"),
        make_task("B", {"A", "C"}),
        make_task("C", {"B"}),
        make_task("D", {"C"}),
    };
    try
    {
        compile_custom(tasks);
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::CyclicDependency);
        ASSERT_NE(e.diagnostics(), nullptr);
        ASSERT_TRUE(e.diagnostics()->has_error(DiagnosticCategory::Cycle));
        const auto& item = e.diagnostics()->errors().front();
        EXPECT_EQ(item.involved_tasks, (std::vector<std::string>{"B", "C"}));
    }
}

TEST_F(PlanCompilerTests, Compile_DuplicateDependency_IsWarningOnly)
{
    Plan plan = compile_custom({make_task("A"), make_task("B", {"A", "A"})});
    EXPECT_EQ(plan.task_count(), 2u);

    auto diags = diagnose_plan(plan);
    EXPECT_TRUE(diags->is_valid());
    EXPECT_TRUE(diags->has_warnings());
}

TEST_F(PlanCompilerTests, Compile_UnparsedReferenceText_InvalidConfiguration)
{
    try
    {
        compile_custom({make_task("A"), make_task("B", {"A"}, {{"x", "${output.A}"}})});
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::InvalidConfiguration);
        EXPECT_TRUE(e.diagnostics()->has_error(DiagnosticCategory::MalformedReference));
    }
}

TEST_F(PlanCompilerTests, Validate_DuplicateAndEmptyIds)
{
    Plan plan;
    plan.tasks = {make_task("A"), make_task("A"), make_task("", {}, {}, "t")};
    auto diags = diagnose_plan(plan);
    EXPECT_TRUE(diags->has_error(DiagnosticCategory::DuplicateTaskId));
    EXPECT_TRUE(diags->has_error(DiagnosticCategory::EmptyTaskId));
    EXPECT_THROW(validate_plan(plan), PlanError);
}
