#include <gtest/gtest.h>
#include "genoflow/io/plan_io.hpp"
#include "genoflow/plan/plan_compiler.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <limits>

using namespace genoflow;
using namespace genoflow_test;

// =============================================================================
// Test Fixture
// =============================================================================

class PlanIoTests : public ::testing::Test
{
protected:
    static Plan sample_plan()
    {
        Plan plan;
        plan.created_at = "2026-10-17T09:30:00.125Z";
        plan.run_parameters = {
            {"sample_name", "NA12878"},
            {"min_quality", 30.0},
            {"window_size", 2000},
        };
        plan.tasks = {
            make_task("filter", {}, {
                {"vcf_file", "in.vcf"},
                {"types", Value::List{"missense_variant", "stop_gained"}},
                {"max_pop_freq", 0.01},
                {"mock", false},
                {"note", nullptr},
                {"reference", ArtifactLocator{"file:///ref/hg38.fa"}},
            }),
            make_task("score", {"filter"}, {
                {"ids", output_ref("filter", "variant_ids")},
                {"nested", Value::Map{{"list", Value::List{1, 2.5, output_ref("filter", "count")}}}},
                {"numeric_text", "123"},
                {"bool_text", "true"},
                {"empty", ""},
            }),
        };
        return plan;
    }
};

// =============================================================================
// Plans
// =============================================================================

TEST_F(PlanIoTests, Plan_RoundTripIsExact)
{
    Plan plan = sample_plan();
    Plan loaded = load_plan(store_plan(plan));
    EXPECT_EQ(loaded, plan);
}

TEST_F(PlanIoTests, Plan_CompiledPlanRoundTrips)
{
    RunParameters params;
    params.input_vcf = "data/in.vcf";
    params.output_dir = "out";
    params.phenotype = "epilepsy";
    Plan plan = PlanCompiler{}.compile(params);

    EXPECT_EQ(load_plan(store_plan(plan)), plan);
}

TEST_F(PlanIoTests, Plan_StoredForm_QuotesStringsAndTagsArtifacts)
{
    std::string text = store_plan(sample_plan());
    EXPECT_NE(text.find("format_version: 1"), std::string::npos);
    EXPECT_NE(text.find("\"in.vcf\""), std::string::npos);
    EXPECT_NE(text.find("!artifact \"file:///ref/hg38.fa\""), std::string::npos);
    EXPECT_NE(text.find("\"${output.filter.variant_ids}\""), std::string::npos);
    EXPECT_NE(text.find("min_quality: 30.0"), std::string::npos);
    EXPECT_NE(text.find("window_size: 2000"), std::string::npos);
}

TEST_F(PlanIoTests, Plan_DoublesKeepFullPrecision)
{
    Plan plan;
    plan.run_parameters = {
        {"third", 1.0 / 3.0},
        {"tiny", 1e-300},
        {"big", 1e20},
        {"inf", std::numeric_limits<double>::infinity()},
    };
    Plan loaded = load_plan(store_plan(plan));
    EXPECT_EQ(loaded.run_parameters, plan.run_parameters);
}

TEST_F(PlanIoTests, Plan_NaNSurvives)
{
    Plan plan;
    plan.run_parameters = {{"nan", std::numeric_limits<double>::quiet_NaN()}};
    Plan loaded = load_plan(store_plan(plan));
    const Value& v = loaded.run_parameters.at("nan");
    ASSERT_EQ(v.kind(), ValueKind::Double);
    EXPECT_TRUE(std::isnan(v.as<double>()));
}

TEST_F(PlanIoTests, Plan_HandWrittenPlainScalarsAreInferred)
{
    const std::string text = R"(
format_version: 1
tasks:
  - id: a
    type: t
    config:
      count: 12
      ratio: 0.5
      flag: yes_not_a_bool
      enabled: true
      missing: ~
      name: plain text
      ref: "${output.b.k}"
    depends_on: [b]
  - id: b
    type: t
)";
    Plan plan = load_plan(text);
    ASSERT_EQ(plan.task_count(), 2u);
    const auto& config = plan.tasks[0].config;
    EXPECT_EQ(config.at("count"), Value{12});
    EXPECT_EQ(config.at("ratio"), Value{0.5});
    EXPECT_EQ(config.at("flag"), Value{"yes_not_a_bool"});
    EXPECT_EQ(config.at("enabled"), Value{true});
    EXPECT_TRUE(config.at("missing").is_null());
    EXPECT_EQ(config.at("name"), Value{"plain text"});
    EXPECT_EQ(config.at("ref"), output_ref("b", "k"));
    EXPECT_TRUE(plan.tasks[1].config.empty());
    EXPECT_TRUE(plan.tasks[1].depends_on.empty());
}

TEST_F(PlanIoTests, Plan_UnsupportedVersion_Throws)
{
    EXPECT_THROW(load_plan("format_version: 2\ntasks: []\n"), PersistenceError);
}

TEST_F(PlanIoTests, Plan_Malformed_Throws)
{
    EXPECT_THROW(load_plan("format_version: 1\ntasks: [\n"), PersistenceError);
    EXPECT_THROW(load_plan("- just\n- a list\n"), PersistenceError);
    EXPECT_THROW(load_plan("format_version: 1\ntasks:\n  - type: t\n"), PersistenceError);
    EXPECT_THROW(load_plan("format_version: 1\ntasks: {}\n"), PersistenceError);
}

TEST_F(PlanIoTests, Plan_MalformedReferenceText_PlanError)
{
    const std::string text =
        "format_version: 1\n"
        "tasks:\n"
        "  - id: a\n"
        "    type: t\n"
        "    config: {x: \"dir/${output.b.k}\"}\n";
    try
    {
        load_plan(text);
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::InvalidConfiguration);
    }
}

// =============================================================================
// Results
// =============================================================================

TEST_F(PlanIoTests, Results_RoundTripIsExact)
{
    auto t = now_timestamp();

    TaskResult ok;
    ok.task_id = "filter";
    ok.status = TaskStatus::Succeeded;
    ok.outputs = {
        {"variant_ids", Value::List{"chr1:100:A>G"}},
        {"filtered_vcf", ArtifactLocator{"out/filtered.vcf"}},
        {"literal_ref_text", "${output.x.y}"},
    };
    ok.started_at = t;
    ok.finished_at = t + std::chrono::milliseconds(250);

    TaskResult failed;
    failed.task_id = "score";
    failed.status = TaskStatus::Failed;
    failed.error = TaskFailure{"timeout", "Embedding server: \"503\"\nretry later"};
    failed.attempt = 3;
    failed.started_at = t;
    failed.finished_at = t;

    TaskResult skipped;
    skipped.task_id = "report";
    skipped.status = TaskStatus::Skipped;
    skipped.skip_reason = "score";
    skipped.finished_at = t;

    TaskResult pending;
    pending.task_id = "later";

    std::vector<TaskResult> results{ok, failed, skipped, pending};
    auto loaded = load_results(store_results(results));
    EXPECT_EQ(loaded, results);
}

TEST_F(PlanIoTests, Results_UnknownStatus_Throws)
{
    const std::string text =
        "format_version: 1\n"
        "results:\n"
        "  - task_id: a\n"
        "    status: Exploded\n";
    EXPECT_THROW(load_results(text), PersistenceError);
}

// =============================================================================
// Findings
// =============================================================================

TEST_F(PlanIoTests, Findings_RoundTripAndSummary)
{
    FindingsReport report;
    report.add(Finding{Severity::Error, FindingCategory::ReferentialIntegrity,
                       {"C", "E"}, {"score"}, "Missing output 'score'"});
    report.add(Finding{Severity::Info, FindingCategory::Coverage, {}, {}, "ok"});

    std::string text = store_findings(report);
    EXPECT_NE(text.find("errors: 1"), std::string::npos);
    EXPECT_NE(text.find("info: 1"), std::string::npos);
    EXPECT_EQ(load_findings(text), report);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(PlanIoTests, Files_WriteCreatesParentsAndReadsBack)
{
    ScratchDir dir{"plan_io"};
    Plan plan = sample_plan();
    const std::string path = dir.file("a/b/plan.yaml");

    store_plan_file(plan, path);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
    EXPECT_EQ(load_plan_file(path), plan);
}

TEST_F(PlanIoTests, Files_MissingFile_Throws)
{
    ScratchDir dir{"plan_io_missing"};
    EXPECT_THROW(read_text_file(dir.file("absent.yaml")), PersistenceError);
}
