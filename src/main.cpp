#include "genoflow/common/errors.hpp"
#include "genoflow/common/log.hpp"
#include "genoflow/critic/consistency_checker.hpp"
#include "genoflow/execution/thread_pool_executor.hpp"
#include "genoflow/io/plan_io.hpp"
#include "genoflow/io/run_config.hpp"
#include "genoflow/plan/plan_compiler.hpp"
#include "genoflow/plan/plan_diagnostics.hpp"
#include "genoflow/tasks/simulated_tasks.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace
{

struct CliOptions
{
    std::string config_path;
    std::string vcf;
    std::string output_dir;
    std::string sample;
    std::string phenotype;
    std::string analysis_type;
    bool plan_only{false};
    size_t threads{1};
    std::string log_level;
    std::string execute_plan;
    std::string resume;
};

void print_plan_error(const genoflow::PlanError& e)
{
    std::cerr << "\nPlan error [" << genoflow::to_string(e.code()) << "]:\n" << e.what() << "\n";
    if (const auto& diags = e.diagnostics())
    {
        for (const auto& item : diags->warnings())
        {
            std::cerr << "  warning: " << item.message << "\n";
        }
    }
    std::cerr << std::flush;
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{"genoflow: task orchestration for genomic variant analysis"};

    CliOptions opts;
    app.add_option("--config", opts.config_path, "Run configuration (YAML)")
        ->check(CLI::ExistingFile);
    auto vcf_opt = app.add_option("--vcf", opts.vcf, "Input VCF file");
    auto output_opt = app.add_option("--output", opts.output_dir, "Output directory");
    auto sample_opt = app.add_option("--sample", opts.sample, "Sample name");
    auto phenotype_opt = app.add_option("--phenotype", opts.phenotype, "Phenotype description");
    auto type_opt = app.add_option("--analysis-type", opts.analysis_type, "Plan template to compile");
    app.add_flag("--plan-only", opts.plan_only, "Compile and store the plan without running it");
    auto threads_opt = app.add_option("--threads", opts.threads,
                                      "Worker threads (0 = hardware concurrency)");
    auto level_opt = app.add_option("--log-level", opts.log_level,
                                    "trace | debug | info | warn | error | critical | off");
    auto execute_opt = app.add_option("--execute-plan", opts.execute_plan,
                                      "Execute a stored plan instead of compiling one")
                           ->check(CLI::ExistingFile);
    app.add_option("--resume", opts.resume, "Results of an earlier run of the same plan")
        ->check(CLI::ExistingFile)
        ->needs(execute_opt);
    execute_opt->excludes(vcf_opt)->excludes(type_opt)->excludes("--plan-only");

    CLI11_PARSE(app, argc, argv);

    try
    {
        genoflow::AppConfig cfg;
        if (!opts.config_path.empty())
        {
            cfg = genoflow::load_run_config(opts.config_path);
        }

        genoflow::RunParameters& params = cfg.run_parameters;
        if (vcf_opt->count()) params.input_vcf = opts.vcf;
        if (output_opt->count()) params.output_dir = opts.output_dir;
        if (sample_opt->count()) params.sample_name = opts.sample;
        if (phenotype_opt->count()) params.phenotype = opts.phenotype;
        if (type_opt->count()) params.analysis_type = opts.analysis_type;
        if (threads_opt->count()) cfg.threads = opts.threads;
        if (level_opt->count())
        {
            auto level = genoflow::parse_log_level(opts.log_level);
            if (!level)
            {
                std::cerr << "Unknown log level '" << opts.log_level << "'\n";
                return EXIT_FAILURE;
            }
            cfg.log_level = *level;
        }

        if (!opts.execute_plan.empty() && params.output_dir.empty())
        {
            params.output_dir = fs::path(opts.execute_plan).parent_path().string();
            if (params.output_dir.empty())
            {
                params.output_dir = ".";
            }
        }
        if (params.output_dir.empty())
        {
            std::cerr << "An output directory is required (--output)\n";
            return EXIT_FAILURE;
        }

        const fs::path out_dir{params.output_dir};
        auto logger = genoflow::make_logger("genoflow", cfg.log_level,
                                            (out_dir / "pipeline.log").string());

        auto registry = std::make_shared<genoflow::TaskRegistry>();
        genoflow::register_simulated_tasks(*registry);

        std::shared_ptr<const genoflow::Plan> plan;
        if (!opts.execute_plan.empty())
        {
            SPDLOG_LOGGER_INFO(logger, "Loading plan from {}", opts.execute_plan);
            plan = std::make_shared<const genoflow::Plan>(
                genoflow::load_plan_file(opts.execute_plan));
        }
        else
        {
            genoflow::PlanCompiler compiler{registry, logger};
            plan = std::make_shared<const genoflow::Plan>(compiler.compile(params));
            const std::string plan_path = (out_dir / "plan.yaml").string();
            genoflow::store_plan_file(*plan, plan_path);
            SPDLOG_LOGGER_INFO(logger, "Plan with {} task(s) written to {}",
                               plan->task_count(), plan_path);
            if (opts.plan_only)
            {
                return EXIT_SUCCESS;
            }
        }

        std::vector<genoflow::TaskResult> prior;
        if (!opts.resume.empty())
        {
            prior = genoflow::load_results_file(opts.resume);
            SPDLOG_LOGGER_INFO(logger, "Loaded {} prior result(s) from {}", prior.size(), opts.resume);
        }

        genoflow::ExecutorConfig exec_config = cfg.executor_config();
        exec_config.results_path = (out_dir / "results.yaml").string();
        exec_config.logger = logger;

        auto executor = genoflow::make_executor(registry, exec_config);
        genoflow::RunOutcome outcome = executor->run(plan, prior);

        std::cout << outcome.status_table() << "\n" << outcome.summary() << "\n";
        if (!outcome.journal_error.empty())
        {
            std::cerr << "Result journal not written: " << outcome.journal_error << "\n";
        }

        genoflow::ConsistencyChecker checker{registry, logger, cfg.critic};
        genoflow::FindingsReport findings = checker.check(*plan, outcome.results);
        genoflow::store_findings_file(findings, (out_dir / "findings.yaml").string());
        std::cout << "Consistency check: " << findings.summary() << "\n" << std::flush;

        return outcome.status == genoflow::RunStatus::AllSucceeded ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const genoflow::PlanError& e)
    {
        print_plan_error(e);
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
}
