#include "buildflow/common/buildflow_exceptions.hpp"
#include "buildflow/common/logging.hpp"
#include "buildflow/common/run_context.hpp"
#include "buildflow/common/task_registry.hpp"
#include "buildflow/config/environment.hpp"
#include "buildflow/config/settings.hpp"
#include "buildflow/execution/engine.hpp"
#include "buildflow/execution/sequential_executor.hpp"
#include "buildflow/pipeline/standard_pipeline.hpp"
#include "buildflow/process/capability_probe.hpp"
#include "buildflow/process/posix_process_launcher.hpp"
#include "buildflow/process/process_invoker.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace
{

constexpr const char* kVersion = "buildflow 1.0.0";

void print_tasks(const buildflow::TaskRegistry& registry)
{
    for (const auto& task : registry.tasks())
    {
        std::cout << std::left << std::setw(30) << task->name() << task->description();
        if (!task->dependencies().empty())
        {
            std::cout << " [depends on:";
            for (const auto& dependency : task->dependencies())
            {
                std::cout << " " << dependency;
            }
            std::cout << "]";
        }
        std::cout << "\n";
    }
    std::cout << std::flush;
}

void print_timing(const buildflow::RunReport& report)
{
    for (size_t i = 0; i < report.task_durations.size() && i < report.executed_tasks.size(); ++i)
    {
        const auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(report.task_durations[i]);
        std::cout << std::left << std::setw(30) << report.executed_tasks[i] << ms.count()
                  << " ms\n";
    }
    const auto total = std::chrono::duration_cast<std::chrono::milliseconds>(report.total_duration);
    std::cout << std::left << std::setw(30) << "Total" << total.count() << " ms\n" << std::flush;
}

void report_task_failure(const buildflow::TaskExecutionError& e)
{
    std::cerr << "\n\nTask '" << e.task_name() << "' failed:\n";
    try
    {
        if (e.cause())
        {
            std::rethrow_exception(e.cause());
        }
    }
    catch (const buildflow::ProcessFailedError& cause)
    {
        std::cerr << "  command:   " << cause.command_line() << "\n"
                  << "  exit code: " << cause.exit_code() << "\n";
    }
    catch (const std::exception& cause)
    {
        std::cerr << "  " << cause.what() << "\n";
    }
    catch (...)
    {
        std::cerr << "  unknown exception\n";
    }
    if (!e.completed_tasks().empty())
    {
        std::cerr << "Completed before the failure:";
        for (const auto& name : e.completed_tasks())
        {
            std::cerr << " " << name;
        }
        std::cerr << "\n";
    }
    std::cerr << std::flush;
}

int run(const std::vector<std::string>& args)
{
    using namespace buildflow;

    const CommandLine command_line = parse_command_line(args);
    if (command_line.show_help)
    {
        std::cout << usage_text() << std::flush;
        return EXIT_SUCCESS;
    }
    if (command_line.show_version)
    {
        std::cout << kVersion << "\n" << std::flush;
        return EXIT_SUCCESS;
    }

    const EnvironmentReader env = process_environment();
    const Settings settings =
        resolve_settings(command_line, env, std::filesystem::current_path().string());
    configure_logging(parse_log_level(settings.verbosity));

    TaskRegistry registry;
    PipelineOptions options;
    register_standard_pipeline(registry, options);

    if (settings.list_tasks)
    {
        DependencyResolver(registry).validate_all();
        print_tasks(registry);
        return EXIT_SUCCESS;
    }

    ProcessInvoker invoker(make_posix_process_launcher());
    invoker.set_base_environment(dotnet_environment());

    RunContext context(invoker);
    context.configuration = settings.configuration;
    context.root_directory = settings.root_directory;
    context.artefacts_directory = settings.artefacts_directory;
    context.version_suffix = settings.version_suffix;
    context.ci = detect_ci_environment(env);
    spdlog::info("CI provider: {}", ci_provider_name(context.ci.provider));
    context.capabilities =
        detect_capabilities(invoker, default_capability_probes(options.dotnet_tool));

    ExecutorConfig executor_config;
    executor_config.collect_timing = settings.collect_timing;
    Engine engine(registry, context, make_sequential_executor(executor_config));

    const RunReport report = engine.run(settings.target);
    if (settings.collect_timing)
    {
        print_timing(report);
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        return run(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const buildflow::SettingsError& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n" << buildflow::usage_text() << std::flush;
        return 2;
    }
    catch (const buildflow::TaskExecutionError& e)
    {
        report_task_failure(e);
        return EXIT_FAILURE;
    }
    catch (const buildflow::BuildFlowError& e)
    {
        std::cerr << "\n\nError (" << buildflow::error_code_name(e.code()) << "):\n"
                  << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "\n\nError:\nUnknown exception\n" << std::flush;
        return EXIT_FAILURE;
    }
}
