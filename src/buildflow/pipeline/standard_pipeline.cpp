#include "buildflow/pipeline/standard_pipeline.hpp"
#include "buildflow/common/run_context.hpp"
#include "buildflow/discovery/file_discovery.hpp"

#include <spdlog/spdlog.h>

namespace buildflow
{

namespace
{

void clean(const RunContext& context)
{
    const fs::path artefacts{context.artefacts_directory};
    const auto removed_artefacts = fs::remove_all(artefacts);
    spdlog::debug("Removed {} entries from '{}'", removed_artefacts, artefacts.string());

    // Removal happens after the walk; the iterator must not see deleted entries.
    std::vector<fs::path> outputs;
    const fs::path root{context.root_directory};
    std::error_code ec;
    if (fs::is_directory(root, ec))
    {
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied);
        fs::recursive_directory_iterator end;
        while (it != end)
        {
            if (it->is_directory())
            {
                const std::string name = it->path().filename().string();
                if (name == "bin" || name == "obj")
                {
                    outputs.push_back(it->path());
                    it.disable_recursion_pending();
                }
            }
            ++it;
        }
    }

    for (const auto& output : outputs)
    {
        spdlog::debug("Removing '{}'", output.string());
        fs::remove_all(output);
    }
    fs::create_directories(artefacts);
    spdlog::info("Cleaned {} output director{} and '{}'", outputs.size(),
                 outputs.size() == 1 ? "y" : "ies", artefacts.string());
}

// Children run inside the root, so paths passed to them must not be relative
// to the caller's directory.
std::string absolute_path(const std::string& path)
{
    return fs::absolute(path).lexically_normal().string();
}

ProcessRequest dotnet_request(const PipelineOptions& options, const RunContext& context,
                              std::vector<std::string> arguments)
{
    ProcessRequest request;
    request.command = options.dotnet_tool;
    request.arguments = std::move(arguments);
    request.working_directory = absolute_path(context.root_directory);
    return request;
}

std::string file_stem(const std::string& path)
{
    return fs::path{path}.stem().string();
}

} // namespace

EnvironmentOverrides dotnet_environment()
{
    return {
        {"DOTNET_CLI_TELEMETRY_OPTOUT", "1"},
        {"DOTNET_SKIP_FIRST_TIME_EXPERIENCE", "1"},
        {"DOTNET_NOLOGO", "1"},
    };
}

void register_standard_pipeline(TaskRegistry& registry, const PipelineOptions& options)
{
    using namespace task_names;

    registry.register_task(TaskDefinition{
        kClean,
        "Remove the artefacts directory and every bin and obj directory",
        {},
        [](RunContext& context) { clean(context); },
        {},
        {},
        {}});

    registry.register_task(TaskDefinition{
        kRestore,
        "Restore NuGet packages",
        {kClean},
        [options](RunContext& context) {
            context.invoker().invoke(dotnet_request(options, context, {"restore"}));
        },
        {},
        {},
        {}});

    registry.register_task(TaskDefinition{
        kBuild,
        "Build the solution",
        {kRestore},
        [options](RunContext& context) {
            context.invoker().invoke(dotnet_request(
                options, context,
                {"build", "--configuration", context.configuration, "--no-restore"}));
        },
        {},
        {},
        {}});

    registry.register_task(TaskDefinition{
        kInstallDeveloperCertificate,
        "Export and trust the HTTPS developer certificate on CI agents",
        {},
        [options](RunContext& context) {
            const std::string certificate = absolute_path(
                (fs::path{context.artefacts_directory} / options.certificate_file_name).string());
            context.invoker().invoke(dotnet_request(
                options, context,
                {"dev-certs", "https", "--export-path", certificate, "--password",
                 options.certificate_password}));

            ProcessRequest trust =
                dotnet_request(options, context, {"dev-certs", "https", "--trust"});
            const bool tolerated = context.ci.is_trusted_ci_host();
            trust.tolerate_failure = [tolerated]() { return tolerated; };
            context.invoker().invoke(trust);
        },
        {},
        {},
        [](const RunContext& context) {
            return !context.capabilities.has(Capability::InteractiveTool) && context.ci.is_ci();
        }});

    registry.register_task(TaskDefinition{
        kTest,
        "Run every test project",
        {kBuild, kInstallDeveloperCertificate},
        {},
        [options](const RunContext& context) {
            return discover_files(context.root_directory, options.test_project_pattern);
        },
        [options](RunContext& context, const std::string& project) {
            std::vector<std::string> arguments{"test",
                                               absolute_path(project),
                                               "--configuration",
                                               context.configuration,
                                               "--no-build",
                                               "--no-restore"};
            const std::string filter =
                build_test_filter(context.capabilities, options.trait_exclusions);
            if (!filter.empty())
            {
                arguments.push_back("--filter");
                arguments.push_back(filter);
            }
            arguments.push_back("--logger");
            arguments.push_back("trx;LogFileName=" + file_stem(project) + ".trx");
            arguments.push_back("--results-directory");
            arguments.push_back(absolute_path(context.artefacts_directory));
            context.invoker().invoke(dotnet_request(options, context, std::move(arguments)));
        },
        {}});

    registry.register_task(TaskDefinition{
        kPack,
        "Create the NuGet package",
        {kBuild},
        [options](RunContext& context) {
            const std::string project =
                discover_single_file(context.root_directory, options.package_project_pattern);
            std::vector<std::string> arguments{"pack",
                                               absolute_path(project),
                                               "--configuration",
                                               context.configuration,
                                               "--no-build",
                                               "--no-restore",
                                               "--output",
                                               absolute_path(context.artefacts_directory)};
            if (!context.version_suffix.empty())
            {
                arguments.push_back("--version-suffix");
                arguments.push_back(context.version_suffix);
            }
            context.invoker().invoke(dotnet_request(options, context, std::move(arguments)));
        },
        {},
        {},
        {}});

    registry.register_task(TaskDefinition{
        kDefault, "Build, test and pack", {kBuild, kTest, kPack}, {}, {}, {}, {}});
}

} // namespace buildflow
