#include "buildflow/config/settings.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

#include <filesystem>

namespace buildflow
{

namespace
{

// Options that take a value, mapped to the CommandLine member they fill.
using ValueMember = std::optional<std::string> CommandLine::*;

const std::map<std::string, ValueMember>& value_options()
{
    static const std::map<std::string, ValueMember> options = {
        {"--target", &CommandLine::target},
        {"--configuration", &CommandLine::configuration},
        {"--root", &CommandLine::root_directory},
        {"--artefacts", &CommandLine::artefacts_directory},
        {"--verbosity", &CommandLine::verbosity},
        {"--version-suffix", &CommandLine::version_suffix},
    };
    return options;
}

using FlagMember = bool CommandLine::*;

const std::map<std::string, FlagMember>& flag_options()
{
    static const std::map<std::string, FlagMember> options = {
        {"--timing", &CommandLine::collect_timing},
        {"--list", &CommandLine::list_tasks},
        {"--help", &CommandLine::show_help},
        {"-h", &CommandLine::show_help},
        {"--version", &CommandLine::show_version},
    };
    return options;
}

std::filesystem::path absolute_from(const std::string& base, const std::string& path)
{
    std::filesystem::path result(path);
    if (result.is_relative())
    {
        result = std::filesystem::path(base) / result;
    }
    // lexically_normal keeps a trailing '/' as an empty filename
    result = result.lexically_normal();
    if (!result.has_filename() && result.has_parent_path() && result != result.root_path())
    {
        result = result.parent_path();
    }
    return result;
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args)
{
    CommandLine result;
    bool have_positional = false;

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg.size() < 2 || arg[0] != '-')
        {
            if (have_positional)
            {
                throw SettingsError("Unexpected argument '" + arg +
                                    "': only one target may be given");
            }
            result.target = arg;
            have_positional = true;
            continue;
        }

        auto flag = flag_options().find(arg);
        if (flag != flag_options().end())
        {
            result.*(flag->second) = true;
            continue;
        }

        std::string name = arg;
        std::optional<std::string> value;
        const size_t eq = arg.find('=');
        if (eq != std::string::npos)
        {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        auto option = value_options().find(name);
        if (option == value_options().end())
        {
            throw SettingsError("Unknown option '" + name + "'");
        }

        if (!value)
        {
            if (i + 1 >= args.size())
            {
                throw SettingsError("Option '" + name + "' requires a value");
            }
            value = args[++i];
        }
        if (value->empty())
        {
            throw SettingsError("Option '" + name + "' requires a non-empty value");
        }

        if (option->second == &CommandLine::target)
        {
            if (have_positional)
            {
                throw SettingsError("Target given both as argument and with --target");
            }
            have_positional = true;
        }
        result.*(option->second) = *value;
    }

    return result;
}

std::string resolve_setting(const std::optional<std::string>& argument,
                            const std::vector<std::string>& environment_names,
                            const EnvironmentReader& env,
                            const std::string& default_value)
{
    if (argument && !argument->empty())
    {
        return *argument;
    }
    for (const auto& name : environment_names)
    {
        std::optional<std::string> value = env(name);
        if (value && !value->empty())
        {
            return *value;
        }
    }
    return default_value;
}

Settings resolve_settings(const CommandLine& command_line,
                          const EnvironmentReader& env,
                          const std::string& current_directory)
{
    Settings settings;
    settings.target = resolve_setting(
        command_line.target, {"BUILDFLOW_TARGET"}, env, kDefaultTarget);
    settings.configuration = resolve_setting(
        command_line.configuration, {"BUILDFLOW_CONFIGURATION", "Configuration"}, env,
        kDefaultConfiguration);
    settings.verbosity = resolve_setting(
        command_line.verbosity, {"BUILDFLOW_VERBOSITY"}, env, kDefaultVerbosity);
    settings.version_suffix = resolve_setting(
        command_line.version_suffix, {"BUILDFLOW_VERSION_SUFFIX", "PreReleaseSuffix"}, env, "");
    // Child processes run inside the root, so every path handed out is absolute
    const std::filesystem::path root =
        absolute_from(current_directory, command_line.root_directory.value_or(current_directory));
    settings.root_directory = root.string();

    if (command_line.artefacts_directory)
    {
        settings.artefacts_directory =
            absolute_from(current_directory, *command_line.artefacts_directory).string();
    }
    else
    {
        settings.artefacts_directory = (root / kDefaultArtefactsDirectoryName).string();
    }

    settings.collect_timing = command_line.collect_timing;
    settings.list_tasks = command_line.list_tasks;
    return settings;
}

std::string usage_text()
{
    return R"(buildflow - build, test and package orchestration

USAGE:
    buildflow [TARGET] [OPTIONS]

OPTIONS:
    --target <NAME>          Task to run (env BUILDFLOW_TARGET, default: Default)
    --configuration <NAME>   Build configuration (env BUILDFLOW_CONFIGURATION or
                             Configuration, default: Release)
    --root <DIR>             Repository root (default: current directory)
    --artefacts <DIR>        Output directory (default: <root>/Artefacts)
    --version-suffix <S>     Pre-release suffix passed to pack
                             (env BUILDFLOW_VERSION_SUFFIX or PreReleaseSuffix)
    --verbosity <LEVEL>      trace|debug|info|warn|error|off
                             (env BUILDFLOW_VERBOSITY, default: info)
    --timing                 Report per-task durations
    --list                   List registered tasks and exit
    -h, --help               Show this help
    --version                Show version information
)";
}

} // namespace buildflow
