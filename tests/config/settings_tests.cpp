#include <gtest/gtest.h>
#include "buildflow/common/buildflow_exceptions.hpp"
#include "buildflow/common/logging.hpp"
#include "buildflow/config/settings.hpp"

#include <spdlog/spdlog.h>

using namespace buildflow;

// =============================================================================
// parse_command_line()
// =============================================================================

TEST(ParseCommandLineTests, Empty_NothingSet)
{
    auto cl = parse_command_line({});
    EXPECT_FALSE(cl.target);
    EXPECT_FALSE(cl.configuration);
    EXPECT_FALSE(cl.collect_timing);
    EXPECT_FALSE(cl.list_tasks);
    EXPECT_FALSE(cl.show_help);
}

TEST(ParseCommandLineTests, PositionalTarget)
{
    auto cl = parse_command_line({"Pack"});
    ASSERT_TRUE(cl.target);
    EXPECT_EQ(*cl.target, "Pack");
}

TEST(ParseCommandLineTests, SeparateAndEqualsValues)
{
    auto cl = parse_command_line(
        {"--target", "Test", "--configuration=Debug", "--root", "/src", "--verbosity=debug"});
    EXPECT_EQ(cl.target.value_or(""), "Test");
    EXPECT_EQ(cl.configuration.value_or(""), "Debug");
    EXPECT_EQ(cl.root_directory.value_or(""), "/src");
    EXPECT_EQ(cl.verbosity.value_or(""), "debug");
}

TEST(ParseCommandLineTests, Flags)
{
    auto cl = parse_command_line({"--timing", "--list", "-h", "--version"});
    EXPECT_TRUE(cl.collect_timing);
    EXPECT_TRUE(cl.list_tasks);
    EXPECT_TRUE(cl.show_help);
    EXPECT_TRUE(cl.show_version);
}

TEST(ParseCommandLineTests, UnknownOption_Throws)
{
    EXPECT_THROW(parse_command_line({"--frobnicate"}), SettingsError);
}

TEST(ParseCommandLineTests, MissingValue_Throws)
{
    EXPECT_THROW(parse_command_line({"--configuration"}), SettingsError);
    EXPECT_THROW(parse_command_line({"--configuration="}), SettingsError);
}

TEST(ParseCommandLineTests, TwoTargets_Throws)
{
    EXPECT_THROW(parse_command_line({"Build", "Pack"}), SettingsError);
    EXPECT_THROW(parse_command_line({"Build", "--target", "Pack"}), SettingsError);
}

// =============================================================================
// resolve_setting() / resolve_settings()
// =============================================================================

TEST(ResolveSettingTests, ArgumentBeatsEnvironmentBeatsDefault)
{
    auto env = fixed_environment({{"BUILDFLOW_CONFIGURATION", "Debug"}});
    EXPECT_EQ(resolve_setting(std::string("Checked"), {"BUILDFLOW_CONFIGURATION"}, env, "Release"),
              "Checked");
    EXPECT_EQ(resolve_setting(std::nullopt, {"BUILDFLOW_CONFIGURATION"}, env, "Release"), "Debug");
    EXPECT_EQ(resolve_setting(std::nullopt, {"OTHER"}, env, "Release"), "Release");
}

TEST(ResolveSettingTests, EmptyValues_CountAsUnset)
{
    auto env = fixed_environment({{"FIRST", ""}, {"SECOND", "value"}});
    EXPECT_EQ(resolve_setting(std::string(""), {"FIRST", "SECOND"}, env, "default"), "value");
}

TEST(ResolveSettingsTests, Defaults)
{
    auto settings = resolve_settings(CommandLine{}, fixed_environment({}), "/work/repo");
    EXPECT_EQ(settings.target, "Default");
    EXPECT_EQ(settings.configuration, "Release");
    EXPECT_EQ(settings.verbosity, "info");
    EXPECT_EQ(settings.root_directory, "/work/repo");
    EXPECT_EQ(settings.artefacts_directory, "/work/repo/Artefacts");
    EXPECT_TRUE(settings.version_suffix.empty());
    EXPECT_FALSE(settings.collect_timing);
}

TEST(ResolveSettingsTests, EnvironmentFallbacks)
{
    auto env = fixed_environment({{"BUILDFLOW_TARGET", "Pack"},
                                  {"Configuration", "Debug"},
                                  {"PreReleaseSuffix", "rc.1"},
                                  {"BUILDFLOW_VERBOSITY", "warn"}});
    auto settings = resolve_settings(CommandLine{}, env, "/work");
    EXPECT_EQ(settings.target, "Pack");
    EXPECT_EQ(settings.configuration, "Debug");
    EXPECT_EQ(settings.version_suffix, "rc.1");
    EXPECT_EQ(settings.verbosity, "warn");
}

TEST(ResolveSettingsTests, PrimaryEnvironmentNameWins)
{
    auto env = fixed_environment(
        {{"BUILDFLOW_CONFIGURATION", "Release"}, {"Configuration", "Debug"}});
    auto settings = resolve_settings(CommandLine{}, env, "/work");
    EXPECT_EQ(settings.configuration, "Release");
}

TEST(ResolveSettingsTests, CommandLineOverridesEverything)
{
    auto cl = parse_command_line({"Test", "--configuration", "Debug", "--root", "/r",
                                  "--artefacts", "/out", "--timing"});
    auto env = fixed_environment({{"BUILDFLOW_TARGET", "Pack"}, {"Configuration", "Release"}});
    auto settings = resolve_settings(cl, env, "/work");
    EXPECT_EQ(settings.target, "Test");
    EXPECT_EQ(settings.configuration, "Debug");
    EXPECT_EQ(settings.root_directory, "/r");
    EXPECT_EQ(settings.artefacts_directory, "/out");
    EXPECT_TRUE(settings.collect_timing);
}

TEST(ResolveSettingsTests, ArtefactsFollowRoot)
{
    auto cl = parse_command_line({"--root", "/r"});
    auto settings = resolve_settings(cl, fixed_environment({}), "/work");
    EXPECT_EQ(settings.artefacts_directory, "/r/Artefacts");
}

TEST(ResolveSettingsTests, RelativeRoot_MadeAbsolute)
{
    auto cl = parse_command_line({"--root", "repo"});
    auto settings = resolve_settings(cl, fixed_environment({}), "/work");
    EXPECT_EQ(settings.root_directory, "/work/repo");
    EXPECT_EQ(settings.artefacts_directory, "/work/repo/Artefacts");
}

TEST(ResolveSettingsTests, RelativeArtefacts_ResolvedFromCurrentDirectory)
{
    auto cl = parse_command_line({"--root", "repo", "--artefacts", "out/packages"});
    auto settings = resolve_settings(cl, fixed_environment({}), "/work");
    EXPECT_EQ(settings.artefacts_directory, "/work/out/packages");
}

TEST(ResolveSettingsTests, DotSegmentsAndTrailingSlash_Normalized)
{
    auto cl = parse_command_line({"--root", "../other/./repo/"});
    auto settings = resolve_settings(cl, fixed_environment({}), "/work/here");
    EXPECT_EQ(settings.root_directory, "/work/other/repo");
    EXPECT_EQ(settings.artefacts_directory, "/work/other/repo/Artefacts");
}

TEST(UsageTextTests, MentionsEveryOption)
{
    const std::string usage = usage_text();
    for (const char* option : {"--target", "--configuration", "--root", "--artefacts",
                                "--version-suffix", "--verbosity", "--timing", "--list", "--help",
                                "--version"})
    {
        EXPECT_NE(usage.find(option), std::string::npos) << option;
    }
}

// =============================================================================
// Logging
// =============================================================================

TEST(LogLevelTests, KnownNames)
{
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
}

TEST(LogLevelTests, UnknownName_Throws)
{
    EXPECT_THROW(parse_log_level("loud"), SettingsError);
}

TEST(LogLevelTests, ConfigureLogging_SetsDefaultLoggerLevel)
{
    configure_logging(spdlog::level::warn);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
    EXPECT_EQ(spdlog::default_logger()->name(), "buildflow");
    configure_logging(spdlog::level::info);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);
}
