#include <gtest/gtest.h>
#include "buildflow/process/posix_process_launcher.hpp"

#include <filesystem>
#include <fstream>

using namespace buildflow;

namespace
{

ProcessRequest shell(const std::string& script)
{
    ProcessRequest request;
    request.command = "/bin/sh";
    request.arguments = {"-c", script};
    return request;
}

} // namespace

TEST(PosixProcessLauncherTests, Launch_ExitZero_ReturnsZero)
{
    auto launcher = make_posix_process_launcher();
    EXPECT_EQ(launcher->launch(shell("exit 0")), 0);
}

TEST(PosixProcessLauncherTests, Launch_ExitCode_Propagated)
{
    auto launcher = make_posix_process_launcher();
    EXPECT_EQ(launcher->launch(shell("exit 3")), 3);
}

TEST(PosixProcessLauncherTests, Launch_LooksUpCommandOnPath)
{
    auto launcher = make_posix_process_launcher();
    ProcessRequest request;
    request.command = "sh";
    request.arguments = {"-c", "exit 5"};
    EXPECT_EQ(launcher->launch(request), 5);
}

TEST(PosixProcessLauncherTests, Launch_MissingCommand_Returns127)
{
    auto launcher = make_posix_process_launcher();
    ProcessRequest request;
    request.command = "buildflow-no-such-command-7f3a";
    EXPECT_EQ(launcher->launch(request), 127);
}

TEST(PosixProcessLauncherTests, Launch_KilledBySignal_Returns128PlusSignal)
{
    auto launcher = make_posix_process_launcher();
    EXPECT_EQ(launcher->launch(shell("kill -9 $$")), 128 + 9);
}

TEST(PosixProcessLauncherTests, Launch_EnvironmentOverride_VisibleToChild)
{
    auto launcher = make_posix_process_launcher();
    ProcessRequest request = shell("test \"$BUILDFLOW_TEST_VALUE\" = expected");
    EXPECT_NE(launcher->launch(request), 0);

    request.environment = {{"BUILDFLOW_TEST_VALUE", "expected"}};
    EXPECT_EQ(launcher->launch(request), 0);
}

TEST(PosixProcessLauncherTests, Launch_LaterOverrideWins)
{
    auto launcher = make_posix_process_launcher();
    ProcessRequest request = shell("test \"$BUILDFLOW_TEST_VALUE\" = second");
    request.environment = {{"BUILDFLOW_TEST_VALUE", "first"}, {"BUILDFLOW_TEST_VALUE", "second"}};
    EXPECT_EQ(launcher->launch(request), 0);
}

TEST(PosixProcessLauncherTests, Launch_WorkingDirectory_Applied)
{
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "buildflow_launcher_cwd_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "marker.txt") << "x";

    auto launcher = make_posix_process_launcher();
    ProcessRequest request = shell("test -f marker.txt");
    EXPECT_NE(launcher->launch(request), 0);

    request.working_directory = dir.string();
    EXPECT_EQ(launcher->launch(request), 0);

    fs::remove_all(dir);
}

TEST(PosixProcessLauncherTests, Launch_MissingWorkingDirectory_Returns127)
{
    auto launcher = make_posix_process_launcher();
    ProcessRequest request = shell("exit 0");
    request.working_directory = "/nonexistent/buildflow/dir";
    EXPECT_EQ(launcher->launch(request), 127);
}

TEST(PosixProcessLauncherTests, Launch_DiscardOutput_StdoutAndStderrAreDevNull)
{
    auto launcher = make_posix_process_launcher();
    ProcessRequest request =
        shell("[ /dev/stdout -ef /dev/null ] && [ /dev/stderr -ef /dev/null ]");
    request.discard_output = true;
    EXPECT_EQ(launcher->launch(request), 0);
}

TEST(PosixProcessLauncherTests, Launch_DiscardOutput_ExitCodeStillPropagated)
{
    auto launcher = make_posix_process_launcher();
    ProcessRequest request = shell("echo noise; echo more noise >&2; exit 5");
    request.discard_output = true;
    EXPECT_EQ(launcher->launch(request), 5);
}
