#include "../../src/internal/subprocess/process.hpp"
#include "../test_utils.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>

using namespace lise::subprocess;
using lise::test::TempDir;

namespace
{
std::string read_first_line(const std::filesystem::path& file)
{
    std::ifstream in(file);
    std::string line;
    std::getline(in, line);
    return line;
}
} // namespace

// Test basic process spawn
TEST(ProcessTest, SpawnEcho)
{
    Process proc;
    proc.spawn("/bin/echo", {"Hello"});

    EXPECT_GT(proc.pid(), 0);
    int exit_code = proc.wait();
    EXPECT_EQ(exit_code, 0);
}

TEST(ProcessTest, TryWaitWhileRunningReturnsNullopt)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});

    EXPECT_TRUE(proc.is_running());
    EXPECT_FALSE(proc.try_wait().has_value());

    proc.terminate();
    EXPECT_EQ(proc.wait(), 128 + SIGTERM);
}

TEST(ProcessTest, TryWaitReportsExitCode)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "exit 3"});

    std::optional<int> exit_code;
    for (int i = 0; i < 250 && !exit_code; ++i)
    {
        exit_code = proc.try_wait();
        if (!exit_code)
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ASSERT_TRUE(exit_code.has_value());
    EXPECT_EQ(*exit_code, 3);
    EXPECT_FALSE(proc.is_running());
    // Cached once reaped
    EXPECT_EQ(proc.try_wait().value_or(-1), 3);
    EXPECT_EQ(proc.wait(), 3);
}

TEST(ProcessTest, TryWaitBeforeSpawnThrows)
{
    Process proc;
    EXPECT_THROW(proc.try_wait(), std::runtime_error);
}

TEST(ProcessTest, SpawnTwiceThrows)
{
    Process proc;
    proc.spawn("/bin/true", {});
    EXPECT_THROW(proc.spawn("/bin/true", {}), std::runtime_error);
    proc.wait();
}

// Test process termination
TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});

    EXPECT_TRUE(proc.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    proc.terminate();

    EXPECT_EQ(proc.wait(), 128 + SIGTERM);
}

TEST(ProcessTest, ExecFailureExits127)
{
    Process proc;
    proc.spawn("/this/path/does/not/exist/lise-agent", {});

    EXPECT_EQ(proc.wait(), 127);
}

TEST(ProcessTest, BareNameIsNotSearchedOnPath)
{
    // "sh" exists on PATH but not relative to this process's directory
    TempDir dir;
    Process proc;
    ProcessOptions opts;
    opts.working_directory = dir.path().string();
    proc.spawn("sh", {"-c", "exit 0"}, opts);

    EXPECT_EQ(proc.wait(), 127);
}

TEST(ProcessTest, DetachLeavesChildRunning)
{
    int pid = 0;
    {
        Process proc;
        proc.spawn("/bin/sleep", {"10"});
        pid = proc.pid();
        proc.detach();
    }

    // Destructor neither killed nor reaped the child
    EXPECT_EQ(::kill(pid, 0), 0);
    int status = 0;
    EXPECT_EQ(waitpid(pid, &status, WNOHANG), 0);

    ::kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
}

TEST(ProcessTest, DestructorTerminatesOwnedChild)
{
    int pid = 0;
    {
        Process proc;
        proc.spawn("/bin/sleep", {"10"});
        pid = proc.pid();
    }

    // Already reaped by the destructor
    int status = 0;
    EXPECT_EQ(waitpid(pid, &status, WNOHANG), -1);
}

TEST(ProcessTest, CapturedStdoutClosesWithProcess)
{
    int pid = 0;
    {
        Process proc;
        proc.spawn("/bin/sh", {"-c", "sleep 0.5; echo late"});
        pid = proc.pid();
        proc.detach();
    }

    // Nobody reads the pipe any more, so the late write raises SIGPIPE
    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGPIPE);
}

TEST(ProcessTest, UncapturedOutputOutlivesProcess)
{
    TempDir dir;
    const auto marker = dir.path() / "done.txt";
    int pid = 0;
    {
        Process proc;
        ProcessOptions opts;
        opts.redirect_stdout = false;
        opts.redirect_stderr = false;
        proc.spawn("/bin/sh", {"-c", "sleep 0.5; echo late; echo ok > '" +
                                         marker.string() + "'"},
                   opts);
        pid = proc.pid();
        proc.detach();
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_EQ(read_first_line(marker), "ok");
}

// Test working directory
TEST(ProcessTest, WorkingDirectory)
{
    TempDir dir;
    Process proc;
    ProcessOptions opts;
    opts.working_directory = dir.path().string();

    proc.spawn("/bin/sh", {"-c", "pwd > cwd.txt"}, opts);
    EXPECT_EQ(proc.wait(), 0);

    const std::string output = read_first_line(dir.path() / "cwd.txt");
    ASSERT_FALSE(output.empty());
    EXPECT_EQ(std::filesystem::canonical(output), std::filesystem::canonical(dir.path()));
}

// Test environment variables
TEST(ProcessTest, Environment)
{
    TempDir dir;
    const auto out = dir.path() / "env.txt";
    Process proc;
    ProcessOptions opts;
    opts.environment["TEST_VAR"] = "test_value";

    proc.spawn("/bin/sh", {"-c", "echo $TEST_VAR > '" + out.string() + "'"}, opts);
    EXPECT_EQ(proc.wait(), 0);

    EXPECT_EQ(read_first_line(out), "test_value");
}

TEST(ProcessTest, WithoutInheritedEnvironment)
{
    lise::test::ScopedEnv parent_var("LISE_TEST_PARENT_ONLY", "leaked");
    TempDir dir;
    const auto out = dir.path() / "env.txt";

    Process proc;
    ProcessOptions opts;
    opts.inherit_environment = false;
    opts.environment["CHILD_VAR"] = "kept";

    proc.spawn("/bin/sh",
               {"-c", "echo \"${LISE_TEST_PARENT_ONLY}|${CHILD_VAR}\" > '" + out.string() + "'"},
               opts);
    EXPECT_EQ(proc.wait(), 0);

    EXPECT_EQ(read_first_line(out), "|kept");
}
