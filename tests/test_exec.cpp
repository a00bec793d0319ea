#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "../include/Exec.hpp"

using namespace assay;

TEST(Exec, RunShellReturnsExitCode)
{
    std::ostringstream log;
    EXPECT_EQ(run_shell("true", log), 0);
    EXPECT_EQ(run_shell("exit 3", log), 3);
}

TEST(Exec, CaptureTrimsOutput)
{
    EXPECT_EQ(capture_shell("printf 'feature-x\\n\\n'"), "feature-x");
}

TEST(Exec, CaptureFailsOnExitOrEmptyOutput)
{
    try
    {
        (void) capture_shell("echo partial; exit 128");
        FAIL() << "expected CommandUnavailableError";
    }
    catch (const CommandUnavailableError &e)
    {
        EXPECT_EQ(e.exit_code(), 128);
        EXPECT_EQ(e.command(), "echo partial; exit 128");
    }
    EXPECT_THROW((void) capture_shell("true"), CommandUnavailableError);
}

TEST(Exec, DefaultSubstitutedWhenUnavailable)
{
    std::ostringstream log;
    const auto r = capture_or_default("exit 128", "Unknown branch, not within a git repository", log);
    EXPECT_EQ(r.kind, CommandResult::Kind::Unavailable);
    EXPECT_TRUE(r.substituted());
    EXPECT_EQ(r.value, "Unknown branch, not within a git repository");
    EXPECT_EQ(r.exit_code, 128);
    EXPECT_TRUE(log.str().empty()); // quiet without --verbose
}

TEST(Exec, SucceededValue)
{
    std::ostringstream log;
    const auto r = capture_or_default("echo abc123", "none", log);
    EXPECT_EQ(r.kind, CommandResult::Kind::Succeeded);
    EXPECT_FALSE(r.substituted());
    EXPECT_EQ(r.value, "abc123");
}
