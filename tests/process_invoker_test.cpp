#include "process_invoker.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(PosixProcessInvokerTest, CapturesStdoutAndStderr) {
    PosixProcessInvoker invoker;

    ProcessResult result = invoker.run({"/bin/sh", "-c", "echo out; echo err >&2"},
                                       std::chrono::seconds(5));

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST(PosixProcessInvokerTest, NonZeroExitIsReported) {
    PosixProcessInvoker invoker;

    ProcessResult result = invoker.run({"/bin/sh", "-c", "echo nope >&2; exit 3"},
                                       std::chrono::seconds(5));

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.error, ProcessError::NonZeroExit);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.describe(), "non-zero exit (code 3): nope");
}

TEST(PosixProcessInvokerTest, ArgumentsAreNotShellExpanded) {
    PosixProcessInvoker invoker;

    ProcessResult result = invoker.run({"/bin/sh", "-c", "printf '%s' \"$1\"", "sh", "a b; $HOME"},
                                       std::chrono::seconds(5));

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text, "a b; $HOME");
}

TEST(PosixProcessInvokerTest, ChildHoldsDevNullOnlyAsStdin) {
    PosixProcessInvoker invoker;

    ProcessResult result = invoker.run({"/bin/sh", "-c", "ls -l /proc/$$/fd"},
                                       std::chrono::seconds(5));

    ASSERT_TRUE(result.succeeded()) << result.describe();
    size_t opened = 0;
    const std::string target = "-> /dev/null";
    for (size_t pos = result.stdout_text.find(target); pos != std::string::npos;
         pos = result.stdout_text.find(target, pos + 1)) {
        ++opened;
    }
    EXPECT_EQ(opened, 1u) << result.stdout_text;
}

TEST(PosixProcessInvokerTest, MissingBinaryIsLaunchFailure) {
    PosixProcessInvoker invoker;

    ProcessResult result = invoker.run({"/nonexistent/wifiarbiter-helper"},
                                       std::chrono::seconds(5));

    EXPECT_EQ(result.error, ProcessError::LaunchFailed);
    EXPECT_FALSE(result.succeeded());
}

TEST(PosixProcessInvokerTest, EmptyCommandIsLaunchFailure) {
    PosixProcessInvoker invoker;

    EXPECT_EQ(invoker.run({}, std::chrono::seconds(1)).error, ProcessError::LaunchFailed);
}

TEST(PosixProcessInvokerTest, HungChildIsKilledAtTimeout) {
    PosixProcessInvoker invoker;
    auto started = std::chrono::steady_clock::now();

    ProcessResult result = invoker.run({"/bin/sh", "-c", "sleep 30"},
                                       std::chrono::milliseconds(300));

    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(result.error, ProcessError::TimedOut);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(JoinCommandTest, JoinsWithSpaces) {
    EXPECT_EQ(joinCommand({"systemctl", "restart", "dhcpcd"}), "systemctl restart dhcpcd");
    EXPECT_EQ(joinCommand({}), "");
}
