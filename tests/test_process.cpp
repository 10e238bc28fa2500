#include <gtest/gtest.h>
#include <platform/process.hpp>

TEST(RunProcess, CollectsStdoutStderrAndExitCode) {
    auto r = platform::run_process("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"}, 5000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code, 3);
    EXPECT_EQ(r.value.stdout_data, "out\n");
    EXPECT_EQ(r.value.stderr_data, "err\n");
    EXPECT_TRUE(r.value.failed());
}

TEST(RunProcess, LargeOutputDoesNotDeadlock) {
    auto r = platform::run_process("/bin/sh",
        {"-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo e$i >&2; i=$((i+1)); done"},
        20000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_NE(r.value.stdout_data.find("line19999\n"), std::string::npos);
    EXPECT_NE(r.value.stderr_data.find("e19999\n"), std::string::npos);
}

TEST(RunProcess, StdinIsEmpty) {
    auto r = platform::run_process("/bin/sh", {"-c", "cat"}, 5000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "");
    EXPECT_TRUE(r.value.success());
}

TEST(RunProcess, MissingProgramIsAnError) {
    auto r = platform::run_process("tmuxbridge-definitely-not-installed", {}, 5000);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("failed to run"), std::string::npos);
}

TEST(RunProcess, TimeoutKillsChild) {
    auto r = platform::run_process("/bin/sh", {"-c", "sleep 30"}, 200);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("timed out"), std::string::npos);
}

TEST(RunProcess, DeathBySignalIsAnError) {
    auto r = platform::run_process("/bin/sh", {"-c", "kill -9 $$"}, 5000);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("signal 9"), std::string::npos);
}
