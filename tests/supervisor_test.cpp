/**
 * @file supervisor_test.cpp
 * @brief 进程监管测试
 *
 * 只依赖 /bin/sh。
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include "core/supervisor.h"

using namespace sjudge;

class SupervisorTest : public ::testing::Test {
protected:
    std::string work_dir = "/tmp/sjudge_supervisor_test";

    void SetUp() override {
        std::filesystem::remove_all(work_dir);
        std::filesystem::create_directories(work_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(work_dir);
    }

    LaunchSpec shell(const std::string &script) {
        LaunchSpec spec;
        spec.command = {"/bin/sh", "-c", script};
        spec.cwd = work_dir;
        return spec;
    }

    static long long elapsed_ms(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    }
};

TEST_F(SupervisorTest, CapturesStdout) {
    auto res = run_process(shell("echo hello"), "", 5000, 65536);
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_EQ(res.value().return_code, 0);
    EXPECT_EQ(res.value().stdout_text, "hello\n");
    EXPECT_EQ(res.value().stderr_text, "");
    EXPECT_FALSE(res.value().truncated);
}

TEST_F(SupervisorTest, ReportsExitCode) {
    auto res = run_process(shell("echo oops 1>&2; exit 3"), "", 5000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().return_code, 3);
    EXPECT_EQ(res.value().stderr_text, "oops\n");
}

TEST_F(SupervisorTest, KilledBySignal) {
    auto res = run_process(shell("kill -TERM $$"), "", 5000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().return_code, 128 + SIGTERM);
}

TEST_F(SupervisorTest, PassesStdin) {
    auto res = run_process(shell("cat"), "line one\nline two\n", 5000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "line one\nline two\n");
}

TEST_F(SupervisorTest, LargeStdinIsFullyDelivered) {
    std::string input(1 << 20, 'x');
    auto res = run_process(shell("wc -c"), input, 10000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(std::stoll(res.value().stdout_text), 1 << 20);
}

TEST_F(SupervisorTest, ChildIgnoringStdinDoesNotBlock) {
    std::string input(1 << 20, 'x');
    auto start = std::chrono::steady_clock::now();
    auto res = run_process(shell("echo done"), input, 5000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "done\n");
    EXPECT_LT(elapsed_ms(start), 3000);
}

TEST_F(SupervisorTest, RunsInWorkingDirectory) {
    auto res = run_process(shell("pwd"), "", 5000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(std::filesystem::path(trim(res.value().stdout_text)),
              std::filesystem::canonical(work_dir));
}

TEST_F(SupervisorTest, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto res = run_process(shell("sleep 10"), "", 300, 65536);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code(), ErrorCode::TIMEOUT);
    EXPECT_EQ(res.error().message(), "Timeout after 300ms");
    EXPECT_LT(elapsed_ms(start), 3000);
}

TEST_F(SupervisorTest, OutputLimitKillsChild) {
    std::string pid_file = work_dir + "/pid";
    auto res = run_process(shell("echo $$ > " + pid_file + "; while true; do echo xxxxxxxxxxxxxxxx; done"),
                           "", 10000, 1024);
    ASSERT_TRUE(res.ok()) << res.error().to_string();

    const ExecutionOutcome &out = res.value();
    EXPECT_EQ(out.return_code, limits::OUTPUT_KILLED_CODE);
    EXPECT_TRUE(out.truncated);
    EXPECT_EQ(out.stderr_text, "Output limit exceeded");
    EXPECT_LE(out.stdout_text.size(), 1024u);

    std::ifstream fin(pid_file);
    pid_t pid = 0;
    ASSERT_TRUE(fin >> pid);
    ASSERT_GT(pid, 0);
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(SupervisorTest, StderrFloodDoesNotDeadlock) {
    // 约 100 KiB 的 stderr，超过管道缓冲区
    std::string line(51, 'e');
    std::string script =
        "i=0; while [ $i -lt 2000 ]; do echo " + line + " 1>&2; i=$((i+1)); done; echo ok";
    auto res = run_process(shell(script), "", 20000, 1 << 20);
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_EQ(res.value().return_code, 0);
    EXPECT_EQ(res.value().stdout_text, "ok\n");
    EXPECT_EQ(res.value().stderr_text.size(), 2000u * (line.size() + 1));
}

TEST_F(SupervisorTest, BackgroundChildrenAreKilled) {
    auto start = std::chrono::steady_clock::now();
    auto res = run_process(shell("sleep 30 & echo started"), "", 5000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "started\n");
    EXPECT_LT(elapsed_ms(start), 3000);
}

TEST_F(SupervisorTest, InvalidUtf8IsReplaced) {
    auto res = run_process(shell("printf '\\377ok'"), "", 5000, 65536);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "\xEF\xBF\xBDok");
}

TEST_F(SupervisorTest, MissingExecutable) {
    LaunchSpec spec;
    spec.command = {"sjudge-no-such-binary"};
    spec.cwd = work_dir;
    auto res = run_process(spec, "", 1000, 65536);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code(), ErrorCode::EXEC_FAILED);
}

TEST_F(SupervisorTest, MissingWorkingDirectory) {
    LaunchSpec spec = shell("true");
    spec.cwd = work_dir + "/missing";
    auto res = run_process(spec, "", 1000, 65536);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code(), ErrorCode::EXEC_FAILED);
}
