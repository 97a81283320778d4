/**
 * @file process_test.cpp
 * @brief 子进程执行器与临时目录测试
 *
 * 使用 /bin/sh 驱动，不依赖 Python。
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <cstdlib>

#include "sandbox/process.h"
#include "sandbox/scratch.h"

using namespace hire;
using namespace hire::sandbox;

class ProcessTest : public ::testing::Test {
protected:
    ProcessConfig shell(const std::string &script, int time_limit_ms = 2000) {
        ProcessConfig pc;
        pc.program = "/bin/sh";
        pc.args = {"-c", script};
        pc.env = {"PATH=/usr/bin:/bin"};
        pc.work_dir = "/tmp";
        pc.time_limit_ms = time_limit_ms;
        pc.memory_limit_kb = 0;
        return pc;
    }
};

// 测试：正常退出，捕获 stdout
TEST_F(ProcessTest, CapturesStdout) {
    Process p(shell("echo hello"));
    auto r = p.run();
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_TRUE(r.value().ok());
    EXPECT_EQ(r.value().stdout_data, "hello\n");
    EXPECT_TRUE(r.value().stderr_data.empty());
}

// 测试：stdin 数据原样送达
TEST_F(ProcessTest, PassesStdin) {
    ProcessConfig pc = shell("cat");
    pc.stdin_data = "{\"a\": 1}";
    Process p(pc);
    auto r = p.run();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().stdout_data, "{\"a\": 1}");
}

// 测试：非 0 退出码与 stderr
TEST_F(ProcessTest, ReportsExitCodeAndStderr) {
    Process p(shell("echo oops >&2; exit 3"));
    auto r = p.run();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().kind, ExitKind::EXITED);
    EXPECT_EQ(r.value().exit_code, 3);
    EXPECT_FALSE(r.value().ok());
    EXPECT_EQ(r.value().stderr_data, "oops\n");
}

// 测试：环境变量被替换为配置给出的集合
TEST_F(ProcessTest, ReplacesEnvironment) {
    setenv("HIRE_PROCESS_TEST_LEAK", "1", 1);
    Process p(shell("echo \"[$HIRE_PROCESS_TEST_LEAK]\""));
    auto r = p.run();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().stdout_data, "[]\n");
}

// 测试：死循环在超时后被杀死，不会无限等待
TEST_F(ProcessTest, KillsOnTimeout) {
    auto start = std::chrono::steady_clock::now();
    Process p(shell("while :; do :; done", 300));
    auto r = p.run();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().timed_out());
    EXPECT_LT(elapsed, 3000);
}

// 测试：后台子进程随进程组一起被杀死
TEST_F(ProcessTest, KillsWholeGroup) {
    Process p(shell("sleep 30 & sleep 30", 300));
    auto start = std::chrono::steady_clock::now();
    auto r = p.run();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().timed_out());
    EXPECT_LT(elapsed, 3000);
}

// 测试：输出超过上限时截断
TEST_F(ProcessTest, TruncatesCapturedOutput) {
    ProcessConfig pc = shell("i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done");
    pc.capture_limit = 100;
    Process p(pc);
    auto r = p.run();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().stdout_data.size(), 100u);
    EXPECT_TRUE(r.value().stdout_truncated);
}

// 测试：程序不存在时子进程以 127 退出
TEST_F(ProcessTest, MissingProgramExits127) {
    ProcessConfig pc = shell("");
    pc.program = "/nonexistent/program";
    pc.args.clear();
    Process p(pc);
    auto r = p.run();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().exit_code, 127);
}

// 测试：临时目录在析构时被删除
TEST(ScratchDirTest, RemovedOnDestruction) {
    std::string path;
    {
        auto dir = ScratchDir::create("/tmp");
        ASSERT_TRUE(dir.ok()) << dir.error().to_string();
        path = dir.value().path();
        EXPECT_TRUE(std::filesystem::is_directory(path));

        auto file = dir.value().write_file("main.py", "print(1)\n");
        ASSERT_TRUE(file.ok());
        std::ifstream in(file.value());
        std::string line;
        std::getline(in, line);
        EXPECT_EQ(line, "print(1)");
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

// 测试：移动后只由新对象负责删除
TEST(ScratchDirTest, MoveTransfersOwnership) {
    auto dir = ScratchDir::create("/tmp");
    ASSERT_TRUE(dir.ok());
    std::string path = dir.value().path();
    {
        ScratchDir moved(std::move(dir.value()));
        EXPECT_TRUE(dir.value().path().empty());
        EXPECT_TRUE(std::filesystem::is_directory(path));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

// 测试：基础目录不存在时返回错误
TEST(ScratchDirTest, FailsForMissingBase) {
    auto dir = ScratchDir::create("/nonexistent/base/dir");
    ASSERT_FALSE(dir.ok());
    EXPECT_EQ(dir.error().code(), ErrorCode::SCRATCH_CREATE_FAILED);
}
