/**
 * @file grader_test.cpp
 * @brief 多题目评测测试
 */

#include <gtest/gtest.h>
#include <memory>

#include "core/grader.h"
#include "languages/python3.h"
#include "test_util.h"

using namespace hire;

namespace {

Question two_sum_question() {
    Question q;
    q.id = 1;
    q.title = "Two Sum";
    q.difficulty = Difficulty::EASY;
    q.function_signature = "def twoSum(nums, target):";

    TestCase a;
    a.input["nums"] = Value::parse("[2, 7, 11, 15]");
    a.input["target"] = 9;
    a.expected_output = Value::parse("[0, 1]");
    TestCase b;
    b.input["nums"] = Value::parse("[3, 2, 4]");
    b.input["target"] = 6;
    b.expected_output = Value::parse("[1, 2]");
    q.test_cases = {a, b};
    return q;
}

Question add_question() {
    Question q;
    q.id = 2;
    q.title = "Add";
    for (int i = 0; i < 3; i++) {
        TestCase tc;
        tc.input["a"] = i;
        tc.input["b"] = 10;
        tc.expected_output = i + 10;
        q.test_cases.push_back(tc);
    }
    return q;
}

const char *TWO_SUM = R"(def twoSum(nums, target):
    seen = {}
    for i, num in enumerate(nums):
        if target - num in seen:
            return [seen[target - num], i]
        seen[num] = i
)";

} // namespace

class GraderTest : public ::testing::Test {
protected:
    std::unique_ptr<SubmissionExecutor> executor;

    void SetUp() override {
        executor = std::make_unique<SubmissionExecutor>(test::test_options(1000),
                                                        std::make_shared<Python3Language>());
    }
};

// 测试：没有提交时得分 0、结果为空
TEST_F(GraderTest, NoSubmissionsScoresZero) {
    GradingCoordinator grader(*executor, 2);
    GradingReport report = grader.grade({two_sum_question()}, {});
    EXPECT_EQ(report.score, 0);
    EXPECT_EQ(report.total, 0);
    EXPECT_TRUE(report.per_test.empty());
}

// 测试：空代码、没有测试点的题目都不计入
TEST_F(GraderTest, EmptyCodeAndEmptyTestsSkipped) {
    Question empty = two_sum_question();
    empty.id = 9;
    empty.test_cases.clear();

    GradingCoordinator grader(*executor, 2);
    GradingReport report = grader.grade({two_sum_question(), empty}, {{1, ""}, {9, TWO_SUM}});
    EXPECT_EQ(report.total, 0);
    EXPECT_EQ(report.score, 0);
}

// 测试：找不到函数时每个测试点都是 "no function found"
TEST_F(GraderTest, NoFunctionEveryTestFails) {
    GradingCoordinator grader(*executor, 2);
    GradingReport report = grader.grade({two_sum_question()}, {{1, "x = 1\n"}});
    ASSERT_EQ(report.per_test.size(), 2u);
    for (const auto &r : report.per_test) {
        EXPECT_FALSE(r.passed);
        ASSERT_TRUE(r.error.has_value());
        EXPECT_EQ(*r.error, "no function found");
        EXPECT_EQ(r.question_id, 1);
        EXPECT_EQ(r.title, "Two Sum");
    }
    EXPECT_EQ(report.score, 0);
}

// 测试：两数之和全部通过，得分 100
TEST_F(GraderTest, TwoSumScoresHundred) {
    SKIP_WITHOUT_PYTHON();
    GradingCoordinator grader(*executor, 2);
    GradingReport report = grader.grade({two_sum_question()}, {{1, TWO_SUM}});
    ASSERT_EQ(report.per_test.size(), 2u);
    EXPECT_TRUE(report.per_test[0].passed);
    EXPECT_TRUE(report.per_test[1].passed);
    EXPECT_EQ(report.per_test[0].expected, Value::parse("[0, 1]"));
    EXPECT_EQ(report.score, 100);
}

// 测试：超时的提交得分 0，错误以 timeout 开头
TEST_F(GraderTest, TimeoutScoresZero) {
    SKIP_WITHOUT_PYTHON();
    GradingCoordinator grader(*executor, 2);
    GradingReport report = grader.grade({two_sum_question()},
        {{1, "def twoSum(nums, target):\n    while True:\n        pass\n"}});
    ASSERT_EQ(report.per_test.size(), 2u);
    for (const auto &r : report.per_test) {
        EXPECT_FALSE(r.passed);
        ASSERT_TRUE(r.error.has_value());
        EXPECT_EQ(r.error->rfind("timeout", 0), 0u);
    }
    EXPECT_EQ(report.score, 0);
}

// 测试：部分通过时向下取整，结果按 (题目, 测试点) 排序
TEST_F(GraderTest, PartialScoreIsFlooredAndOrdered) {
    SKIP_WITHOUT_PYTHON();
    // a == 1 时答错
    const char *add = "def add(a, b):\n    return a + b if a != 1 else 0\n";
    GradingCoordinator grader(*executor, 4);
    GradingReport report = grader.grade({two_sum_question(), add_question()},
                                        {{1, TWO_SUM}, {2, add}});
    ASSERT_EQ(report.per_test.size(), 5u);
    EXPECT_EQ(report.per_test[0].question_id, 1);
    EXPECT_EQ(report.per_test[1].question_id, 1);
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(report.per_test[2 + i].question_id, 2);
        EXPECT_EQ(report.per_test[2 + i].test_index, i);
    }
    EXPECT_FALSE(report.per_test[3].passed);
    EXPECT_EQ(report.passed, 4);
    EXPECT_EQ(report.total, 5);
    EXPECT_EQ(report.score, 80);
}

// 测试：一个测试点出错不影响其它测试点
TEST_F(GraderTest, FailureDoesNotAbortOthers) {
    SKIP_WITHOUT_PYTHON();
    const char *add = "def add(a, b):\n    if a == 0:\n        raise RuntimeError('boom')\n    return a + b\n";
    GradingCoordinator grader(*executor, 2);
    GradingReport report = grader.grade({add_question()}, {{2, add}});
    ASSERT_EQ(report.per_test.size(), 3u);
    EXPECT_FALSE(report.per_test[0].passed);
    EXPECT_TRUE(report.per_test[1].passed);
    EXPECT_TRUE(report.per_test[2].passed);
    EXPECT_EQ(report.score, 66);
}

// 测试：结果摘要
TEST(GraderSummaryTest, Summarize) {
    GradingReport report;
    TestSummary empty = GradingCoordinator::summarize(report);
    EXPECT_EQ(empty.total_tests, 0);
    EXPECT_EQ(empty.pass_rate, "0%");

    report.per_test.resize(3);
    report.per_test[0].passed = true;
    TestSummary s = GradingCoordinator::summarize(report);
    EXPECT_EQ(s.total_tests, 3);
    EXPECT_EQ(s.passed_tests, 1);
    EXPECT_EQ(s.failed_tests, 2);
    EXPECT_EQ(s.pass_rate, "33%");
}
