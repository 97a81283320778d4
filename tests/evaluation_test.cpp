/**
 * @file evaluation_test.cpp
 * @brief 完整评估流程测试
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>

#include "hire_judger.h"
#include "test_util.h"

using namespace hire;

namespace {

QuestionCatalog two_sum_catalog() {
    Question q;
    q.id = 1;
    q.title = "Two Sum";
    q.difficulty = Difficulty::EASY;
    TestCase tc;
    tc.input["nums"] = Value::parse("[2, 7, 11, 15]");
    tc.input["target"] = 9;
    tc.expected_output = Value::parse("[0, 1]");
    q.test_cases.push_back(tc);
    return QuestionCatalog({q});
}

EvaluationRequest resume_only_request() {
    EvaluationRequest req;
    req.resume_score = 80;
    req.resume.skills = {"python", "sql"};
    req.resume.experience = 3;
    req.resume.projects = 2;
    return req;
}

} // namespace

// 测试：没有提交时只做简历与反作弊评估
TEST(EvaluationTest, ResumeOnly) {
    EvaluationContext ctx;
    ctx.init(two_sum_catalog(), ReferenceCatalog());

    EvaluationResult res = ctx.evaluate(resume_only_request());
    EXPECT_FALSE(res.grading.has_value());
    EXPECT_EQ(res.fraud.fraud_score, 0);
    ASSERT_EQ(res.fraud.checks.size(), 1u);
    EXPECT_EQ(res.decision.final_score, 86);
    EXPECT_EQ(res.decision.next_stage, stage::CODING_ASSESSMENT);

    Value j = res.to_json();
    EXPECT_TRUE(j["grading"].is_null());
    EXPECT_EQ(j["fraud"]["risk_level"], "LOW");
    EXPECT_EQ(j["decision"]["final_score"], 86);
    EXPECT_TRUE(j["decision"]["job_match"].is_null());
}

// 测试：请求中的 coding_score 在没有提交时参与计分
TEST(EvaluationTest, CodingScoreWithoutSubmissions) {
    EvaluationContext ctx;
    ctx.init(two_sum_catalog(), ReferenceCatalog());

    EvaluationRequest req = resume_only_request();
    req.coding_score = 60;
    EvaluationResult res = ctx.evaluate(req);
    EXPECT_FALSE(res.grading.has_value());
    // 80*0.3 + 60*0.5 + 100*0.2
    EXPECT_EQ(res.decision.final_score, 74);
}

TEST(EvaluationTest, GradesSubmissions) {
    SKIP_WITHOUT_PYTHON();
    EvaluationContext ctx;
    ctx.config.set("time_limit_ms", "5000");
    ctx.config.set("worker_threads", "2");
    ctx.init(two_sum_catalog(), ReferenceCatalog());

    EvaluationRequest req = resume_only_request();
    req.coding_score = 10;
    req.submissions[1] =
        "def twoSum(nums, target):\n"
        "    seen = {}\n"
        "    for i, n in enumerate(nums):\n"
        "        if target - n in seen:\n"
        "            return [seen[target - n], i]\n"
        "        seen[n] = i\n";
    req.job = JobRequirements();
    req.job->skills = {"python", "go"};
    req.job->candidate_skills = req.resume.skills;

    EvaluationResult res = ctx.evaluate(req);
    ASSERT_TRUE(res.grading.has_value());
    EXPECT_EQ(res.grading->score, 100);
    // 有提交时忽略请求中的 coding_score
    EXPECT_EQ(res.decision.final_score, 94);
    ASSERT_EQ(res.fraud.checks.size(), 2u);
    EXPECT_EQ(res.fraud.checks[1].kind, CheckKind::PLAGIARISM);
    ASSERT_TRUE(res.decision.job_match.has_value());
    EXPECT_TRUE(res.decision.job_match->meets_requirements);

    Value j = res.to_json();
    EXPECT_EQ(j["grading"]["summary"]["pass_rate"], "100%");
    EXPECT_EQ(j["grading"]["results"][0]["status"], "OK");
    EXPECT_EQ(j["decision"]["job_match"]["skill_match_percentage"], 50.0);
}

// 测试：结果文件中考生输出的非法 UTF-8 字节被替换，写入不失败
TEST(ResultWriterTest, InvalidUtf8IsReplaced) {
    char dir[] = "/tmp/hire_result_test_XXXXXX";
    ASSERT_NE(mkdtemp(dir), nullptr);

    ExecutionResult r;
    r.status = RunStatus::RUNTIME_ERROR;
    r.raw_output = "\xff";
    r.error = std::string("\xff\xfe boom");
    GradingReport report;
    report.per_test.push_back(r);
    report.total = 1;

    Value j;
    j["grading"] = to_json(report, GradingCoordinator::summarize(report));
    ResultWriter writer(dir);
    auto w = writer.write_ok(j);
    ASSERT_TRUE(w.ok()) << w.error().to_string();

    auto text = read_file(std::string(dir) + "/result.json");
    ASSERT_TRUE(text.ok());
    Value back = Value::parse(text.value());
    const Value &first = back["grading"]["results"][0];
    EXPECT_EQ(first["output"], "\xef\xbf\xbd");
    EXPECT_EQ(first["error"], "\xef\xbf\xbd\xef\xbf\xbd boom");
    std::filesystem::remove_all(dir);
}
