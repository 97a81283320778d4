/**
 * @file fraud_test.cpp
 * @brief 反作弊检查与评分测试
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <chrono>

#include "fraud/pipeline.h"
#include "core/utils.h"

using namespace hire;

namespace {

ReferenceCatalog sample_references() {
    std::map<int, std::vector<std::string>> m;
    m[1] = {"def twoSum(nums, target):", "seen = {}", "for i, num in enumerate(nums):"};
    m[2] = {"def isValid(s):", "stack = []", "mapping = {"};
    return ReferenceCatalog(m);
}

const char *COPIED_TWO_SUM = R"(def twoSum(nums, target):   # classic
    seen = {}

        # hash map of value -> index
    for i, num in enumerate(nums):
        if target - num in seen:
            return [seen[target - num], i]
        seen[num] = i
)";

FraudCheck suspicious(CheckKind kind) {
    FraudCheck c;
    c.kind = kind;
    c.is_suspicious = true;
    return c;
}

FraudCheck clean(CheckKind kind) {
    return FraudCheck::clean(kind, "ok");
}

TimePoint at(const std::string &ts) {
    auto t = parse_iso8601(ts);
    EXPECT_TRUE(t.has_value()) << ts;
    return t.value_or(TimePoint());
}

} // namespace

//==============================================================================
// 抄袭检测
//==============================================================================

class PlagiarismTest : public ::testing::Test {
protected:
    ReferenceCatalog refs = sample_references();
    FraudPolicy policy;
    PlagiarismDetector detector{refs, policy};
};

// 测试：规范化去掉注释、空白和空行
TEST_F(PlagiarismTest, Normalize) {
    EXPECT_EQ(PlagiarismDetector::normalize("  a = 1  # note\n\n\t# only comment\n  b = 2\n"),
              "a = 1\nb = 2");
    EXPECT_EQ(PlagiarismDetector::normalize(""), "");
}

// 测试：包含全部参考片段时相似度 100，可疑
TEST_F(PlagiarismTest, FullMatchIsSuspicious) {
    FraudCheck c = detector.detect(COPIED_TWO_SUM, 1);
    EXPECT_EQ(c.kind, CheckKind::PLAGIARISM);
    EXPECT_TRUE(c.is_suspicious);
    EXPECT_DOUBLE_EQ(c.metric, 100.0);
    EXPECT_EQ(c.detail, "code matches 3/3 reference fragments");
}

// 测试：不含任何片段时相似度 0
TEST_F(PlagiarismTest, NoMatchIsClean) {
    FraudCheck c = detector.detect("def twoSum(a, b):\n    return [0, 1]\n", 1);
    EXPECT_FALSE(c.is_suspicious);
    EXPECT_DOUBLE_EQ(c.metric, 0.0);
    EXPECT_EQ(c.detail, "code appears original");
}

// 测试：2/3 = 66.67%，未超过 80
TEST_F(PlagiarismTest, PartialMatchBelowThreshold) {
    FraudCheck c = detector.detect("def twoSum(nums, target):\n    seen = {}\n    return []\n", 1);
    EXPECT_FALSE(c.is_suspicious);
    EXPECT_DOUBLE_EQ(c.metric, 66.67);
}

// 测试：没有参考片段或代码为空时不可疑
TEST_F(PlagiarismTest, NoReferenceAvailable) {
    FraudCheck c = detector.detect(COPIED_TWO_SUM, 42);
    EXPECT_FALSE(c.is_suspicious);
    EXPECT_EQ(c.detail, "no reference available");

    FraudCheck e = detector.detect("", 1);
    EXPECT_FALSE(e.is_suspicious);
    EXPECT_EQ(e.detail, "no reference available");
}

//==============================================================================
// 用时检测
//==============================================================================

class TimingTest : public ::testing::Test {
protected:
    FraudPolicy policy;
    TimingAnomalyDetector detector{policy};
};

// 测试：缺少时间戳时不判断
TEST_F(TimingTest, MissingTimestamps) {
    FraudCheck c = detector.detect(std::nullopt, at("2024-01-01T10:00:00"), "easy", 3);
    EXPECT_EQ(c.kind, CheckKind::TIMING);
    EXPECT_FALSE(c.is_suspicious);
    EXPECT_EQ(c.detail, "timing data not available");
}

// 测试：只有日期的结束时间无法解析，按缺失处理而不是算出负的用时
TEST_F(TimingTest, TruncatedTimestampIsMissing) {
    FraudCheck c = detector.detect(parse_iso8601("2024-03-01T10:00:00"),
                                   parse_iso8601("2024-03-01"), "easy", 1);
    EXPECT_FALSE(c.is_suspicious);
    EXPECT_EQ(c.detail, "timing data not available");
}

// 测试：3 道 medium 题 2 分钟完成，阈值 6 分钟
TEST_F(TimingTest, TooFastIsSuspicious) {
    FraudCheck c = detector.detect(at("2024-01-01T10:00:00"), at("2024-01-01T10:02:00"),
                                   "medium", 3);
    EXPECT_TRUE(c.is_suspicious);
    EXPECT_DOUBLE_EQ(c.metric, 2.0);
    EXPECT_EQ(c.detail, "completed in 2.0min (expected minimum: 30min)");
}

// 测试：正常用时
TEST_F(TimingTest, NormalTiming) {
    FraudCheck c = detector.detect(at("2024-01-01T10:00:00"), at("2024-01-01T10:45:00"),
                                   "hard", 2);
    EXPECT_FALSE(c.is_suspicious);
    EXPECT_DOUBLE_EQ(c.metric, 45.0);
    EXPECT_EQ(c.detail, "timing appears normal");
}

// 测试：恰好等于阈值不算可疑；未知难度按每题 10 分钟
TEST_F(TimingTest, ThresholdAndDefaultDifficulty) {
    EXPECT_EQ(detector.expected_minimum("easy", 2), 10);
    EXPECT_EQ(detector.expected_minimum("unknown", 2), 20);

    // easy x 5 = 25 分钟，阈值 5 分钟
    FraudCheck c = detector.detect(at("2024-01-01T10:00:00"), at("2024-01-01T10:05:00"),
                                   "easy", 5);
    EXPECT_FALSE(c.is_suspicious);
}

//==============================================================================
// 简历检查
//==============================================================================

class ResumeCheckTest : public ::testing::Test {
protected:
    FraudPolicy policy;
    ResumeAuthenticityChecker checker{policy};
};

TEST_F(ResumeCheckTest, AuthenticResume) {
    ResumeData r;
    r.skills = {"python", "sql"};
    r.experience = 3;
    r.projects = 1;
    FraudCheck c = checker.check(r);
    EXPECT_EQ(c.kind, CheckKind::RESUME_AUTHENTICITY);
    EXPECT_FALSE(c.is_suspicious);
    EXPECT_TRUE(c.issues.empty());
    EXPECT_EQ(c.detail, "resume appears authentic");
}

// 测试：三项同时命中，按顺序以 "; " 连接
TEST_F(ResumeCheckTest, AllFlags) {
    ResumeData r;
    for (int i = 0; i < 16; i++) {
        r.skills.insert("skill" + std::to_string(i));
    }
    r.experience = 31;
    r.projects = 0;
    FraudCheck c = checker.check(r);
    EXPECT_TRUE(c.is_suspicious);
    ASSERT_EQ(c.issues.size(), 3u);
    EXPECT_EQ(c.detail, "excessive skills (16); unrealistic experience (31 years); "
                        "experience/project mismatch");
}

// 测试：边界值 15 个技能、30 年、5 年不触发
TEST_F(ResumeCheckTest, BoundariesNotFlagged) {
    ResumeData r;
    for (int i = 0; i < 15; i++) {
        r.skills.insert("skill" + std::to_string(i));
    }
    r.experience = 5;
    r.projects = 0;
    EXPECT_FALSE(checker.check(r).is_suspicious);

    r.experience = 6;
    FraudCheck c = checker.check(r);
    EXPECT_TRUE(c.is_suspicious);
    EXPECT_EQ(c.detail, "experience/project mismatch");
}

//==============================================================================
// 评分
//==============================================================================

TEST(FraudScorerTest, EmptyChecksScoreZero) {
    FraudScorer scorer;
    FraudReport r = scorer.score({});
    EXPECT_EQ(r.fraud_score, 0);
    EXPECT_EQ(r.risk_level, RiskLevel::LOW);
    EXPECT_EQ(r.summary, "Fraud risk: 0/100 - 0 suspicious indicators found");
}

// 测试：1/3 可疑且为抄袭：33.3 + 20 = 53，MEDIUM
TEST(FraudScorerTest, PlagiarismBonusAppliedOnce) {
    FraudScorer scorer;
    FraudReport r = scorer.score({suspicious(CheckKind::PLAGIARISM),
                                  clean(CheckKind::PLAGIARISM),
                                  clean(CheckKind::RESUME_AUTHENTICITY)});
    EXPECT_EQ(r.fraud_score, 53);
    EXPECT_EQ(r.risk_level, RiskLevel::MEDIUM);

    FraudReport two = scorer.score({suspicious(CheckKind::PLAGIARISM),
                                    suspicious(CheckKind::PLAGIARISM),
                                    clean(CheckKind::RESUME_AUTHENTICITY),
                                    clean(CheckKind::TIMING)});
    EXPECT_EQ(two.fraud_score, 70);
    EXPECT_EQ(two.risk_level, RiskLevel::MEDIUM);
    EXPECT_EQ(two.summary, "Fraud risk: 70/100 - 2 suspicious indicators found");
}

// 测试：上限 100
TEST(FraudScorerTest, CappedAtHundred) {
    FraudScorer scorer;
    FraudReport r = scorer.score({suspicious(CheckKind::PLAGIARISM),
                                  suspicious(CheckKind::TIMING)});
    EXPECT_EQ(r.fraud_score, 100);
    EXPECT_EQ(r.risk_level, RiskLevel::HIGH);
}

// 测试：可疑项越多分数越高
TEST(FraudScorerTest, MonotonicInSuspiciousChecks) {
    FraudScorer scorer;
    std::vector<CheckKind> kinds = {CheckKind::RESUME_AUTHENTICITY, CheckKind::TIMING,
                                    CheckKind::PLAGIARISM, CheckKind::PLAGIARISM};
    int previous = -1;
    for (size_t n = 0; n <= kinds.size(); n++) {
        std::vector<FraudCheck> checks;
        for (size_t i = 0; i < kinds.size(); i++) {
            checks.push_back(i < n ? suspicious(kinds[i]) : clean(kinds[i]));
        }
        int score = scorer.fraud_score(checks);
        EXPECT_GE(score, previous) << n << " suspicious";
        EXPECT_GE(score, 0);
        EXPECT_LE(score, 100);
        previous = score;
    }
}

// 测试：风险等级只由分数决定
TEST(FraudScorerTest, RiskLevels) {
    FraudPolicy p;
    EXPECT_EQ(p.risk_for(0), RiskLevel::LOW);
    EXPECT_EQ(p.risk_for(40), RiskLevel::LOW);
    EXPECT_EQ(p.risk_for(41), RiskLevel::MEDIUM);
    EXPECT_EQ(p.risk_for(70), RiskLevel::MEDIUM);
    EXPECT_EQ(p.risk_for(71), RiskLevel::HIGH);
}

//==============================================================================
// 完整流程
//==============================================================================

class FraudPipelineTest : public ::testing::Test {
protected:
    ReferenceCatalog refs = sample_references();
    FraudPipeline pipeline{refs, FraudPolicy()};
};

// 测试：简历 + 每份提交 + 用时，顺序固定
TEST_F(FraudPipelineTest, ChecksInOrder) {
    SubmissionMap subs = {{2, "def isValid(s):\n    return True\n"}, {1, COPIED_TWO_SUM}};
    TimingData timing;
    timing.start_time = at("2024-01-01T10:00:00");
    timing.end_time = at("2024-01-01T11:00:00");

    FraudReport r = pipeline.run(subs, ResumeData(), timing);
    ASSERT_EQ(r.checks.size(), 4u);
    EXPECT_EQ(r.checks[0].kind, CheckKind::RESUME_AUTHENTICITY);
    EXPECT_EQ(r.checks[1].kind, CheckKind::PLAGIARISM);
    EXPECT_TRUE(r.checks[1].is_suspicious);
    EXPECT_EQ(r.checks[2].kind, CheckKind::PLAGIARISM);
    EXPECT_FALSE(r.checks[2].is_suspicious);
    EXPECT_EQ(r.checks[3].kind, CheckKind::TIMING);
    EXPECT_FALSE(r.checks[3].is_suspicious);

    // 1/4 = 25 + 20 = 45
    EXPECT_EQ(r.fraud_score, 45);
    EXPECT_EQ(r.risk_level, RiskLevel::MEDIUM);
}

// 测试：没有计时信息时不做用时检查
TEST_F(FraudPipelineTest, NoTimingCheckWithoutTimingData) {
    FraudReport r = pipeline.run({}, ResumeData());
    ASSERT_EQ(r.checks.size(), 1u);
    EXPECT_EQ(r.fraud_score, 0);
    EXPECT_EQ(r.summary, "Fraud risk: 0/100 - 0 suspicious indicators found");
}

// 测试：计时信息存在但时间戳缺失
TEST_F(FraudPipelineTest, TimingDataWithoutTimestamps) {
    FraudReport r = pipeline.run({{1, "def twoSum(a, b):\n    pass\n"}}, ResumeData(), TimingData());
    ASSERT_EQ(r.checks.size(), 3u);
    EXPECT_EQ(r.checks[2].detail, "timing data not available");
}
