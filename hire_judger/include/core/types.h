/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * 评估引擎使用的所有基础数据结构：
 * - Question / TestCase / Submission: 题目与提交
 * - ExecutionResult / GradingReport: 评测结果
 * - FraudCheck / FraudReport: 反作弊结果
 * - DecisionRecord: 最终决策
 */

#ifndef HIRE_CORE_TYPES_H
#define HIRE_CORE_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace hire {

/// 测试数据中的任意值（标量或结构）
using Value = nlohmann::json;

using TimePoint = std::chrono::system_clock::time_point;

//==============================================================================
// 题目与提交
//==============================================================================

enum class Difficulty {
    EASY,
    MEDIUM,
    HARD,
    UNKNOWN
};

inline const char* difficulty_to_string(Difficulty d) {
    switch (d) {
        case Difficulty::EASY:   return "easy";
        case Difficulty::MEDIUM: return "medium";
        case Difficulty::HARD:   return "hard";
        default:                 return "unknown";
    }
}

inline Difficulty parse_difficulty(const std::string &s) {
    if (s == "easy") return Difficulty::EASY;
    if (s == "medium") return Difficulty::MEDIUM;
    if (s == "hard") return Difficulty::HARD;
    return Difficulty::UNKNOWN;
}

/**
 * @brief 测试用例
 */
struct TestCase {
    std::map<std::string, Value> input;  ///< 参数名 -> 参数值（按名字传参）
    Value expected_output;
};

/**
 * @brief 编程题
 */
struct Question {
    int id = 0;
    std::string title;
    Difficulty difficulty = Difficulty::MEDIUM;
    std::string description;
    std::string function_signature;
    std::vector<TestCase> test_cases;
};

/**
 * @brief 考生提交
 */
struct Submission {
    int question_id = 0;
    std::string source_code;
};

/// question_id -> 源代码
using SubmissionMap = std::map<int, std::string>;

//==============================================================================
// 执行与评测结果
//==============================================================================

/**
 * @brief 子进程运行状态
 */
enum class RunStatus {
    OK,
    RUNTIME_ERROR,
    TIMEOUT,
    NO_FUNCTION,
    INTERNAL_ERROR
};

inline const char* status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::OK: return "OK";
        case RunStatus::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case RunStatus::TIMEOUT: return "TIMEOUT";
        case RunStatus::NO_FUNCTION: return "NO_FUNCTION";
        case RunStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief 单个测试点的执行结果
 */
struct ExecutionResult {
    bool passed = false;
    std::string raw_output;             ///< 子进程 stdout（已去除首尾空白）
    std::optional<std::string> error;   ///< 故障描述，原样展示给考生
    Value expected;
    RunStatus status = RunStatus::INTERNAL_ERROR;
    int wall_time_ms = -1;

    // 评测报告中的题目关联
    int question_id = 0;
    std::string title;
    int test_index = 0;

    bool timed_out() const { return status == RunStatus::TIMEOUT; }
};

/**
 * @brief 一名考生全部编程题的评测报告
 */
struct GradingReport {
    int score = 0;                           ///< [0,100]
    int passed = 0;
    int total = 0;
    std::vector<ExecutionResult> per_test;   ///< 按 (题目顺序, 测试点序号) 排列
};

/**
 * @brief 评测结果摘要
 */
struct TestSummary {
    int total_tests = 0;
    int passed_tests = 0;
    int failed_tests = 0;
    std::string pass_rate;   ///< "N%"
};

//==============================================================================
// 反作弊
//==============================================================================

enum class CheckKind {
    PLAGIARISM,
    TIMING,
    RESUME_AUTHENTICITY
};

inline const char* check_kind_to_string(CheckKind kind) {
    switch (kind) {
        case CheckKind::PLAGIARISM: return "plagiarism";
        case CheckKind::TIMING: return "timing";
        case CheckKind::RESUME_AUTHENTICITY: return "resume_authenticity";
        default: return "unknown";
    }
}

/**
 * @brief 单项反作弊检查结论
 */
struct FraudCheck {
    CheckKind kind = CheckKind::PLAGIARISM;
    bool is_suspicious = false;
    std::string detail;
    double metric = 0;                 ///< 相似度(%) 或 用时(分钟)，视 kind 而定
    std::vector<std::string> issues;   ///< 简历检查命中的条目

    static FraudCheck clean(CheckKind kind, const std::string &detail) {
        FraudCheck c;
        c.kind = kind;
        c.detail = detail;
        return c;
    }
};

enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH
};

inline const char* risk_to_string(RiskLevel r) {
    switch (r) {
        case RiskLevel::LOW: return "LOW";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::HIGH: return "HIGH";
        default: return "UNKNOWN";
    }
}

struct FraudReport {
    int fraud_score = 0;
    RiskLevel risk_level = RiskLevel::LOW;
    std::vector<FraudCheck> checks;
    std::string summary;
};

/**
 * @brief 简历分析协作方给出的信号
 */
struct ResumeData {
    std::set<std::string> skills;
    int experience = 0;   ///< 年
    int projects = 0;
};

/**
 * @brief 答题计时信息，任一时间戳缺失时不做判断
 */
struct TimingData {
    std::optional<TimePoint> start_time;
    std::optional<TimePoint> end_time;
    std::string difficulty = "medium";
};

//==============================================================================
// 决策
//==============================================================================

namespace stage {
    const std::string RESUME_SCREENING     = "Resume Screening";
    const std::string CODING_ASSESSMENT    = "Coding Assessment";
    const std::string TECHNICAL_INTERVIEW  = "Technical Interview";
    const std::string BEHAVIORAL_INTERVIEW = "Behavioral Interview";
    const std::string FINAL_DECISION       = "Final Decision";
    const std::string MANUAL_REVIEW        = "Manual Review";
    const std::string UNKNOWN              = "Unknown Stage";

    const std::string REJECTED_FRAUD          = "REJECTED - Fraud Risk";
    const std::string REJECTED_LOW_RESUME     = "REJECTED - Low Resume Score";
    const std::string REJECTED_FAILED_CODING  = "REJECTED - Failed Coding";
    const std::string REJECTED_LOW_OVERALL    = "REJECTED - Low Overall Score";

    inline bool is_rejected(const std::string &s) {
        return s.rfind("REJECTED", 0) == 0;
    }
}

enum class Decision {
    STRONG_HIRE,
    PROCEED_WITH_CAUTION,
    WEAK_CANDIDATE,
    REJECT
};

inline const char* decision_to_string(Decision d) {
    switch (d) {
        case Decision::STRONG_HIRE: return "STRONG HIRE";
        case Decision::PROCEED_WITH_CAUTION: return "PROCEED WITH CAUTION";
        case Decision::WEAK_CANDIDATE: return "WEAK CANDIDATE";
        case Decision::REJECT: return "REJECT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief 职位要求
 */
struct JobRequirements {
    std::set<std::string> skills;
    std::set<std::string> candidate_skills;
    int min_score = 60;
    int risk_tolerance = 50;
};

struct JobMatch {
    bool meets_requirements = false;
    double skill_match_percentage = 0;
    std::vector<std::string> matched_skills;
    std::vector<std::string> missing_skills;
    std::string score_vs_minimum;
    std::string fraud_vs_tolerance;
};

/**
 * @brief 最终决策记录，生成后不再修改
 */
struct DecisionRecord {
    int final_score = 0;
    Decision decision = Decision::REJECT;
    std::string verdict;
    std::string next_stage;
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    std::vector<std::string> reasons;
    std::vector<std::string> next_steps;
    std::string summary;
    std::optional<JobMatch> job_match;
};

/**
 * @brief 限制到 [0,100] 后向零截断为整数分
 *
 * 不做舍入：1 * 0.7 + 51 * 0.3 得到 15.999999999999998，结果为 15。
 */
inline int clamp_score(double v) {
    if (v < 0) return 0;
    if (v > 100) return 100;
    return static_cast<int>(v);
}

} // namespace hire

#endif // HIRE_CORE_TYPES_H
