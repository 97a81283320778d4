/**
 * @file report.h
 * @brief 评估结果输出
 *
 * 把评测报告、反作弊报告、决策记录渲染成 JSON，
 * 写入 result_path/result.json，进度写入 result_path/cur_status.txt。
 */

#ifndef HIRE_CORE_REPORT_H
#define HIRE_CORE_REPORT_H

#include <string>
#include <cstdio>
#include <unistd.h>
#include <sys/file.h>

#include "core/types.h"
#include "core/error.h"
#include "core/utils.h"

namespace hire {

//==============================================================================
// JSON 渲染
//==============================================================================

inline Value to_json(const ExecutionResult &r) {
    Value j;
    j["question_id"] = r.question_id;
    j["title"] = r.title;
    j["test_index"] = r.test_index;
    j["passed"] = r.passed;
    j["output"] = r.raw_output;
    j["error"] = r.error ? Value(*r.error) : Value(nullptr);
    j["expected"] = r.expected;
    j["status"] = status_to_string(r.status);
    j["time_ms"] = r.wall_time_ms;
    return j;
}

inline Value to_json(const TestSummary &s) {
    return {
        {"total_tests", s.total_tests},
        {"passed_tests", s.passed_tests},
        {"failed_tests", s.failed_tests},
        {"pass_rate", s.pass_rate}
    };
}

inline Value to_json(const GradingReport &report, const TestSummary &summary) {
    Value j;
    j["score"] = report.score;
    j["passed"] = report.passed;
    j["total"] = report.total;
    j["summary"] = to_json(summary);
    j["results"] = Value::array();
    for (const auto &r : report.per_test) {
        j["results"].push_back(to_json(r));
    }
    return j;
}

inline Value to_json(const FraudCheck &c) {
    Value j;
    j["kind"] = check_kind_to_string(c.kind);
    j["is_suspicious"] = c.is_suspicious;
    j["reason"] = c.detail;
    switch (c.kind) {
        case CheckKind::PLAGIARISM:
            j["similarity_score"] = c.metric;
            break;
        case CheckKind::TIMING:
            j["time_taken_minutes"] = c.metric;
            break;
        case CheckKind::RESUME_AUTHENTICITY:
            j["issues"] = c.issues;
            break;
    }
    return j;
}

inline Value to_json(const FraudReport &report) {
    Value j;
    j["fraud_score"] = report.fraud_score;
    j["risk_level"] = risk_to_string(report.risk_level);
    j["checks"] = Value::array();
    for (const auto &c : report.checks) {
        j["checks"].push_back(to_json(c));
    }
    j["summary"] = report.summary;
    return j;
}

inline Value to_json(const JobMatch &m) {
    return {
        {"meets_requirements", m.meets_requirements},
        {"skill_match_percentage", m.skill_match_percentage},
        {"matched_skills", m.matched_skills},
        {"missing_skills", m.missing_skills},
        {"score_vs_minimum", m.score_vs_minimum},
        {"fraud_vs_tolerance", m.fraud_vs_tolerance}
    };
}

inline Value to_json(const DecisionRecord &rec) {
    Value recommendation;
    recommendation["decision"] = decision_to_string(rec.decision);
    recommendation["verdict"] = rec.verdict;
    recommendation["final_score"] = rec.final_score;
    recommendation["strengths"] = rec.strengths;
    recommendation["weaknesses"] = rec.weaknesses;
    recommendation["reasons"] = rec.reasons;
    recommendation["next_steps"] = rec.next_steps;
    recommendation["recommendation_summary"] = rec.summary;

    Value j;
    j["final_score"] = rec.final_score;
    j["recommendation"] = recommendation;
    j["next_stage"] = rec.next_stage;
    j["job_match"] = rec.job_match ? to_json(*rec.job_match) : Value(nullptr);
    return j;
}

//==============================================================================
// 结果文件
//==============================================================================

/**
 * @brief 缩进两格输出，考生输出中的非法 UTF-8 字节替换为 U+FFFD
 */
inline std::string render_json(const Value &j) {
    return j.dump(2, ' ', false, Value::error_handler_t::replace) + "\n";
}

class ResultWriter {
private:
    std::string result_path_;

public:
    explicit ResultWriter(const std::string &result_path) : result_path_(result_path) {}

    const std::string& result_path() const { return result_path_; }

    Result<void> write_ok(const Value &result) const {
        return write_file(result_path_ + "/result.json", render_json(result));
    }

    Result<void> write_failed(const Error &err) const {
        Value j;
        j["error"] = {
            {"code", error_code_str(err.code())},
            {"message", err.message()},
            {"context", err.context()}
        };
        return write_file(result_path_ + "/result.json", render_json(j));
    }

    /**
     * @brief 覆盖写入当前进度，加锁防止读到半行
     */
    void report_status(const std::string &status) const {
        FILE *f = fopen((result_path_ + "/cur_status.txt").c_str(), "a");
        if (f == NULL) {
            return;
        }
        if (flock(fileno(f), LOCK_EX) != -1) {
            if (ftruncate(fileno(f), 0) != -1) {
                fprintf(f, "%s\n", status.c_str());
                fflush(f);
            }
            flock(fileno(f), LOCK_UN);
        }
        fclose(f);
    }
};

} // namespace hire

#endif // HIRE_CORE_REPORT_H
