/**
 * @file policy.h
 * @brief 可配置的阈值与权重
 *
 * 所有启发式规则的常量都集中在这里，由 Config 覆盖默认值。
 * 默认值即线上使用的规则。
 */

#ifndef HIRE_CORE_POLICY_H
#define HIRE_CORE_POLICY_H

#include <string>
#include <thread>
#include "core/config.h"
#include "core/types.h"

namespace hire {

/**
 * @brief 代码执行限制
 */
struct ExecutorOptions {
    std::string python_path = "/usr/bin/python3";
    int time_limit_ms = 5000;       ///< 墙钟超时
    int memory_limit_mb = 512;      ///< RLIMIT_AS
    int output_limit_kb = 1024;     ///< RLIMIT_FSIZE
    int capture_limit_kb = 64;      ///< stdout/stderr 各自最多保留的字节数
    int error_limit = 2000;         ///< 展示给考生的错误文本最大长度
    std::string scratch_dir = "/tmp";

    static ExecutorOptions from_config(const Config &config) {
        ExecutorOptions o;
        o.python_path = config.get_str("python_path", o.python_path);
        o.time_limit_ms = config.get_int("time_limit_ms", o.time_limit_ms);
        o.memory_limit_mb = config.get_int("memory_limit_mb", o.memory_limit_mb);
        o.output_limit_kb = config.get_int("output_limit_kb", o.output_limit_kb);
        o.capture_limit_kb = config.get_int("capture_limit_kb", o.capture_limit_kb);
        o.error_limit = config.get_int("error_limit", o.error_limit);
        o.scratch_dir = config.get_str("scratch_dir", o.scratch_dir);
        return o;
    }
};

/**
 * @brief 评测线程数，0 表示按 CPU 数
 */
inline unsigned worker_threads_from_config(const Config &config) {
    int n = config.get_int("worker_threads", 0);
    if (n > 0) {
        return static_cast<unsigned>(n);
    }
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 2 : hw;
}

/**
 * @brief 反作弊规则
 */
struct FraudPolicy {
    // 抄袭
    double plagiarism_threshold = 80;   ///< 相似度严格大于该值视为可疑
    int plagiarism_bonus = 20;          ///< 存在可疑抄袭时的额外加分（只加一次）

    // 答题用时（分钟/题）
    double timing_ratio = 0.2;
    int minutes_easy = 5;
    int minutes_medium = 10;
    int minutes_hard = 20;
    int minutes_default = 10;

    // 简历
    int max_skills = 15;
    int max_experience = 30;
    int mismatch_experience = 5;
    int min_projects = 2;

    // 风险等级
    int risk_high = 70;
    int risk_medium = 40;

    int minutes_per_question(const std::string &difficulty) const {
        switch (parse_difficulty(difficulty)) {
            case Difficulty::EASY: return minutes_easy;
            case Difficulty::MEDIUM: return minutes_medium;
            case Difficulty::HARD: return minutes_hard;
            default: return minutes_default;
        }
    }

    RiskLevel risk_for(int fraud_score) const {
        if (fraud_score > risk_high) return RiskLevel::HIGH;
        if (fraud_score > risk_medium) return RiskLevel::MEDIUM;
        return RiskLevel::LOW;
    }

    static FraudPolicy from_config(const Config &config) {
        FraudPolicy p;
        p.plagiarism_threshold = config.get_double("plagiarism_threshold", p.plagiarism_threshold);
        p.plagiarism_bonus = config.get_int("plagiarism_bonus", p.plagiarism_bonus);
        p.timing_ratio = config.get_double("timing_ratio", p.timing_ratio);
        p.minutes_easy = config.get_int("minutes_easy", p.minutes_easy);
        p.minutes_medium = config.get_int("minutes_medium", p.minutes_medium);
        p.minutes_hard = config.get_int("minutes_hard", p.minutes_hard);
        p.minutes_default = config.get_int("minutes_default", p.minutes_default);
        p.max_skills = config.get_int("max_skills", p.max_skills);
        p.max_experience = config.get_int("max_experience", p.max_experience);
        p.mismatch_experience = config.get_int("mismatch_experience", p.mismatch_experience);
        p.min_projects = config.get_int("min_projects", p.min_projects);
        p.risk_high = config.get_int("risk_high", p.risk_high);
        p.risk_medium = config.get_int("risk_medium", p.risk_medium);
        return p;
    }
};

/**
 * @brief 综合评分权重与阶段阈值
 */
struct ScoringPolicy {
    // 有编程分时
    double weight_resume = 0.3;
    double weight_coding = 0.5;
    double weight_fraud = 0.2;       ///< 作用于 (100 - fraud_score)

    // 还没有编程分时
    double weight_resume_only = 0.7;
    double weight_fraud_only = 0.3;

    int fraud_reject = 70;           ///< fraud_score 严格大于该值直接拒绝
    int resume_reject = 40;
    int coding_reject = 30;
    int advance_score = 75;          ///< 进入技术面 / STRONG HIRE
    int review_score = 60;           ///< 人工复核 / PROCEED WITH CAUTION
    int weak_score = 40;             ///< WEAK CANDIDATE

    // 优劣势分档
    int strength_band = 70;
    int neutral_band = 50;
    int fraud_neutral_band = 40;

    static ScoringPolicy from_config(const Config &config) {
        ScoringPolicy p;
        p.weight_resume = config.get_double("weight_resume", p.weight_resume);
        p.weight_coding = config.get_double("weight_coding", p.weight_coding);
        p.weight_fraud = config.get_double("weight_fraud", p.weight_fraud);
        p.weight_resume_only = config.get_double("weight_resume_only", p.weight_resume_only);
        p.weight_fraud_only = config.get_double("weight_fraud_only", p.weight_fraud_only);
        p.fraud_reject = config.get_int("fraud_reject", p.fraud_reject);
        p.resume_reject = config.get_int("resume_reject", p.resume_reject);
        p.coding_reject = config.get_int("coding_reject", p.coding_reject);
        p.advance_score = config.get_int("advance_score", p.advance_score);
        p.review_score = config.get_int("review_score", p.review_score);
        p.weak_score = config.get_int("weak_score", p.weak_score);
        p.strength_band = config.get_int("strength_band", p.strength_band);
        p.neutral_band = config.get_int("neutral_band", p.neutral_band);
        p.fraud_neutral_band = config.get_int("fraud_neutral_band", p.fraud_neutral_band);
        return p;
    }
};

} // namespace hire

#endif // HIRE_CORE_POLICY_H
