/**
 * @file state_machine.h
 * @brief 招聘阶段流转与录用建议
 *
 * 阶段：
 *   Resume Screening -> Coding Assessment -> Technical Interview
 *   -> Behavioral Interview -> Final Decision
 * 另有 Manual Review、若干 "REJECTED - <原因>" 终止状态，
 * 无法识别的阶段名得到 "Unknown Stage"。
 *
 * fraud_score 超过阈值时直接拒绝，不看其它分数。
 */

#ifndef HIRE_DECISION_STATE_MACHINE_H
#define HIRE_DECISION_STATE_MACHINE_H

#include <string>
#include <vector>
#include <optional>

#include "core/types.h"
#include "core/policy.h"
#include "core/eval_logger.h"
#include "decision/job_match.h"

namespace hire {

class DecisionStateMachine {
private:
    ScoringPolicy policy_;

    static std::string score_text(int score) {
        return "(score: " + std::to_string(score) + "/100)";
    }

    struct Outcome {
        Decision decision;
        std::string verdict;
        std::vector<std::string> next_steps;
    };

    Outcome outcome_for(int final_score, int fraud_score) const {
        if (fraud_score > policy_.fraud_reject) {
            return {Decision::REJECT, "High fraud risk detected",
                    {"Flag for manual review", "Do not proceed with interview"}};
        }
        if (final_score >= policy_.advance_score) {
            return {Decision::STRONG_HIRE, "Excellent candidate - highly recommended",
                    {"Schedule technical interview", "Fast-track to hiring manager"}};
        }
        if (final_score >= policy_.review_score) {
            return {Decision::PROCEED_WITH_CAUTION, "Borderline candidate - requires manual review",
                    {"Manual review by senior engineer", "Additional screening may be needed"}};
        }
        if (final_score >= policy_.weak_score) {
            return {Decision::WEAK_CANDIDATE, "Below threshold but not auto-rejected",
                    {"Consider for junior positions", "May need additional training"}};
        }
        return {Decision::REJECT, "Does not meet minimum requirements",
                {"Send rejection email", "Keep in talent pool for future opportunities"}};
    }

public:
    explicit DecisionStateMachine(const ScoringPolicy &policy = ScoringPolicy()) : policy_(policy) {}

    const ScoringPolicy& policy() const { return policy_; }

    /**
     * @brief 加权综合分，没有编程分时只用简历分和反作弊分
     */
    int final_score(int resume_score, std::optional<int> coding_score, int fraud_score) const {
        double v;
        if (!coding_score) {
            v = resume_score * policy_.weight_resume_only
                + (100 - fraud_score) * policy_.weight_fraud_only;
        } else {
            v = resume_score * policy_.weight_resume
                + *coding_score * policy_.weight_coding
                + (100 - fraud_score) * policy_.weight_fraud;
        }
        return clamp_score(v);
    }

    std::string next_stage(const std::string &current_stage, int resume_score,
                           std::optional<int> coding_score, int final_score,
                           int fraud_score) const {
        if (fraud_score > policy_.fraud_reject) {
            return stage::REJECTED_FRAUD;
        }
        if (current_stage == stage::RESUME_SCREENING) {
            if (resume_score < policy_.resume_reject) {
                return stage::REJECTED_LOW_RESUME;
            }
            return stage::CODING_ASSESSMENT;
        }
        if (current_stage == stage::CODING_ASSESSMENT) {
            if (!coding_score) {
                return stage::CODING_ASSESSMENT;
            }
            if (*coding_score < policy_.coding_reject) {
                return stage::REJECTED_FAILED_CODING;
            }
            if (final_score >= policy_.advance_score) {
                return stage::TECHNICAL_INTERVIEW;
            }
            if (final_score >= policy_.review_score) {
                return stage::MANUAL_REVIEW;
            }
            return stage::REJECTED_LOW_OVERALL;
        }
        if (current_stage == stage::TECHNICAL_INTERVIEW) {
            return stage::BEHAVIORAL_INTERVIEW;
        }
        if (current_stage == stage::BEHAVIORAL_INTERVIEW) {
            return stage::FINAL_DECISION;
        }
        return stage::UNKNOWN;
    }

    /**
     * @brief 录用建议：决定、结论、优劣势与后续步骤
     *
     * next_stage 和 job_match 不在这里填。
     */
    DecisionRecord recommend(int resume_score, std::optional<int> coding_score,
                             int fraud_score, int final_score) const {
        DecisionRecord rec;
        rec.final_score = final_score;

        if (resume_score >= policy_.strength_band) {
            rec.strengths.push_back("Strong resume " + score_text(resume_score));
        } else if (resume_score >= policy_.neutral_band) {
            rec.reasons.push_back("Decent resume " + score_text(resume_score));
        } else {
            rec.weaknesses.push_back("Weak resume " + score_text(resume_score));
        }

        if (coding_score) {
            int c = *coding_score;
            if (c >= policy_.strength_band) {
                rec.strengths.push_back("Excellent coding skills " + score_text(c));
            } else if (c >= policy_.neutral_band) {
                rec.reasons.push_back("Adequate coding skills " + score_text(c));
            } else {
                rec.weaknesses.push_back("Poor coding performance " + score_text(c));
            }
        }

        if (fraud_score > policy_.fraud_reject) {
            rec.weaknesses.push_back("HIGH fraud risk " + score_text(fraud_score));
        } else if (fraud_score > policy_.fraud_neutral_band) {
            rec.reasons.push_back("MEDIUM fraud risk " + score_text(fraud_score));
        } else {
            rec.strengths.push_back("Low fraud risk " + score_text(fraud_score));
        }

        Outcome out = outcome_for(final_score, fraud_score);
        rec.decision = out.decision;
        rec.verdict = out.verdict;
        rec.next_steps = out.next_steps;
        rec.summary = std::string(decision_to_string(rec.decision)) + ": " + rec.verdict
            + " (Final Score: " + std::to_string(final_score) + "/100)";
        return rec;
    }

    /**
     * @brief 综合分、阶段流转、录用建议，有职位要求时附带匹配结果
     */
    DecisionRecord decide(const std::string &current_stage, int resume_score,
                          std::optional<int> coding_score, int fraud_score,
                          const std::optional<JobRequirements> &job = std::nullopt) const {
        resume_score = clamp_score(resume_score);
        if (coding_score) {
            coding_score = clamp_score(*coding_score);
        }
        fraud_score = clamp_score(fraud_score);

        int fs = final_score(resume_score, coding_score, fraud_score);
        DecisionRecord rec = recommend(resume_score, coding_score, fraud_score, fs);
        rec.next_stage = next_stage(current_stage, resume_score, coding_score, fs, fraud_score);
        if (job) {
            rec.job_match = JobRequirementMatcher::match(*job, fs, fraud_score);
        }

        DLOG_INFO << "stage '" << current_stage << "' -> '" << rec.next_stage << "', "
                  << rec.summary;
        if (stage::is_rejected(rec.next_stage)) {
            DLOG_WARN << "candidate rejected: " << rec.next_stage;
        }
        return rec;
    }
};

} // namespace hire

#endif // HIRE_DECISION_STATE_MACHINE_H
