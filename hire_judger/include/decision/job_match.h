/**
 * @file job_match.h
 * @brief 职位要求匹配
 */

#ifndef HIRE_DECISION_JOB_MATCH_H
#define HIRE_DECISION_JOB_MATCH_H

#include <string>
#include <algorithm>
#include <iterator>

#include "core/types.h"
#include "core/utils.h"

namespace hire {

class JobRequirementMatcher {
public:
    /// 技能匹配率低于该值时不满足要求
    static constexpr double MIN_SKILL_MATCH = 50;

    /**
     * @brief 技能交集/差集、匹配率（未要求技能时为 100）与门槛判断
     */
    static JobMatch match(const JobRequirements &job, int final_score, int fraud_score) {
        JobMatch m;
        std::set_intersection(job.skills.begin(), job.skills.end(),
                              job.candidate_skills.begin(), job.candidate_skills.end(),
                              std::back_inserter(m.matched_skills));
        std::set_difference(job.skills.begin(), job.skills.end(),
                            job.candidate_skills.begin(), job.candidate_skills.end(),
                            std::back_inserter(m.missing_skills));

        if (job.skills.empty()) {
            m.skill_match_percentage = 100;
        } else {
            m.skill_match_percentage = round_to(
                100.0 * m.matched_skills.size() / job.skills.size(), 2);
        }

        m.meets_requirements = final_score >= job.min_score
            && fraud_score <= job.risk_tolerance
            && m.skill_match_percentage >= MIN_SKILL_MATCH;
        m.score_vs_minimum = std::to_string(final_score) + "/" + std::to_string(job.min_score);
        m.fraud_vs_tolerance = std::to_string(fraud_score) + "/" + std::to_string(job.risk_tolerance);
        return m;
    }
};

} // namespace hire

#endif // HIRE_DECISION_JOB_MATCH_H
