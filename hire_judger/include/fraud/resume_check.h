/**
 * @file resume_check.h
 * @brief 简历真实性检查
 */

#ifndef HIRE_FRAUD_RESUME_CHECK_H
#define HIRE_FRAUD_RESUME_CHECK_H

#include <string>
#include <vector>

#include "core/types.h"
#include "core/policy.h"
#include "core/utils.h"
#include "core/eval_logger.h"
#include "fraud/check.h"

namespace hire {

class ResumeAuthenticityChecker {
private:
    FraudPolicy policy_;

public:
    explicit ResumeAuthenticityChecker(const FraudPolicy &policy) : policy_(policy) {}

    FraudCheck check(const ResumeData &resume) const {
        FraudCheck c;
        c.kind = CheckKind::RESUME_AUTHENTICITY;

        int skills = static_cast<int>(resume.skills.size());
        if (skills > policy_.max_skills) {
            c.issues.push_back("excessive skills (" + std::to_string(skills) + ")");
        }
        if (resume.experience > policy_.max_experience) {
            c.issues.push_back("unrealistic experience ("
                + std::to_string(resume.experience) + " years)");
        }
        if (resume.experience > policy_.mismatch_experience
                && resume.projects < policy_.min_projects) {
            c.issues.push_back("experience/project mismatch");
        }

        c.is_suspicious = !c.issues.empty();
        c.metric = static_cast<double>(c.issues.size());
        c.detail = c.is_suspicious ? join(c.issues, "; ") : "resume appears authentic";

        FLOG_INFO << "resume: " << c.detail;
        return c;
    }
};

class ResumeCheck : public FraudCheckStrategy {
private:
    const ResumeAuthenticityChecker &checker_;
    ResumeData resume_;

public:
    ResumeCheck(const ResumeAuthenticityChecker &checker, const ResumeData &resume)
        : checker_(checker), resume_(resume) {}

    CheckKind kind() const override { return CheckKind::RESUME_AUTHENTICITY; }

    FraudCheck evaluate() const override {
        return checker_.check(resume_);
    }
};

} // namespace hire

#endif // HIRE_FRAUD_RESUME_CHECK_H
