/**
 * @file scorer.h
 * @brief 反作弊总分
 *
 * base = 100 × 可疑项数 / 总项数；存在可疑的抄袭检查时再加一次 bonus，
 * 上限 100，截断为整数。风险等级只由总分决定。
 */

#ifndef HIRE_FRAUD_SCORER_H
#define HIRE_FRAUD_SCORER_H

#include <vector>
#include <string>
#include <algorithm>

#include "core/types.h"
#include "core/policy.h"
#include "core/eval_logger.h"

namespace hire {

class FraudScorer {
private:
    FraudPolicy policy_;

public:
    explicit FraudScorer(const FraudPolicy &policy = FraudPolicy()) : policy_(policy) {}

    int fraud_score(const std::vector<FraudCheck> &checks) const {
        if (checks.empty()) {
            return 0;
        }
        int suspicious = 0;
        bool plagiarism = false;
        for (const auto &c : checks) {
            if (!c.is_suspicious) continue;
            suspicious++;
            if (c.kind == CheckKind::PLAGIARISM) plagiarism = true;
        }
        double base = 100.0 * suspicious / checks.size();
        if (plagiarism) {
            base = std::min(base + policy_.plagiarism_bonus, 100.0);
        }
        return clamp_score(base);
    }

    FraudReport score(std::vector<FraudCheck> checks) const {
        FraudReport report;
        report.fraud_score = fraud_score(checks);
        report.risk_level = policy_.risk_for(report.fraud_score);

        int suspicious = static_cast<int>(std::count_if(checks.begin(), checks.end(),
            [](const FraudCheck &c) { return c.is_suspicious; }));
        report.summary = "Fraud risk: " + std::to_string(report.fraud_score) + "/100 - "
            + std::to_string(suspicious) + " suspicious indicators found";
        report.checks = std::move(checks);

        FLOG_INFO << report.summary << " (" << risk_to_string(report.risk_level) << ")";
        return report;
    }
};

} // namespace hire

#endif // HIRE_FRAUD_SCORER_H
