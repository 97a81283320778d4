/**
 * @file timing.h
 * @brief 答题用时异常检测
 *
 * 期望最短用时 = 每题分钟数(按难度) × 题数，
 * 实际用时低于其 timing_ratio（默认 20%）视为可疑。
 */

#ifndef HIRE_FRAUD_TIMING_H
#define HIRE_FRAUD_TIMING_H

#include <string>
#include <optional>

#include "core/types.h"
#include "core/policy.h"
#include "core/utils.h"
#include "core/eval_logger.h"
#include "fraud/check.h"

namespace hire {

class TimingAnomalyDetector {
private:
    FraudPolicy policy_;

public:
    explicit TimingAnomalyDetector(const FraudPolicy &policy) : policy_(policy) {}

    int expected_minimum(const std::string &difficulty, int num_questions) const {
        return policy_.minutes_per_question(difficulty) * num_questions;
    }

    FraudCheck detect(const std::optional<TimePoint> &start_time,
                      const std::optional<TimePoint> &end_time,
                      const std::string &difficulty, int num_questions) const {
        if (!start_time || !end_time) {
            return FraudCheck::clean(CheckKind::TIMING, "timing data not available");
        }

        double taken = minutes_between(*start_time, *end_time);
        int expected = expected_minimum(difficulty, num_questions);
        double threshold = expected * policy_.timing_ratio;

        FraudCheck c;
        c.kind = CheckKind::TIMING;
        c.metric = round_to(taken, 2);
        c.is_suspicious = taken < threshold;
        if (c.is_suspicious) {
            c.detail = "completed in " + format_fixed(taken, 1) + "min (expected minimum: "
                + std::to_string(expected) + "min)";
        } else {
            c.detail = "timing appears normal";
        }

        FLOG_INFO << "timing: " << c.metric << " min for " << num_questions << " "
                  << difficulty << " questions (threshold " << threshold << ")"
                  << (c.is_suspicious ? " SUSPICIOUS" : "");
        return c;
    }
};

class TimingCheck : public FraudCheckStrategy {
private:
    const TimingAnomalyDetector &detector_;
    TimingData timing_;
    int num_questions_;

public:
    TimingCheck(const TimingAnomalyDetector &detector, const TimingData &timing, int num_questions)
        : detector_(detector), timing_(timing), num_questions_(num_questions) {}

    CheckKind kind() const override { return CheckKind::TIMING; }

    FraudCheck evaluate() const override {
        return detector_.detect(timing_.start_time, timing_.end_time,
                                timing_.difficulty, num_questions_);
    }
};

} // namespace hire

#endif // HIRE_FRAUD_TIMING_H
