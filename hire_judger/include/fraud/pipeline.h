/**
 * @file pipeline.h
 * @brief 完整的反作弊流程
 *
 * 检查项：
 * - 一项简历真实性检查
 * - 每份提交一项抄袭检查
 * - 有计时信息时一项用时检查（题数 = 提交份数）
 *
 * 各项检查并发执行，全部完成后才计算总分。
 */

#ifndef HIRE_FRAUD_PIPELINE_H
#define HIRE_FRAUD_PIPELINE_H

#include <vector>
#include <future>
#include <memory>
#include <optional>

#include "core/types.h"
#include "core/policy.h"
#include "core/catalog.h"
#include "core/eval_logger.h"
#include "fraud/check.h"
#include "fraud/plagiarism.h"
#include "fraud/timing.h"
#include "fraud/resume_check.h"
#include "fraud/scorer.h"

namespace hire {

class FraudPipeline {
private:
    PlagiarismDetector plagiarism_;
    TimingAnomalyDetector timing_;
    ResumeAuthenticityChecker resume_;
    FraudScorer scorer_;

public:
    FraudPipeline(const ReferenceCatalog &references, const FraudPolicy &policy)
        : plagiarism_(references, policy),
          timing_(policy),
          resume_(policy),
          scorer_(policy) {}

    /**
     * @brief 按输入生成检查项，顺序：简历、各提交（按题号）、用时
     */
    FraudCheckList build_checks(const SubmissionMap &submissions,
                                const ResumeData &resume,
                                const std::optional<TimingData> &timing) const {
        FraudCheckList checks;
        checks.push_back(std::make_unique<ResumeCheck>(resume_, resume));
        for (const auto &kv : submissions) {
            checks.push_back(std::make_unique<PlagiarismCheck>(plagiarism_, kv.second, kv.first));
        }
        if (timing) {
            checks.push_back(std::make_unique<TimingCheck>(timing_, *timing,
                static_cast<int>(submissions.size())));
        }
        return checks;
    }

    /**
     * @brief 并发执行所有检查项，等待全部完成后评分
     */
    FraudReport evaluate(const FraudCheckList &checks) const {
        std::vector<std::future<FraudCheck>> futures;
        futures.reserve(checks.size());
        for (const auto &check : checks) {
            const FraudCheckStrategy *strategy = check.get();
            futures.push_back(std::async(std::launch::async,
                [strategy] { return strategy->evaluate(); }));
        }

        std::vector<FraudCheck> results;
        results.reserve(futures.size());
        for (auto &f : futures) {
            results.push_back(f.get());
        }
        return scorer_.score(std::move(results));
    }

    FraudReport run(const SubmissionMap &submissions,
                    const ResumeData &resume,
                    const std::optional<TimingData> &timing = std::nullopt) const {
        FLOG_DEBUG << "fraud pipeline: " << submissions.size() << " submissions, timing "
                   << (timing ? "present" : "absent");
        return evaluate(build_checks(submissions, resume, timing));
    }

    const PlagiarismDetector& plagiarism() const { return plagiarism_; }
    const TimingAnomalyDetector& timing() const { return timing_; }
    const ResumeAuthenticityChecker& resume() const { return resume_; }
    const FraudScorer& scorer() const { return scorer_; }
};

} // namespace hire

#endif // HIRE_FRAUD_PIPELINE_H
