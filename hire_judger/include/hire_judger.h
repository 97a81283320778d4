/**
 * @file hire_judger.h
 * @brief 评估引擎主头文件
 *
 * 使用方式：
 *   #include "hire_judger.h"
 *   using namespace hire;
 */

#ifndef HIRE_JUDGER_H
#define HIRE_JUDGER_H

// 标准库
#include <memory>
#include <future>
#include <optional>

// 核心模块
#include "core/types.h"
#include "core/error.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/policy.h"
#include "core/logger.h"
#include "core/eval_logger.h"
#include "core/language.h"
#include "core/comparator.h"
#include "core/executor.h"
#include "core/grader.h"
#include "core/catalog.h"
#include "core/request.h"
#include "core/report.h"

// 语言
#include "languages/python3.h"

// 反作弊与决策
#include "fraud/pipeline.h"
#include "decision/state_machine.h"

namespace hire {

/**
 * @brief 一次评估的全部产出
 */
struct EvaluationResult {
    std::optional<GradingReport> grading;   ///< 没有提交时为空
    FraudReport fraud;
    DecisionRecord decision;

    Value to_json() const {
        Value j;
        if (grading) {
            j["grading"] = hire::to_json(*grading, GradingCoordinator::summarize(*grading));
        } else {
            j["grading"] = nullptr;
        }
        j["fraud"] = hire::to_json(fraud);
        j["decision"] = hire::to_json(decision);
        return j;
    }
};

/**
 * @brief 评估上下文
 *
 * 封装评估所需的配置、题库和各组件。题库只读，可在多次评估间共享。
 */
class EvaluationContext {
public:
    Config config;
    ExecutorOptions executor_options;
    FraudPolicy fraud_policy;
    ScoringPolicy scoring_policy;
    unsigned worker_threads = 0;

    QuestionCatalog questions;
    ReferenceCatalog references;

private:
    std::unique_ptr<SubmissionExecutor> executor_;
    std::unique_ptr<FraudPipeline> fraud_;
    std::unique_ptr<DecisionStateMachine> decision_;

    static std::string dir_of(const std::string &path) {
        size_t pos = path.rfind('/');
        return pos == std::string::npos ? "." : path.substr(0, pos);
    }

    static std::string resolve(const std::string &base, const std::string &path) {
        if (path.empty() || path[0] == '/') {
            return path;
        }
        return base + "/" + path;
    }

public:
    EvaluationContext() = default;
    EvaluationContext(const EvaluationContext&) = delete;
    EvaluationContext& operator=(const EvaluationContext&) = delete;

    /**
     * @brief 加载配置文件、初始化日志、加载题库
     *
     * questions_file / references_file 为相对路径时相对于配置文件所在目录。
     */
    Result<void> init(const std::string &config_path) {
        HIRE_TRY(config.load(config_path));

        eval_log().set_log_dir(config.get_str("log_dir", eval_log().log_dir()));
        if (!ensure_dir(eval_log().log_dir()).ok()) {
            LOG_WARN << "cannot create log directory " << eval_log().log_dir();
        }
        eval_log().init(parse_log_level(config.get_str("log_level", "info")),
                        config.get_bool("log_console", true));

        std::string base = dir_of(config_path);
        HIRE_TRY_UNWRAP(qs, QuestionCatalog::load(
            resolve(base, config.get_str("questions_file", "questions.json"))));
        HIRE_TRY_UNWRAP(refs, ReferenceCatalog::load(
            resolve(base, config.get_str("references_file", "references.json"))));

        init(std::move(qs), std::move(refs));
        ELOG_INFO << "loaded " << questions.size() << " questions, references for "
                  << references.size() << " questions";
        return Ok();
    }

    /**
     * @brief 用已有的配置和题库构造各组件
     */
    void init(QuestionCatalog qs, ReferenceCatalog refs) {
        questions = std::move(qs);
        references = std::move(refs);
        executor_options = ExecutorOptions::from_config(config);
        fraud_policy = FraudPolicy::from_config(config);
        scoring_policy = ScoringPolicy::from_config(config);
        worker_threads = worker_threads_from_config(config);

        executor_ = std::make_unique<SubmissionExecutor>(executor_options,
                                                         std::make_shared<Python3Language>());
        fraud_ = std::make_unique<FraudPipeline>(references, fraud_policy);
        decision_ = std::make_unique<DecisionStateMachine>(scoring_policy);
    }

    const SubmissionExecutor& executor() const { return *executor_; }
    const FraudPipeline& fraud() const { return *fraud_; }
    const DecisionStateMachine& decision() const { return *decision_; }

    /**
     * @brief 评测与反作弊并发执行，两者都完成后做决策
     */
    EvaluationResult evaluate(const EvaluationRequest &req) const {
        EvaluationResult res;

        std::future<FraudReport> fraud_future = std::async(std::launch::async,
            [this, &req] { return fraud_->run(req.submissions, req.resume, req.timing); });

        std::optional<int> coding_score = req.coding_score;
        if (!req.submissions.empty()) {
            std::vector<Question> selected = req.question_ids.empty()
                ? questions.all() : questions.select(req.question_ids);
            GradingCoordinator grader(*executor_, worker_threads);
            res.grading = grader.grade(selected, req.submissions);
            coding_score = res.grading->score;
        }

        res.fraud = fraud_future.get();
        res.decision = decision_->decide(req.current_stage, req.resume_score, coding_score,
                                         res.fraud.fraud_score, req.job);
        return res;
    }
};

} // namespace hire

#endif // HIRE_JUDGER_H
