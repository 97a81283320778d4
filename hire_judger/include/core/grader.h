/**
 * @file grader.h
 * @brief 一名考生全部编程题的评测
 *
 * 每个 (题目, 测试点) 是线程池里的一个任务。结果写入按
 * (题目顺序, 测试点序号) 预先分配的槽位，报告顺序与完成顺序无关。
 * 单个测试点失败不影响其它测试点。
 */

#ifndef HIRE_CORE_GRADER_H
#define HIRE_CORE_GRADER_H

#include <vector>
#include <algorithm>
#include <future>
#include <exception>

#include "core/types.h"
#include "core/executor.h"
#include "core/worker_pool.h"
#include "core/eval_logger.h"

namespace hire {

class GradingCoordinator {
private:
    const SubmissionExecutor &executor_;
    unsigned threads_;

public:
    GradingCoordinator(const SubmissionExecutor &executor, unsigned threads = 0)
        : executor_(executor), threads_(threads) {}

    /**
     * @brief 评测所有有提交、有测试点的题目
     *
     * score = floor(100 * passed / total)，total 为 0 时 score 为 0。
     */
    GradingReport grade(const std::vector<Question> &questions,
                        const SubmissionMap &submissions) const {
        struct Job {
            const Question *question;
            const std::string *code;
            size_t test_index;
        };

        std::vector<Job> jobs;
        for (const auto &q : questions) {
            auto it = submissions.find(q.id);
            if (it == submissions.end() || it->second.empty() || q.test_cases.empty()) {
                continue;
            }
            for (size_t i = 0; i < q.test_cases.size(); i++) {
                jobs.push_back({&q, &it->second, i});
            }
        }

        GradingReport report;
        if (jobs.empty()) {
            GLOG_INFO << "nothing to grade";
            return report;
        }

        report.per_test.resize(jobs.size());
        {
            WorkerPool pool(threads_ == 0 ? 0 : std::min<unsigned>(threads_, jobs.size()));
            std::vector<std::future<void>> futures;
            futures.reserve(jobs.size());

            for (size_t slot = 0; slot < jobs.size(); slot++) {
                futures.push_back(pool.submit([this, &jobs, &report, slot] {
                    const Job &job = jobs[slot];
                    ExecutionResult r = executor_.execute(*job.code,
                                                          job.question->test_cases[job.test_index]);
                    r.question_id = job.question->id;
                    r.title = job.question->title;
                    r.test_index = static_cast<int>(job.test_index);
                    report.per_test[slot] = std::move(r);
                }));
            }

            for (size_t slot = 0; slot < futures.size(); slot++) {
                try {
                    futures[slot].get();
                } catch (const std::exception &e) {
                    // 执行器本身不抛异常，这里只可能是内存不足之类
                    const Job &job = jobs[slot];
                    GLOG_ERROR << "grading task for question " << job.question->id
                               << " test " << job.test_index << " failed: " << e.what();
                    ExecutionResult r;
                    r.expected = job.question->test_cases[job.test_index].expected_output;
                    r.error = std::string("execution error: ") + e.what();
                    r.question_id = job.question->id;
                    r.title = job.question->title;
                    r.test_index = static_cast<int>(job.test_index);
                    report.per_test[slot] = std::move(r);
                }
            }
        }

        report.total = static_cast<int>(report.per_test.size());
        for (const auto &r : report.per_test) {
            if (r.passed) report.passed++;
        }
        report.score = report.passed * 100 / report.total;

        GLOG_INFO << "graded " << report.total << " test cases, "
                  << report.passed << " passed, score " << report.score;
        return report;
    }

    /**
     * @brief 通过/失败计数和通过率
     */
    static TestSummary summarize(const GradingReport &report) {
        TestSummary s;
        s.total_tests = static_cast<int>(report.per_test.size());
        for (const auto &r : report.per_test) {
            if (r.passed) s.passed_tests++;
        }
        s.failed_tests = s.total_tests - s.passed_tests;
        int rate = s.total_tests == 0 ? 0 : s.passed_tests * 100 / s.total_tests;
        s.pass_rate = std::to_string(rate) + "%";
        return s;
    }
};

} // namespace hire

#endif // HIRE_CORE_GRADER_H
