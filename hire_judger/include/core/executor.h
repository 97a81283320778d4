/**
 * @file executor.h
 * @brief 单个测试点的代码执行
 *
 * execute(source, test_case) 的流程：
 * 1. 定位入口函数，找不到直接返回 "no function found"，不创建子进程
 * 2. 创建本次专用的临时目录，写入驱动脚本
 * 3. 参数表以 JSON 经 stdin 传给子进程，等待结果或超时
 * 4. 比较 stdout 与期望值
 *
 * 任何考生代码故障、超时、宿主侧故障都转换成 ExecutionResult::error，
 * 不会向调用者抛出异常。临时目录在所有路径上都会被删除。
 */

#ifndef HIRE_CORE_EXECUTOR_H
#define HIRE_CORE_EXECUTOR_H

#include <string>
#include <memory>
#include <unistd.h>

#include "core/types.h"
#include "core/policy.h"
#include "core/language.h"
#include "core/comparator.h"
#include "core/eval_logger.h"
#include "core/utils.h"
#include "sandbox/process.h"
#include "sandbox/scratch.h"

namespace hire {

namespace exec_error {
    const std::string NO_FUNCTION = "no function found";
    const std::string TIMEOUT = "timeout";
}

class SubmissionExecutor {
private:
    ExecutorOptions options_;
    std::shared_ptr<const LanguagePlugin> language_;

    /**
     * @brief 运行期故障的错误文本：stderr 优先，否则退出码或信号
     */
    std::string fault_text(const sandbox::ProcessResult &pr) const {
        std::string text = trim(pr.stderr_data);
        if (text.empty()) {
            if (pr.kind == sandbox::ExitKind::SIGNALED) {
                text = "runtime error: killed by signal " + std::to_string(pr.signal);
            } else {
                text = "runtime error: exit code " + std::to_string(pr.exit_code);
            }
        }
        return truncate_text(text, static_cast<size_t>(options_.error_limit));
    }

    ExecutionResult host_error(ExecutionResult res, const Error &err) const {
        GLOG_ERROR << "host failure while executing submission: " << err.to_string();
        res.status = RunStatus::INTERNAL_ERROR;
        res.error = "execution error: " + err.message();
        return res;
    }

public:
    SubmissionExecutor(const ExecutorOptions &options,
                       std::shared_ptr<const LanguagePlugin> language)
        : options_(options), language_(std::move(language)) {}

    const ExecutorOptions& options() const { return options_; }

    ExecutionResult execute(const std::string &source_code, const TestCase &test_case) const {
        return execute(source_code, test_case, options_.time_limit_ms);
    }

    ExecutionResult execute(const std::string &source_code, const TestCase &test_case,
                            int timeout_ms) const {
        ExecutionResult res;
        res.expected = test_case.expected_output;

        auto entry = language_->find_entry_function(source_code);
        if (!entry) {
            res.status = RunStatus::NO_FUNCTION;
            res.error = exec_error::NO_FUNCTION;
            return res;
        }

        if (access(options_.python_path.c_str(), X_OK) != 0) {
            return host_error(res, HIRE_ERROR(ErrorCode::INTERPRETER_NOT_FOUND,
                "interpreter not available: " + options_.python_path));
        }

        auto scratch = sandbox::ScratchDir::create(options_.scratch_dir);
        if (!scratch.ok()) {
            return host_error(res, scratch.error());
        }
        const sandbox::ScratchDir &dir = scratch.value();

        auto script = dir.write_file(language_->script_name(),
                                     language_->build_harness(source_code, *entry));
        if (!script.ok()) {
            return host_error(res, script.error());
        }

        RunContext ctx;
        ctx.interpreter = options_.python_path;
        ctx.work_path = dir.path();
        ctx.script_path = script.value();

        Value args = Value::object();
        for (const auto &kv : test_case.input) {
            args[kv.first] = kv.second;
        }

        sandbox::ProcessConfig pc;
        pc.program = options_.python_path;
        pc.args = language_->get_run_args(ctx);
        pc.env = language_->get_run_env(ctx);
        pc.work_dir = dir.path();
        pc.stdin_data = args.dump();
        pc.time_limit_ms = timeout_ms;
        pc.memory_limit_kb = options_.memory_limit_mb * 1024;
        pc.output_limit_kb = options_.output_limit_kb;
        pc.capture_limit = static_cast<size_t>(options_.capture_limit_kb) * 1024;

        sandbox::Process process(pc);
        auto run = process.run();
        if (!run.ok()) {
            return host_error(res, run.error());
        }
        const sandbox::ProcessResult &pr = run.value();
        res.wall_time_ms = pr.real_time_ms;

        if (pr.timed_out()) {
            GLOG_WARN << "function " << *entry << " timed out after " << pr.real_time_ms << " ms";
            res.status = RunStatus::TIMEOUT;
            res.error = exec_error::TIMEOUT + ": execution exceeded "
                + std::to_string(timeout_ms) + " ms";
            return res;
        }

        res.raw_output = trim(pr.stdout_data);
        if (!pr.ok()) {
            res.status = RunStatus::RUNTIME_ERROR;
            res.error = fault_text(pr);
            GLOG_DEBUG << "function " << *entry << " failed: " << *res.error;
            return res;
        }

        res.status = RunStatus::OK;
        res.passed = ResultComparator::compare(res.raw_output, res.expected);
        return res;
    }
};

} // namespace hire

#endif // HIRE_CORE_EXECUTOR_H
