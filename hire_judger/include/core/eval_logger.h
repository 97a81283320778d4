/**
 * @file eval_logger.h
 * @brief 评估流程专用日志配置
 *
 * 为评估引擎提供预配置的日志通道：
 * - 主日志（控制台 + main.log）
 * - 评测日志 grade.log：进程创建、超时、宿主错误
 * - 反作弊日志 fraud.log：每一项检查的结论
 * - 决策日志 decision.log：阶段流转和推荐结果
 */

#ifndef HIRE_CORE_EVAL_LOGGER_H
#define HIRE_CORE_EVAL_LOGGER_H

#include "core/logger.h"
#include <string>

namespace hire {

/**
 * @brief 评估日志管理器
 */
class EvalLogger {
private:
    Logger main_logger_;
    Logger grade_logger_;
    Logger fraud_logger_;
    Logger decision_logger_;
    std::string log_dir_;

public:
    explicit EvalLogger(const std::string &log_dir = "/tmp/hire_judger/log")
        : main_logger_("main"),
          grade_logger_("grade"),
          fraud_logger_("fraud"),
          decision_logger_("decision"),
          log_dir_(log_dir) {}

    /**
     * @brief 初始化日志系统
     *
     * 未调用 init 时各通道没有任何输出目标，测试中默认静默。
     */
    void init(LogLevel level = LogLevel::INFO, bool console = true) {
        main_logger_.set_level(level)
                    .show_location(level <= LogLevel::DEBUG);
        if (console) {
            main_logger_.add_console(true);
        }
        main_logger_.add_file(log_dir_ + "/main.log");

        grade_logger_.set_level(level).add_file(log_dir_ + "/grade.log");
        fraud_logger_.set_level(level).add_file(log_dir_ + "/fraud.log");
        decision_logger_.set_level(level).add_file(log_dir_ + "/decision.log");
    }

    /**
     * @brief 设置日志目录（需要在 init 之前调用）
     */
    void set_log_dir(const std::string &dir) {
        log_dir_ = dir;
    }

    const std::string& log_dir() const { return log_dir_; }

    Logger& main()     { return main_logger_; }
    Logger& grade()    { return grade_logger_; }
    Logger& fraud()    { return fraud_logger_; }
    Logger& decision() { return decision_logger_; }

    void flush_all() {
        main_logger_.flush();
        grade_logger_.flush();
        fraud_logger_.flush();
        decision_logger_.flush();
    }
};

/**
 * @brief 获取全局评估日志器
 */
inline EvalLogger& eval_log() {
    static EvalLogger instance;
    return instance;
}

} // namespace hire

//==============================================================================
// 评估专用日志宏
//==============================================================================

// 主日志
#define ELOG_DEBUG LOGGER_DEBUG(hire::eval_log().main())
#define ELOG_INFO  LOGGER_INFO(hire::eval_log().main())
#define ELOG_WARN  LOGGER_WARN(hire::eval_log().main())
#define ELOG_ERROR LOGGER_ERROR(hire::eval_log().main())

// 评测日志
#define GLOG_DEBUG LOGGER_DEBUG(hire::eval_log().grade())
#define GLOG_INFO  LOGGER_INFO(hire::eval_log().grade())
#define GLOG_WARN  LOGGER_WARN(hire::eval_log().grade())
#define GLOG_ERROR LOGGER_ERROR(hire::eval_log().grade())

// 反作弊日志
#define FLOG_DEBUG LOGGER_DEBUG(hire::eval_log().fraud())
#define FLOG_INFO  LOGGER_INFO(hire::eval_log().fraud())
#define FLOG_WARN  LOGGER_WARN(hire::eval_log().fraud())

// 决策日志
#define DLOG_DEBUG LOGGER_DEBUG(hire::eval_log().decision())
#define DLOG_INFO  LOGGER_INFO(hire::eval_log().decision())
#define DLOG_WARN  LOGGER_WARN(hire::eval_log().decision())

#endif // HIRE_CORE_EVAL_LOGGER_H
