/**
 * @file main_evaluator.cpp
 * @brief 评估入口
 *
 * 用法：hire_evaluator <engine.conf> <request.json> <result_dir>
 *
 * 加载配置和题库，评测提交（与反作弊并发），做出决策，
 * 结果写入 result_dir/result.json，进度写入 result_dir/cur_status.txt。
 * 配置、题库或请求无法加载时返回 1，错误同样写入 result.json。
 */

#include <iostream>
#include "hire_judger.h"

using namespace hire;

int main(int argc, char **argv) {
    if (argc != 4) {
        std::cerr << "usage: " << argv[0] << " <engine.conf> <request.json> <result_dir>" << std::endl;
        return 1;
    }
    std::string config_path = argv[1];
    std::string request_path = argv[2];
    std::string result_path = argv[3];

    auto dir = ensure_dir(result_path);
    if (!dir.ok()) {
        LOG_ERROR << dir.error().to_string();
        return 1;
    }
    ResultWriter writer(result_path);

    auto fail = [&writer](const Error &err) {
        LOG_ERROR << err.to_string();
        ELOG_ERROR << err.to_string();
        writer.report_status("Evaluation Failed");
        auto w = writer.write_failed(err);
        if (!w.ok()) {
            LOG_ERROR << w.error().to_string();
        }
        eval_log().flush_all();
        return 1;
    };

    writer.report_status("Loading");
    EvaluationContext ctx;
    auto init = ctx.init(config_path);
    if (!init.ok()) {
        return fail(init.error());
    }

    auto request = load_request(request_path);
    if (!request.ok()) {
        return fail(request.error().with_context(request_path));
    }
    const EvaluationRequest &req = request.value();
    ELOG_INFO << "evaluating " << req.submissions.size() << " submissions at stage '"
              << req.current_stage << "'";

    writer.report_status(req.submissions.empty() ? "Checking" : "Judging");
    EvaluationResult res = ctx.evaluate(req);

    writer.report_status("Writing Result");
    auto w = writer.write_ok(res.to_json());
    if (!w.ok()) {
        return fail(w.error());
    }

    ELOG_INFO << res.decision.summary << ", next stage: " << res.decision.next_stage;
    writer.report_status("Evaluated");
    eval_log().flush_all();
    return 0;
}
