/**
 * @file request.h
 * @brief 评估请求的解析
 *
 * 请求格式（除 resume_score 外均可省略）：
 *   {
 *     "question_ids": [1, 2],
 *     "submissions": {"1": "def twoSum(nums, target): ..."},
 *     "coding_score": 70,
 *     "resume_score": 80,
 *     "resume_data": {"skills": ["python"], "experience": 3, "projects": 2},
 *     "timing": {"start_time": "2024-01-01T10:00:00", "end_time": "...", "difficulty": "easy"},
 *     "current_stage": "Coding Assessment",
 *     "job": {"skills": ["python"], "min_score": 60, "risk_tolerance": 50}
 *   }
 *
 * submissions 也可以写成 [{"question_id": 1, "code": "..."}]。
 * 有提交时编程分取评测结果，coding_score 只在没有提交时使用。
 */

#ifndef HIRE_CORE_REQUEST_H
#define HIRE_CORE_REQUEST_H

#include <string>
#include <vector>
#include <optional>
#include <limits>
#include <cmath>
#include <cstdint>

#include "core/types.h"
#include "core/error.h"
#include "core/utils.h"

namespace hire {

struct EvaluationRequest {
    std::vector<int> question_ids;      ///< 为空表示题库中所有题
    SubmissionMap submissions;
    std::optional<int> coding_score;
    int resume_score = 0;
    ResumeData resume;
    std::optional<TimingData> timing;
    std::string current_stage = stage::RESUME_SCREENING;
    std::optional<JobRequirements> job;
};

namespace detail {

inline Result<std::set<std::string>> parse_string_set(const Value &node, const std::string &field) {
    HIRE_ENSURE(node.is_array(), ErrorCode::REQUEST_INVALID_FIELD, field + " must be an array");
    std::set<std::string> res;
    for (const auto &v : node) {
        HIRE_ENSURE(v.is_string(), ErrorCode::REQUEST_INVALID_FIELD,
                    field + " must contain strings");
        res.insert(v.get<std::string>());
    }
    return res;
}

/**
 * @brief 转成 int：小数向零截断，超出 int 范围报错
 */
inline Result<int> to_int(const Value &v, const std::string &field) {
    HIRE_ENSURE(v.is_number(), ErrorCode::REQUEST_INVALID_FIELD, field + " must be a number");
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        HIRE_ENSURE(u <= static_cast<uint64_t>(std::numeric_limits<int>::max()),
                    ErrorCode::REQUEST_INVALID_FIELD, field + " out of range");
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        auto i = v.get<int64_t>();
        HIRE_ENSURE(i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max(),
                    ErrorCode::REQUEST_INVALID_FIELD, field + " out of range");
        return static_cast<int>(i);
    }
    double d = v.get<double>();
    HIRE_ENSURE(std::isfinite(d) && d > std::numeric_limits<int>::min() - 1.0
                    && d < std::numeric_limits<int>::max() + 1.0,
                ErrorCode::REQUEST_INVALID_FIELD, field + " out of range");
    return static_cast<int>(d);
}

/**
 * @brief 读取整数字段，缺失或为 null 时返回 def
 */
inline Result<int> parse_int(const Value &obj, const std::string &key,
                             const std::string &field, int def) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return def;
    }
    return to_int(obj[key], field);
}

/**
 * @brief 整个字符串都必须是十进制整数
 */
inline Result<int> parse_question_id(const std::string &key) {
    size_t used = 0;
    int id = 0;
    try {
        id = std::stoi(key, &used);
    } catch (const std::logic_error &) {
        used = 0;
    }
    HIRE_ENSURE(used > 0 && used == key.size(), ErrorCode::REQUEST_INVALID_FIELD,
                "invalid submission question id: " + key);
    return id;
}

inline Result<SubmissionMap> parse_submissions(const Value &node) {
    SubmissionMap map;
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            HIRE_ENSURE(it.value().is_string(), ErrorCode::REQUEST_INVALID_FIELD,
                        "submission " + it.key() + " must be a string");
            HIRE_TRY_UNWRAP(id, parse_question_id(it.key()));
            map[id] = it.value().get<std::string>();
        }
        return map;
    }
    HIRE_ENSURE(node.is_array(), ErrorCode::REQUEST_INVALID_FIELD,
                "submissions must be an object or an array");
    for (const auto &s : node) {
        HIRE_ENSURE(s.is_object() && s.contains("question_id") && s["question_id"].is_number_integer(),
                    ErrorCode::REQUEST_INVALID_FIELD, "submission without integer question_id");
        HIRE_TRY_UNWRAP(id, parse_int(s, "question_id", "submission question_id", 0));
        map[id] = s.value("code", std::string());
    }
    return map;
}

inline Result<TimingData> parse_timing(const Value &node) {
    HIRE_ENSURE(node.is_object(), ErrorCode::REQUEST_INVALID_FIELD, "timing must be an object");
    TimingData t;
    t.difficulty = node.value("difficulty", t.difficulty);
    // 无法解析的时间戳按缺失处理
    if (node.contains("start_time") && node["start_time"].is_string()) {
        t.start_time = parse_iso8601(node["start_time"].get<std::string>());
    }
    if (node.contains("end_time") && node["end_time"].is_string()) {
        t.end_time = parse_iso8601(node["end_time"].get<std::string>());
    }
    return t;
}

} // namespace detail

inline Result<EvaluationRequest> parse_request(const Value &doc) {
    HIRE_ENSURE(doc.is_object(), ErrorCode::REQUEST_PARSE_ERROR, "request must be an object");
    EvaluationRequest req;
    try {
        HIRE_ENSURE(doc.contains("resume_score") && doc["resume_score"].is_number(),
                    ErrorCode::REQUEST_INVALID_FIELD, "resume_score is required");
        HIRE_TRY_UNWRAP(resume_score, detail::parse_int(doc, "resume_score", "resume_score", 0));
        req.resume_score = resume_score;

        if (doc.contains("question_ids")) {
            const Value &ids = doc["question_ids"];
            HIRE_ENSURE(ids.is_array(), ErrorCode::REQUEST_INVALID_FIELD,
                        "question_ids must be an array");
            for (const auto &v : ids) {
                HIRE_ENSURE(v.is_number_integer(), ErrorCode::REQUEST_INVALID_FIELD,
                            "question_ids must contain integers");
                HIRE_TRY_UNWRAP(id, detail::to_int(v, "question_ids"));
                req.question_ids.push_back(id);
            }
        }
        if (doc.contains("submissions")) {
            HIRE_TRY_UNWRAP(subs, detail::parse_submissions(doc["submissions"]));
            req.submissions = std::move(subs);
        }
        if (doc.contains("coding_score") && !doc["coding_score"].is_null()) {
            HIRE_TRY_UNWRAP(coding_score, detail::parse_int(doc, "coding_score", "coding_score", 0));
            req.coding_score = coding_score;
        }
        if (doc.contains("resume_data")) {
            const Value &r = doc["resume_data"];
            HIRE_ENSURE(r.is_object(), ErrorCode::REQUEST_INVALID_FIELD, "resume_data must be an object");
            if (r.contains("skills")) {
                HIRE_TRY_UNWRAP(skills, detail::parse_string_set(r["skills"], "resume_data.skills"));
                req.resume.skills = std::move(skills);
            }
            HIRE_TRY_UNWRAP(experience, detail::parse_int(r, "experience", "resume_data.experience", 0));
            HIRE_TRY_UNWRAP(projects, detail::parse_int(r, "projects", "resume_data.projects", 0));
            req.resume.experience = experience;
            req.resume.projects = projects;
        }
        if (doc.contains("timing") && !doc["timing"].is_null()) {
            HIRE_TRY_UNWRAP(timing, detail::parse_timing(doc["timing"]));
            req.timing = std::move(timing);
        }
        req.current_stage = doc.value("current_stage", req.current_stage);
        if (doc.contains("job") && !doc["job"].is_null()) {
            const Value &j = doc["job"];
            HIRE_ENSURE(j.is_object(), ErrorCode::REQUEST_INVALID_FIELD, "job must be an object");
            JobRequirements job;
            if (j.contains("skills")) {
                HIRE_TRY_UNWRAP(skills, detail::parse_string_set(j["skills"], "job.skills"));
                job.skills = std::move(skills);
            }
            // 未给出时用简历中的技能
            if (j.contains("candidate_skills")) {
                HIRE_TRY_UNWRAP(cs, detail::parse_string_set(j["candidate_skills"], "job.candidate_skills"));
                job.candidate_skills = std::move(cs);
            } else {
                job.candidate_skills = req.resume.skills;
            }
            HIRE_TRY_UNWRAP(min_score, detail::parse_int(j, "min_score", "job.min_score", job.min_score));
            HIRE_TRY_UNWRAP(tolerance, detail::parse_int(j, "risk_tolerance", "job.risk_tolerance",
                                                         job.risk_tolerance));
            job.min_score = min_score;
            job.risk_tolerance = tolerance;
            req.job = std::move(job);
        }
    } catch (const nlohmann::json::exception &e) {
        return HIRE_ERROR(ErrorCode::REQUEST_INVALID_FIELD, e.what());
    }
    return req;
}

inline Result<EvaluationRequest> load_request(const std::string &path) {
    HIRE_TRY_UNWRAP(text, read_file(path));
    Value doc = Value::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return HIRE_ERROR(ErrorCode::REQUEST_PARSE_ERROR, "invalid JSON in " + path);
    }
    return parse_request(doc);
}

} // namespace hire

#endif // HIRE_CORE_REQUEST_H
