/**
 * @file catalog.h
 * @brief 题库与参考代码片段库
 *
 * 两者都只在启动时加载一次，之后只读，以 const 引用传给各组件，
 * 并发的评测任务共享时不需要加锁。
 *
 * 题库格式：
 *   [
 *     {"id": 1, "title": "Two Sum", "difficulty": "easy",
 *      "description": "...", "function_signature": "def twoSum(nums, target):",
 *      "test_cases": [{"input": {"nums": [2,7,11,15], "target": 9}, "output": [0,1]}]}
 *   ]
 *
 * 参考片段格式（题号 -> 片段列表）：
 *   {"1": ["def twoSum(nums, target):", "seen = {}"]}
 */

#ifndef HIRE_CORE_CATALOG_H
#define HIRE_CORE_CATALOG_H

#include <string>
#include <vector>
#include <map>

#include "core/types.h"
#include "core/error.h"
#include "core/utils.h"

namespace hire {

/**
 * @brief 从 JSON 节点加载单道题目
 */
inline Result<Question> load_question(const Value &node) {
    HIRE_ENSURE(node.is_object(), ErrorCode::CATALOG_INVALID_ENTRY, "question must be an object");
    HIRE_ENSURE(node.contains("id") && node["id"].is_number_integer(),
                ErrorCode::CATALOG_INVALID_ENTRY, "question without integer id");

    Question q;
    q.id = node["id"].get<int>();
    std::string where = "question " + std::to_string(q.id);

    q.title = node.value("title", std::string("Unknown"));
    q.description = node.value("description", std::string());
    q.function_signature = node.value("function_signature", std::string());

    std::string diff = node.value("difficulty", std::string("medium"));
    q.difficulty = parse_difficulty(diff);
    HIRE_ENSURE(q.difficulty != Difficulty::UNKNOWN, ErrorCode::CATALOG_INVALID_ENTRY,
                where + ": unknown difficulty " + diff);

    if (!node.contains("test_cases")) {
        return q;
    }
    const Value &tests = node["test_cases"];
    HIRE_ENSURE(tests.is_array(), ErrorCode::CATALOG_INVALID_ENTRY,
                where + ": test_cases must be an array");

    for (size_t i = 0; i < tests.size(); i++) {
        const Value &t = tests[i];
        std::string at = where + " test " + std::to_string(i);
        HIRE_ENSURE(t.is_object(), ErrorCode::CATALOG_INVALID_ENTRY, at + ": must be an object");

        TestCase tc;
        if (t.contains("input")) {
            HIRE_ENSURE(t["input"].is_object(), ErrorCode::CATALOG_INVALID_ENTRY,
                        at + ": input must map parameter names to values");
            for (auto it = t["input"].begin(); it != t["input"].end(); ++it) {
                tc.input[it.key()] = it.value();
            }
        }
        // "expected_output" 为别名
        if (t.contains("output")) {
            tc.expected_output = t["output"];
        } else if (t.contains("expected_output")) {
            tc.expected_output = t["expected_output"];
        } else {
            return HIRE_ERROR(ErrorCode::CATALOG_INVALID_ENTRY, at + ": missing output");
        }
        q.test_cases.push_back(std::move(tc));
    }
    return q;
}

/**
 * @brief 题库
 */
class QuestionCatalog {
private:
    std::vector<Question> questions_;
    std::map<int, size_t> index_;

public:
    QuestionCatalog() = default;

    explicit QuestionCatalog(std::vector<Question> questions)
        : questions_(std::move(questions)) {
        for (size_t i = 0; i < questions_.size(); i++) {
            index_[questions_[i].id] = i;
        }
    }

    static Result<QuestionCatalog> from_json(const Value &doc) {
        HIRE_ENSURE(doc.is_array(), ErrorCode::CATALOG_PARSE_ERROR,
                    "question catalog must be an array");
        std::vector<Question> list;
        std::map<int, bool> seen;
        try {
            for (const auto &node : doc) {
                HIRE_TRY_UNWRAP(q, load_question(node));
                HIRE_ENSURE(!seen[q.id], ErrorCode::CATALOG_INVALID_ENTRY,
                            "duplicate question id " + std::to_string(q.id));
                seen[q.id] = true;
                list.push_back(std::move(q));
            }
        } catch (const nlohmann::json::exception &e) {
            // 字段类型不对，如 title 不是字符串
            return HIRE_ERROR(ErrorCode::CATALOG_INVALID_ENTRY, e.what());
        }
        return QuestionCatalog(std::move(list));
    }

    static Result<QuestionCatalog> load(const std::string &path) {
        HIRE_TRY_UNWRAP(text, read_file(path));
        Value doc = Value::parse(text, nullptr, false);
        if (doc.is_discarded()) {
            return HIRE_ERROR(ErrorCode::CATALOG_PARSE_ERROR, "invalid JSON in " + path);
        }
        auto res = from_json(doc);
        if (!res.ok()) {
            res.error().with_context(path);
        }
        return res;
    }

    const std::vector<Question>& all() const { return questions_; }

    size_t size() const { return questions_.size(); }

    const Question* find(int id) const {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &questions_[it->second];
    }

    /**
     * @brief 按给定题号取题，保持给定顺序，未知题号跳过
     */
    std::vector<Question> select(const std::vector<int> &ids) const {
        std::vector<Question> res;
        for (int id : ids) {
            if (const Question *q = find(id)) {
                res.push_back(*q);
            }
        }
        return res;
    }
};

/**
 * @brief 每道题的参考代码片段，按子串匹配
 */
class ReferenceCatalog {
private:
    std::map<int, std::vector<std::string>> fragments_;

public:
    ReferenceCatalog() = default;

    explicit ReferenceCatalog(std::map<int, std::vector<std::string>> fragments)
        : fragments_(std::move(fragments)) {}

    static Result<ReferenceCatalog> from_json(const Value &doc) {
        HIRE_ENSURE(doc.is_object(), ErrorCode::CATALOG_PARSE_ERROR,
                    "reference catalog must map question ids to fragment lists");
        std::map<int, std::vector<std::string>> map;
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            int id = 0;
            try {
                size_t used = 0;
                id = std::stoi(it.key(), &used);
                HIRE_ENSURE(used == it.key().size(), ErrorCode::CATALOG_INVALID_ENTRY,
                            "invalid question id: " + it.key());
            } catch (const std::logic_error &) {
                return HIRE_ERROR(ErrorCode::CATALOG_INVALID_ENTRY, "invalid question id: " + it.key());
            }
            HIRE_ENSURE(it.value().is_array(), ErrorCode::CATALOG_INVALID_ENTRY,
                        "fragments of question " + it.key() + " must be an array");
            std::vector<std::string> list;
            for (const auto &f : it.value()) {
                HIRE_ENSURE(f.is_string(), ErrorCode::CATALOG_INVALID_ENTRY,
                            "fragment of question " + it.key() + " must be a string");
                list.push_back(f.get<std::string>());
            }
            map[id] = std::move(list);
        }
        return ReferenceCatalog(std::move(map));
    }

    static Result<ReferenceCatalog> load(const std::string &path) {
        HIRE_TRY_UNWRAP(text, read_file(path));
        Value doc = Value::parse(text, nullptr, false);
        if (doc.is_discarded()) {
            return HIRE_ERROR(ErrorCode::CATALOG_PARSE_ERROR, "invalid JSON in " + path);
        }
        auto res = from_json(doc);
        if (!res.ok()) {
            res.error().with_context(path);
        }
        return res;
    }

    /**
     * @brief 没有条目或条目为空时返回 nullptr
     */
    const std::vector<std::string>* find(int question_id) const {
        auto it = fragments_.find(question_id);
        if (it == fragments_.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    }

    size_t size() const { return fragments_.size(); }
};

} // namespace hire

#endif // HIRE_CORE_CATALOG_H
