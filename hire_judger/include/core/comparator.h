/**
 * @file comparator.h
 * @brief 输出比较
 *
 * 先尝试结构化比较：实际输出按 JSON 解析成功时，比较两边的规范编码
 * （nlohmann::json 的对象按键排序、紧凑输出）。
 * 解析失败或结构不等时，退回到字符串比较：实际输出 vs 期望值的字符串形式。
 *
 * 集合类结果的顺序、浮点精度都按字面比较，不做容差。
 */

#ifndef HIRE_CORE_COMPARATOR_H
#define HIRE_CORE_COMPARATOR_H

#include <string>
#include "core/types.h"

namespace hire {

class ResultComparator {
public:
    /**
     * @brief 期望值的字符串形式：字符串取原文，其余取紧凑 JSON
     */
    static std::string string_form(const Value &v) {
        if (v.is_string()) {
            return v.get<std::string>();
        }
        return v.dump();
    }

    /**
     * @brief 规范编码
     */
    static std::string canonical(const Value &v) {
        return v.dump();
    }

    static bool compare(const std::string &raw_output, const Value &expected) {
        Value actual = Value::parse(raw_output, nullptr, false);
        if (!actual.is_discarded()) {
            if (canonical(actual) == canonical(expected)) {
                return true;
            }
            // 与 str(actual) == str(expected) 一致：字符串结果按原文比较
            if (actual.is_string() && actual.get<std::string>() == string_form(expected)) {
                return true;
            }
        }
        return raw_output == string_form(expected);
    }
};

} // namespace hire

#endif // HIRE_CORE_COMPARATOR_H
