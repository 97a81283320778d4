/**
 * @file plagiarism.h
 * @brief 抄袭检测：与参考代码片段的字面匹配
 *
 * 代码先规范化（去 # 注释、去每行首尾空白、去空行），
 * 然后统计题目的参考片段中有多少是规范化代码的子串。
 */

#ifndef HIRE_FRAUD_PLAGIARISM_H
#define HIRE_FRAUD_PLAGIARISM_H

#include <string>
#include <vector>

#include "core/types.h"
#include "core/policy.h"
#include "core/catalog.h"
#include "core/utils.h"
#include "core/eval_logger.h"
#include "fraud/check.h"

namespace hire {

class PlagiarismDetector {
private:
    const ReferenceCatalog &references_;
    FraudPolicy policy_;

public:
    PlagiarismDetector(const ReferenceCatalog &references, const FraudPolicy &policy)
        : references_(references), policy_(policy) {}

    /**
     * @brief 去 # 注释、去首尾空白、去空行，以 \n 连接
     *
     * 字符串中的 # 也会被当作注释截掉。
     */
    static std::string normalize(const std::string &code) {
        std::vector<std::string> kept;
        for (auto line : split_lines(code)) {
            size_t hash = line.find('#');
            if (hash != std::string::npos) {
                line.erase(hash);
            }
            line = trim(line);
            if (!line.empty()) {
                kept.push_back(line);
            }
        }
        return join(kept, "\n");
    }

    FraudCheck detect(const std::string &code, int question_id) const {
        const std::vector<std::string> *fragments = references_.find(question_id);
        if (code.empty() || fragments == nullptr) {
            return FraudCheck::clean(CheckKind::PLAGIARISM, "no reference available");
        }

        std::string normalized = normalize(code);
        size_t found = 0;
        for (const auto &f : *fragments) {
            if (normalized.find(f) != std::string::npos) {
                found++;
            }
        }

        FraudCheck c;
        c.kind = CheckKind::PLAGIARISM;
        c.metric = round_to(100.0 * found / fragments->size(), 2);
        c.is_suspicious = c.metric > policy_.plagiarism_threshold;
        if (c.is_suspicious) {
            c.detail = "code matches " + std::to_string(found) + "/"
                + std::to_string(fragments->size()) + " reference fragments";
        } else {
            c.detail = "code appears original";
        }

        FLOG_INFO << "plagiarism q" << question_id << ": similarity " << c.metric
                  << "%" << (c.is_suspicious ? " SUSPICIOUS" : "");
        return c;
    }
};

class PlagiarismCheck : public FraudCheckStrategy {
private:
    const PlagiarismDetector &detector_;
    std::string code_;
    int question_id_;

public:
    PlagiarismCheck(const PlagiarismDetector &detector, std::string code, int question_id)
        : detector_(detector), code_(std::move(code)), question_id_(question_id) {}

    CheckKind kind() const override { return CheckKind::PLAGIARISM; }

    FraudCheck evaluate() const override {
        return detector_.detect(code_, question_id_);
    }
};

} // namespace hire

#endif // HIRE_FRAUD_PLAGIARISM_H
