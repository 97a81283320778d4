/**
 * @file check.h
 * @brief 反作弊检查接口
 *
 * 每一项检查在构造时绑定自己的输入，evaluate() 只读、无副作用，
 * 因此各项检查可以在不同线程上同时运行。
 */

#ifndef HIRE_FRAUD_CHECK_H
#define HIRE_FRAUD_CHECK_H

#include <memory>
#include <vector>
#include "core/types.h"

namespace hire {

class FraudCheckStrategy {
public:
    virtual ~FraudCheckStrategy() = default;

    virtual CheckKind kind() const = 0;

    virtual FraudCheck evaluate() const = 0;
};

using FraudCheckList = std::vector<std::unique_ptr<FraudCheckStrategy>>;

} // namespace hire

#endif // HIRE_FRAUD_CHECK_H
