/**
 * @file language.h
 * @brief 语言插件接口
 *
 * 一个语言插件负责三件事：
 * - 在考生代码中定位入口函数
 * - 生成驱动脚本（考生代码 + 调用入口函数并输出 JSON 的测试桩）
 * - 给出解释器的运行参数和环境变量
 */

#ifndef HIRE_CORE_LANGUAGE_H
#define HIRE_CORE_LANGUAGE_H

#include <string>
#include <vector>
#include <optional>

namespace hire {

/**
 * @brief 运行上下文
 */
struct RunContext {
    std::string interpreter;    ///< 解释器路径
    std::string work_path;      ///< 本次执行的临时目录
    std::string script_path;    ///< 驱动脚本完整路径
};

/**
 * @brief 语言插件接口
 */
class LanguagePlugin {
public:
    virtual ~LanguagePlugin() = default;

    /// 语言标识符（如 "Python3"）
    virtual std::string id() const = 0;

    /// 驱动脚本文件名
    virtual std::string script_name() const = 0;

    /// 查找顶层函数定义，返回函数名
    virtual std::optional<std::string> find_entry_function(const std::string &source) const = 0;

    /// 生成驱动脚本：从 stdin 读 JSON 参数，按名字传参调用，结果写 stdout
    virtual std::string build_harness(const std::string &source,
                                      const std::string &function_name) const = 0;

    /// 运行参数（不含程序本身）
    virtual std::vector<std::string> get_run_args(const RunContext &ctx) const = 0;

    /// 子进程环境变量
    virtual std::vector<std::string> get_run_env(const RunContext &ctx) const {
        return {"PATH=/usr/bin:/bin", "HOME=" + ctx.work_path};
    }
};

} // namespace hire

#endif // HIRE_CORE_LANGUAGE_H
