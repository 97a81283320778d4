/**
 * @file python3.h
 * @brief Python 3 语言插件
 *
 * 驱动脚本把考生代码作为字符串常量嵌入，运行时：
 * 1. 从 stdin 读取 JSON 参数表
 * 2. exec 考生代码（文件名记为 solution.py），期间考生自己的 print 被丢弃
 * 3. 以关键字参数调用入口函数
 * 4. json.dumps(result, default=str) 写到 stdout
 *
 * 考生代码抛出的异常：只把 solution.py 中的栈帧写到 stderr，进程以 1 退出。
 * 驱动脚本自身的栈帧含临时目录路径，不输出，保证同一份代码的错误信息每次相同。
 */

#ifndef HIRE_LANGUAGES_PYTHON3_H
#define HIRE_LANGUAGES_PYTHON3_H

#include <regex>
#include <sstream>
#include <nlohmann/json.hpp>

#include "core/language.h"

namespace hire {

class Python3Language : public LanguagePlugin {
public:
    std::string id() const override { return "Python3"; }

    std::string script_name() const override { return "main.py"; }

    /**
     * @brief 第一个顶格的 `def name(`，缩进的（方法、嵌套函数）不算
     */
    std::optional<std::string> find_entry_function(const std::string &source) const override {
        static const std::regex def_re(R"(^def\s+([A-Za-z_][A-Za-z0-9_]*)\s*\()");
        std::istringstream iss(source);
        std::string line;
        while (std::getline(iss, line)) {
            std::smatch m;
            if (std::regex_search(line, m, def_re)) {
                return m[1].str();
            }
        }
        return std::nullopt;
    }

    std::string build_harness(const std::string &source,
                              const std::string &function_name) const override {
        // JSON 字符串字面量同时也是合法的 Python 字符串字面量；
        // 非法 UTF-8 字节替换为 U+FFFD
        const auto replace = nlohmann::json::error_handler_t::replace;
        std::string source_literal = nlohmann::json(source).dump(-1, ' ', false, replace);
        std::string name_literal = nlohmann::json(function_name).dump(-1, ' ', false, replace);

        std::ostringstream oss;
        oss << "import contextlib as _hire_ctx\n"
            << "import io as _hire_io\n"
            << "import json as _hire_json\n"
            << "import sys as _hire_sys\n"
            << "import traceback as _hire_tb\n"
            << "\n"
            << "_HIRE_SOURCE = " << source_literal << "\n"
            << "_HIRE_ENTRY = " << name_literal << "\n"
            << "\n"
            << "def _hire_main():\n"
            << "    args = _hire_json.loads(_hire_sys.stdin.read() or '{}')\n"
            << "    ns = {'__name__': 'solution', '__builtins__': __builtins__}\n"
            << "    try:\n"
            << "        with _hire_ctx.redirect_stdout(_hire_io.StringIO()):\n"
            << "            exec(compile(_HIRE_SOURCE, 'solution.py', 'exec'), ns)\n"
            << "            result = ns[_HIRE_ENTRY](**args)\n"
            << "        out = _hire_json.dumps(result, default=str)\n"
            << "    except BaseException as e:\n"
            << "        tb = e.__traceback__.tb_next if e.__traceback__ else None\n"
            << "        _hire_tb.print_exception(type(e), e, tb)\n"
            << "        _hire_sys.stderr.flush()\n"
            << "        _hire_sys.exit(1)\n"
            << "    _hire_sys.stdout.write(out)\n"
            << "    _hire_sys.stdout.write('\\n')\n"
            << "    _hire_sys.stdout.flush()\n"
            << "\n"
            << "_hire_main()\n";
        return oss.str();
    }

    /**
     * @brief -I 隔离模式（忽略 PYTHON* 环境变量和用户 site），-B 不写 .pyc
     *
     * 脚本用相对路径，traceback 中不出现随机的临时目录名。
     */
    std::vector<std::string> get_run_args(const RunContext &ctx) const override {
        (void)ctx;
        return {"-I", "-B", script_name()};
    }

    std::vector<std::string> get_run_env(const RunContext &ctx) const override {
        return {
            "PATH=/usr/bin:/bin",
            "HOME=" + ctx.work_path,
            "LANG=C.UTF-8",
            "LC_ALL=C.UTF-8"
        };
    }
};

} // namespace hire

#endif // HIRE_LANGUAGES_PYTHON3_H
