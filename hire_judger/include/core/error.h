/**
 * @file error.h
 * @brief 统一错误处理机制
 *
 * 提供：
 * - Result<T> 类型：成功值或 Error
 * - Error 类和错误码定义
 * - 错误传播宏
 *
 * 只用于宿主侧可能失败的操作（加载配置、题库、请求，创建进程）。
 * 考生代码的任何故障都不会走到这里，而是变成 ExecutionResult::error。
 */

#ifndef HIRE_CORE_ERROR_H
#define HIRE_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <ostream>

namespace hire {

//==============================================================================
// 错误码定义
//==============================================================================

enum class ErrorCode {
    OK = 0,

    // 文件操作错误 (1xx)
    FILE_NOT_FOUND = 100,
    FILE_READ_ERROR = 101,
    FILE_WRITE_ERROR = 102,

    // 配置错误 (2xx)
    CONFIG_PARSE_ERROR = 200,

    // 题库 / 请求错误 (3xx)
    CATALOG_PARSE_ERROR = 300,
    CATALOG_INVALID_ENTRY = 301,
    REQUEST_PARSE_ERROR = 302,
    REQUEST_INVALID_FIELD = 303,

    // 执行错误 (4xx)
    INTERPRETER_NOT_FOUND = 400,
    SCRATCH_CREATE_FAILED = 401,

    // 系统错误 (9xx)
    SYSTEM_ERROR = 900,
    FORK_FAILED = 901,
    PIPE_FAILED = 903,
    UNKNOWN_ERROR = 999
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CATALOG_PARSE_ERROR: return "CATALOG_PARSE_ERROR";
        case ErrorCode::CATALOG_INVALID_ENTRY: return "CATALOG_INVALID_ENTRY";
        case ErrorCode::REQUEST_PARSE_ERROR: return "REQUEST_PARSE_ERROR";
        case ErrorCode::REQUEST_INVALID_FIELD: return "REQUEST_INVALID_FIELD";
        case ErrorCode::INTERPRETER_NOT_FOUND: return "INTERPRETER_NOT_FOUND";
        case ErrorCode::SCRATCH_CREATE_FAILED: return "SCRATCH_CREATE_FAILED";
        case ErrorCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
        case ErrorCode::FORK_FAILED: return "FORK_FAILED";
        case ErrorCode::PIPE_FAILED: return "PIPE_FAILED";
        default: return "UNKNOWN_ERROR";
    }
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

//==============================================================================
// Error 类
//==============================================================================

/**
 * @brief 错误信息
 */
class Error {
private:
    ErrorCode code_;
    std::string message_;
    std::string file_;
    int line_;
    std::string context_;

public:
    Error() : code_(ErrorCode::OK), line_(0) {}

    Error(ErrorCode code, const std::string &message = "")
        : code_(code), message_(message), line_(0) {}

    Error(ErrorCode code, const std::string &message,
          const char *file, int line)
        : code_(code), message_(message), file_(file ? file : ""), line_(line) {}

    Error& with_context(const std::string &ctx) {
        context_ = ctx;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& context() const { return context_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }  // true 表示有错误

    /**
     * @brief 格式化错误信息
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << error_code_str(code_) << "]";
        if (!message_.empty()) {
            oss << " " << message_;
        }
        if (!context_.empty()) {
            oss << " (context: " << context_ << ")";
        }
        if (!file_.empty() && line_ > 0) {
            oss << " at " << file_ << ":" << line_;
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T> 类型
//==============================================================================

/**
 * @brief 结果类型：要么是值，要么是 Error
 *
 * 用法：
 *   Result<QuestionCatalog> r = QuestionCatalog::load(path);
 *   if (!r.ok()) {
 *       LOG_ERROR << r.error().to_string();
 *   }
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}

    Result(const Error &err) : data_(err) {}
    Result(Error &&err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : data_(Error(code, msg)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(const T &default_val) const {
        return ok() ? std::get<T>(data_) : default_val;
    }

    Error& error() & { return std::get<Error>(data_); }
    const Error& error() const & { return std::get<Error>(data_); }

    // 解包（如果错误则抛异常），仅用于测试和初始化代码
    const T& unwrap() const & {
        if (is_error()) {
            throw std::runtime_error(error().to_string());
        }
        return value();
    }
};

/**
 * @brief 无值的结果类型（仅表示成功/失败）
 */
template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() : error_(std::nullopt) {}
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : error_(Error(code, msg)) {}

    bool ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

inline Result<void> Ok() {
    return Result<void>();
}

//==============================================================================
// 错误处理宏
//==============================================================================

/**
 * @brief 创建带位置信息的错误
 */
#define HIRE_ERROR(code, msg) \
    hire::Error(code, msg, __FILE__, __LINE__)

/**
 * @brief 如果结果是错误，则返回错误
 */
#define HIRE_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) { \
            return _result.error(); \
        } \
    } while (0)

/**
 * @brief 如果结果是错误，则返回错误；否则解包值
 */
#define HIRE_TRY_UNWRAP(var, expr) \
    auto _tmp_##var = (expr); \
    if (_tmp_##var.is_error()) { \
        return _tmp_##var.error(); \
    } \
    auto var = std::move(_tmp_##var).value()

/**
 * @brief 断言条件，失败时返回错误
 */
#define HIRE_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return HIRE_ERROR(code, msg); \
        } \
    } while (0)

} // namespace hire

#endif // HIRE_CORE_ERROR_H
