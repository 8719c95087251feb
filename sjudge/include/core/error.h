/**
 * @file error.h
 * @brief 统一错误处理机制
 *
 * 引擎内部各层返回 Result<T>，只有评测流程（harness）把错误
 * 转换成报告字段，所以这里的 message 就是最终展示给学生的文本。
 */

#ifndef SJUDGE_CORE_ERROR_H
#define SJUDGE_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <sstream>
#include <ostream>

namespace sjudge {

//==============================================================================
// 错误码
//==============================================================================

enum class ErrorCode {
    OK = 0,

    // 文件 (1xx)
    FILE_READ_ERROR = 101,
    FILE_WRITE_ERROR = 102,

    // 配置 (2xx)
    CONFIG_PARSE_ERROR = 200,
    CONFIG_MISSING_KEY = 201,
    CONFIG_INVALID_VALUE = 202,

    // 准备阶段 (3xx)，对整个提交生效
    COMPILATION_FAILED = 300,
    UNSUPPORTED_LANGUAGE = 304,

    // 单个用例 (4xx)
    RUNTIME_ERROR = 400,
    TIMEOUT = 401,
    OUTPUT_LIMIT_EXCEEDED = 403,

    // 提交级拦截 (6xx)
    SECURITY_BLOCKED = 600,

    // 系统 (9xx)
    INTERNAL_ERROR = 900,
    FORK_FAILED = 901,
    EXEC_FAILED = 902,
    PIPE_FAILED = 903
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISSING_KEY: return "CONFIG_MISSING_KEY";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::COMPILATION_FAILED: return "COMPILATION_FAILED";
        case ErrorCode::UNSUPPORTED_LANGUAGE: return "UNSUPPORTED_LANGUAGE";
        case ErrorCode::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::OUTPUT_LIMIT_EXCEEDED: return "OUTPUT_LIMIT_EXCEEDED";
        case ErrorCode::SECURITY_BLOCKED: return "SECURITY_BLOCKED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::FORK_FAILED: return "FORK_FAILED";
        case ErrorCode::EXEC_FAILED: return "EXEC_FAILED";
        case ErrorCode::PIPE_FAILED: return "PIPE_FAILED";
    }
    return "INTERNAL_ERROR";
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

/**
 * @brief 是否是引擎自身的问题（而不是提交代码导致的）
 *
 * 文件、管道、fork/exec 失败都算，日志按 ERROR 记录。
 */
inline bool is_system_error(ErrorCode code) {
    int n = static_cast<int>(code);
    return (n >= 100 && n < 200) || n >= 900;
}

//==============================================================================
// Error
//==============================================================================

class Error {
private:
    ErrorCode code_;
    std::string message_;
    const char *file_;
    int line_;

public:
    Error() : code_(ErrorCode::OK), file_(nullptr), line_(0) {}

    Error(ErrorCode code, std::string message, const char *file = nullptr, int line = 0)
        : code_(code), message_(std::move(message)), file_(file), line_(line) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    bool is(ErrorCode code) const { return code_ == code; }

    /// 日志用：带错误码和源码位置
    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << code_ << "] " << message_;
        if (file_ && line_ > 0) {
            oss << " (" << file_ << ":" << line_ << ")";
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T>
//==============================================================================

/**
 * @brief 成功值或 Error
 *
 *   Result<LaunchSpec> spec = plugin.prepare(ctx);
 *   if (!spec.ok()) {
 *       LOG_WARN << spec.error().to_string();
 *   }
 *
 * 只能移动的类型（如 ScratchDir）用 std::move(res).value() 取出。
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return data_.index() == 0; }
    bool is_error() const { return !ok(); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const Error& error() const { return std::get<1>(data_); }
};

template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() = default;
    Result(Error err) : error_(std::move(err)) {}

    bool ok() const { return !error_; }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }
};

inline Result<void> Ok() {
    return Result<void>();
}

//==============================================================================
// 宏
//==============================================================================

/// 带源码位置的错误
#define SJUDGE_ERROR(code, msg) \
    sjudge::Error(code, msg, __FILE__, __LINE__)

/// 表达式结果为错误时原样返回
#define SJUDGE_TRY(expr) \
    do { \
        auto _sjudge_res = (expr); \
        if (_sjudge_res.is_error()) { \
            return _sjudge_res.error(); \
        } \
    } while (0)

/// 条件不成立时返回错误
#define SJUDGE_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return SJUDGE_ERROR(code, msg); \
        } \
    } while (0)

} // namespace sjudge

#endif // SJUDGE_CORE_ERROR_H
