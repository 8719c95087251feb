/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * 包含评测引擎使用的所有基础数据结构：
 * - Language / SecurityMode / ComparisonMode: 枚举及其字符串转换
 * - TestCase: 测试用例
 * - EvaluateOptions: 提交级资源限制
 * - LaunchSpec / ExecutionOutcome: 单次进程执行的输入与结果
 * - TestCaseResult / EvaluationReport: 评测报告
 */

#ifndef SJUDGE_CORE_TYPES_H
#define SJUDGE_CORE_TYPES_H

#include <string>
#include <vector>
#include <optional>

namespace sjudge {

//==============================================================================
// 枚举
//==============================================================================

enum class Language {
    PYTHON,
    JAVASCRIPT,
    JAVA
};

inline const char* language_to_string(Language lang) {
    switch (lang) {
        case Language::PYTHON: return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::JAVA: return "java";
    }
    return "unknown";
}

inline std::optional<Language> parse_language(const std::string &name) {
    if (name == "python") return Language::PYTHON;
    if (name == "javascript") return Language::JAVASCRIPT;
    if (name == "java") return Language::JAVA;
    return std::nullopt;
}

enum class SecurityMode {
    WARN,
    BLOCK
};

inline std::optional<SecurityMode> parse_security_mode(const std::string &name) {
    if (name == "warn") return SecurityMode::WARN;
    if (name == "block") return SecurityMode::BLOCK;
    return std::nullopt;
}

enum class ComparisonMode {
    EXACT,
    NORMALIZED,
    REGEX,
    CONTAINS
};

inline const char* comparison_mode_to_string(ComparisonMode mode) {
    switch (mode) {
        case ComparisonMode::EXACT: return "exact";
        case ComparisonMode::NORMALIZED: return "normalized";
        case ComparisonMode::REGEX: return "regex";
        case ComparisonMode::CONTAINS: return "contains";
    }
    return "unknown";
}

inline std::optional<ComparisonMode> parse_comparison_mode(const std::string &name) {
    if (name == "exact") return ComparisonMode::EXACT;
    if (name == "normalized") return ComparisonMode::NORMALIZED;
    if (name == "regex") return ComparisonMode::REGEX;
    if (name == "contains") return ComparisonMode::CONTAINS;
    return std::nullopt;
}

//==============================================================================
// 输入
//==============================================================================

/**
 * @brief 测试用例
 *
 * comparison_mode 保留原始字符串：未知模式不是配置错误，
 * 而是该用例的比对失败（带说明信息）。
 */
struct TestCase {
    std::string input;
    std::string expected_output;
    std::optional<int> timeout_ms;          ///< 单用例超时（毫秒），取值范围见 limits
    std::string comparison_mode = "exact";
    int points = 1;                         ///< 权重，>= 0
    std::string description;                ///< 为空时使用 "Test case N"
};

/**
 * @brief 提交级评测参数
 */
struct EvaluateOptions {
    int timeout_ms = 2000;
    int memory_limit_mb = 256;
    int max_output_kb = 64;
    bool enable_quality_checks = true;
    SecurityMode security_mode = SecurityMode::WARN;
};

namespace limits {
    constexpr int MIN_CASE_TIMEOUT_MS = 50;
    constexpr int MAX_CASE_TIMEOUT_MS = 30000;
    constexpr int COMPILE_TIMEOUT_MS = 30000;
    constexpr size_t FIELD_PREVIEW = 500;     ///< 报告中文本字段的最大字符数
    constexpr size_t SUMMARY_PREVIEW = 300;   ///< 反馈摘要中单条错误的最大字符数
    constexpr int OUTPUT_KILLED_CODE = 137;   ///< 输出超限时的合成退出码
}

//==============================================================================
// 执行结果
//==============================================================================

/**
 * @brief 启动描述：argv 与工作目录，由语言插件生成
 *
 * command[0] 可以是命令名，执行前在 PATH 中查找。
 */
struct LaunchSpec {
    std::vector<std::string> command;
    std::string cwd;
};

/**
 * @brief 一次进程执行的结果，由 Supervisor 产生，评分后丢弃
 */
struct ExecutionOutcome {
    std::string stdout_text;
    std::string stderr_text;
    int return_code = -1;
    bool truncated = false;   ///< 输出超限被提前终止
};

enum class CaseStatus {
    PASSED,
    FAILED,
    TIMEOUT,
    RUNTIME_ERROR,
    ERROR
};

inline const char* case_status_to_string(CaseStatus status) {
    switch (status) {
        case CaseStatus::PASSED: return "passed";
        case CaseStatus::FAILED: return "failed";
        case CaseStatus::TIMEOUT: return "timeout";
        case CaseStatus::RUNTIME_ERROR: return "runtime_error";
        case CaseStatus::ERROR: return "error";
    }
    return "error";
}

/**
 * @brief 单个测试用例的评测结果
 */
struct TestCaseResult {
    int case_number = 0;                  ///< 从 1 开始，与输入顺序一致
    std::string description;
    int points = 0;
    CaseStatus status = CaseStatus::ERROR;
    std::optional<std::string> output;
    std::optional<std::string> expected;
    std::optional<std::string> actual;
    std::optional<std::string> error;
    std::optional<std::string> stderr_text;
};

/**
 * @brief 提交的评测报告，交给持久化层和反馈生成器
 */
struct EvaluationReport {
    int passed = 0;
    int failed = 0;
    int total_points = 0;
    int earned_points = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<TestCaseResult> test_results;
};

} // namespace sjudge

#endif // SJUDGE_CORE_TYPES_H
