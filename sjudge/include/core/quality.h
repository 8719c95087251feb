/**
 * @file quality.h
 * @brief 源码静态检查
 *
 * 只做子串扫描，不执行代码。结果是建议性的警告；
 * 在 block 安全模式下，带 "unsafe"/"dynamic" 字样的警告会拦截整个提交。
 */

#ifndef SJUDGE_CORE_QUALITY_H
#define SJUDGE_CORE_QUALITY_H

#include <string>
#include <vector>
#include <algorithm>
#include "core/types.h"
#include "core/utils.h"

namespace sjudge {

namespace quality {
    constexpr size_t MAX_CODE_CHARS = 50000;
    constexpr size_t MAX_LINES = 1000;

    const char* const UNSAFE_IMPORTS = "Warning: Potentially unsafe imports detected";
    const char* const DYNAMIC_EXEC = "Warning: Dynamic code execution detected";
}

/**
 * @brief 检查源码，返回警告列表
 *
 * 目前只有 Python 有规则，其他语言返回空列表。
 */
inline std::vector<std::string> check_code_quality(const std::string &code, Language lang) {
    std::vector<std::string> warnings;

    if (lang != Language::PYTHON) {
        return warnings;
    }

    if (utf8_length(code) > quality::MAX_CODE_CHARS) {
        warnings.push_back("Code is very long (>50K chars)");
    }
    if (code.find("import os") != std::string::npos ||
        code.find("import subprocess") != std::string::npos) {
        warnings.push_back(quality::UNSAFE_IMPORTS);
    }
    if (code.find("eval(") != std::string::npos ||
        code.find("exec(") != std::string::npos) {
        warnings.push_back(quality::DYNAMIC_EXEC);
    }

    // 与 split("\n") 计数一致：换行数 + 1
    size_t lines = static_cast<size_t>(std::count(code.begin(), code.end(), '\n')) + 1;
    if (lines > quality::MAX_LINES) {
        warnings.push_back("Code has " + std::to_string(lines) +
                           " lines (consider breaking into functions)");
    }

    return warnings;
}

/**
 * @brief 警告是否触发安全策略拦截
 */
inline bool is_security_warning(const std::string &warning) {
    return contains_ci(warning, "unsafe") || contains_ci(warning, "dynamic");
}

} // namespace sjudge

#endif // SJUDGE_CORE_QUALITY_H
