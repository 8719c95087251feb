/**
 * @file compare.h
 * @brief 输出比对
 *
 * 四种比对方式：
 * - exact:      逐字节相等（调用方已去掉实际输出首尾空白）
 * - normalized: 两侧都做空白规范化后相等
 * - regex:      expected 作为正则（Perl 语法），完整匹配 actual
 * - contains:   actual 包含 expected
 *
 * 任何情况都不抛异常，失败时附带说明信息。
 */

#ifndef SJUDGE_CORE_COMPARE_H
#define SJUDGE_CORE_COMPARE_H

#include <string>
#include <stdexcept>
#include <boost/regex.hpp>
#include <optional>
#include "core/types.h"
#include "core/utils.h"

namespace sjudge {

struct CompareResult {
    bool matches = false;
    std::optional<std::string> message;

    static CompareResult match() { return CompareResult{true, std::nullopt}; }
    static CompareResult mismatch(const std::string &msg) { return CompareResult{false, msg}; }
};

inline CompareResult compare_exact(const std::string &actual, const std::string &expected) {
    if (actual == expected) {
        return CompareResult::match();
    }
    return CompareResult::mismatch("Expected " + quote_repr(expected) + ", got " + quote_repr(actual));
}

inline CompareResult compare_normalized(const std::string &actual, const std::string &expected) {
    std::string a = normalize_whitespace(actual);
    std::string e = normalize_whitespace(expected);
    if (a == e) {
        return CompareResult::match();
    }
    return CompareResult::mismatch("Expected " + quote_repr(e) + ", got " + quote_repr(a));
}

/**
 * @brief 正则完整匹配
 *
 * 用 Boost.Regex 的非递归匹配器：输出长度到上限也不会耗尽栈，
 * 回溯过多时抛 std::runtime_error，这里转成比对失败。
 */
inline CompareResult compare_regex(const std::string &actual, const std::string &pattern) {
    boost::regex re;
    try {
        re.assign(pattern, boost::regex::perl);
    } catch (const boost::regex_error &e) {
        return CompareResult::mismatch(std::string("Invalid regex pattern: ") + e.what());
    }

    try {
        if (boost::regex_match(actual, re)) {
            return CompareResult::match();
        }
    } catch (const std::runtime_error &e) {
        return CompareResult::mismatch(std::string("Regex match aborted: ") + e.what());
    }
    return CompareResult::mismatch("Output " + quote_repr(preview(actual, limits::FIELD_PREVIEW)) +
                                   " doesn't match pattern " + quote_repr(pattern));
}

inline CompareResult compare_contains(const std::string &actual, const std::string &expected) {
    if (actual.find(expected) != std::string::npos) {
        return CompareResult::match();
    }
    return CompareResult::mismatch("Expected output to contain " + quote_repr(expected) +
                                   ", got " + quote_repr(actual));
}

inline CompareResult compare(const std::string &actual, const std::string &expected, ComparisonMode mode) {
    switch (mode) {
        case ComparisonMode::EXACT: return compare_exact(actual, expected);
        case ComparisonMode::NORMALIZED: return compare_normalized(actual, expected);
        case ComparisonMode::REGEX: return compare_regex(actual, expected);
        case ComparisonMode::CONTAINS: return compare_contains(actual, expected);
    }
    return CompareResult::mismatch("Unknown comparison mode");
}

/**
 * @brief 按模式名比对，未知模式名返回失败而不是抛异常
 */
inline CompareResult compare(const std::string &actual, const std::string &expected, const std::string &mode) {
    auto parsed = parse_comparison_mode(mode);
    if (!parsed) {
        return CompareResult::mismatch("Unknown comparison mode: " + mode);
    }
    return compare(actual, expected, *parsed);
}

} // namespace sjudge

#endif // SJUDGE_CORE_COMPARE_H
