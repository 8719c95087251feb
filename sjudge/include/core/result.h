/**
 * @file result.h
 * @brief 评测结果输出
 *
 * - result.txt：汇总行 + XML 明细，供持久化层读取
 * - cur_status.txt：评测进度
 * - format_summary：面向学生的纯文本反馈
 */

#ifndef SJUDGE_CORE_RESULT_H
#define SJUDGE_CORE_RESULT_H

#include <string>
#include <sstream>
#include <vector>
#include <optional>
#include <cstdio>
#include <cstdarg>
#include <unistd.h>
#include <sys/file.h>
#include "core/types.h"
#include "core/utils.h"
#include "core/error.h"
#include "core/logger.h"

namespace sjudge {

/**
 * @brief 把一个用例结果写成 <test> 元素
 */
inline void write_test_xml(std::ostream &out, const TestCaseResult &r) {
    out << "<test num=\"" << r.case_number << "\""
        << " status=\"" << case_status_to_string(r.status) << "\""
        << " points=\"" << r.points << "\""
        << " description=\"" << xml_escape(r.description) << "\">" << std::endl;

    auto element = [&out](const char *tag, const std::optional<std::string> &text) {
        if (text) {
            out << "<" << tag << ">" << xml_escape(*text) << "</" << tag << ">" << std::endl;
        }
    };
    element("output", r.output);
    element("expected", r.expected);
    element("actual", r.actual);
    element("error", r.error);
    element("stderr", r.stderr_text);

    out << "</test>" << std::endl;
}

/**
 * @brief 生成 result.txt 的完整内容
 */
inline std::string render_report(const EvaluationReport &report) {
    std::ostringstream out;
    out << "passed " << report.passed << "\n"
        << "failed " << report.failed << "\n"
        << "total_points " << report.total_points << "\n"
        << "earned_points " << report.earned_points << "\n"
        << "details\n"
        << "<tests>\n";
    for (const auto &r : report.test_results) {
        write_test_xml(out, r);
    }
    for (const auto &e : report.errors) {
        out << "<error>" << xml_escape(e) << "</error>\n";
    }
    for (const auto &w : report.warnings) {
        out << "<warning>" << xml_escape(w) << "</warning>\n";
    }
    out << "</tests>\n";
    return out.str();
}

/**
 * @brief 写入 <result_path>/result.txt
 */
inline Result<void> write_report(const std::string &result_path, const EvaluationReport &report) {
    return write_file(result_path + "/result.txt", render_report(report));
}

/**
 * @brief 作业本身无法评测（配置错误、语言不支持等）
 */
inline Result<void> write_judgement_failed(const std::string &result_path, const std::string &info) {
    std::ostringstream out;
    out << "error Judgement Failed\n"
        << "details\n"
        << "<error>" << xml_escape(info) << "</error>\n";
    return write_file(result_path + "/result.txt", out.str());
}

/**
 * @brief 报告评测状态（覆盖写，带文件锁）
 */
inline void report_status(const std::string &result_path, const char *status) {
    FILE *f = fopen((result_path + "/cur_status.txt").c_str(), "a");
    if (f == NULL) {
        LOG_DEBUG << "Cannot open cur_status.txt under " << result_path;
        return;
    }
    if (flock(fileno(f), LOCK_EX) != -1) {
        if (ftruncate(fileno(f), 0) != -1) {
            fprintf(f, "%s\n", status);
            fflush(f);
        }
        flock(fileno(f), LOCK_UN);
    }
    fclose(f);
}

inline bool report_status_f(const std::string &result_path, const char *fmt, ...) {
    const int MaxL = 512;
    char status[MaxL];
    va_list ap;
    va_start(ap, fmt);
    int res = vsnprintf(status, MaxL, fmt, ap);
    va_end(ap);

    if (res < 0 || res >= MaxL) {
        return false;
    }
    report_status(result_path, status);
    return true;
}

/**
 * @brief 生成代码评测部分的文字反馈
 *
 * 最多列出 5 条警告、3 条错误（每条截到 300 字符），多余的只给数量。
 */
inline std::string format_summary(const EvaluationReport &report) {
    const size_t MAX_WARNINGS = 5;
    const size_t MAX_ERRORS = 3;

    std::vector<std::string> sections;

    if (report.passed || report.failed) {
        sections.push_back("=== CODE EVALUATION ===");

        int total_tests = report.passed + report.failed;
        std::ostringstream line;
        if (report.total_points > 0) {
            line << "Test Results: " << report.passed << "/" << total_tests
                 << " tests passed (" << report.earned_points << "/" << report.total_points << " points)";
        } else {
            line << "Test Results: " << report.passed << " passed, " << report.failed << " failed";
        }
        sections.push_back(line.str());

        if (total_tests > 0) {
            char rate[64];
            snprintf(rate, sizeof(rate), "Success Rate: %.1f%%", report.passed * 100.0 / total_tests);
            sections.push_back(rate);
        }
    }

    if (!report.warnings.empty()) {
        sections.push_back("\nCode Quality Warnings:");
        for (size_t i = 0; i < report.warnings.size() && i < MAX_WARNINGS; i++) {
            sections.push_back("  " + std::to_string(i + 1) + ". " + report.warnings[i]);
        }
        if (report.warnings.size() > MAX_WARNINGS) {
            sections.push_back("  ... and " + std::to_string(report.warnings.size() - MAX_WARNINGS) +
                               " more warnings");
        }
    }

    if (!report.errors.empty()) {
        sections.push_back("\nErrors Encountered:");
        for (size_t i = 0; i < report.errors.size() && i < MAX_ERRORS; i++) {
            sections.push_back("  " + std::to_string(i + 1) + ". " +
                               preview(report.errors[i], limits::SUMMARY_PREVIEW));
        }
        if (report.errors.size() > MAX_ERRORS) {
            sections.push_back("  ... and " + std::to_string(report.errors.size() - MAX_ERRORS) +
                               " more errors");
        }
    }

    std::string out;
    for (size_t i = 0; i < sections.size(); i++) {
        if (i) out += "\n";
        out += sections[i];
    }
    return out;
}

} // namespace sjudge

#endif // SJUDGE_CORE_RESULT_H
