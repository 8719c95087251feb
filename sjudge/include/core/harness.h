/**
 * @file harness.h
 * @brief 评测流程
 *
 * 一次提交的完整评测：
 * 1. 静态检查（block 模式下命中安全类警告直接拦截，不执行任何进程）
 * 2. 在临时目录中准备/编译程序，只做一次
 * 3. 按输入顺序逐个运行测试用例，分类结果并计分
 *
 * 所有错误都在这里转换成报告字段，evaluate() 不向调用方抛异常。
 */

#ifndef SJUDGE_CORE_HARNESS_H
#define SJUDGE_CORE_HARNESS_H

#include <string>
#include <vector>
#include <exception>
#include <algorithm>
#include "core/types.h"
#include "core/error.h"
#include "core/logger.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/quality.h"
#include "core/compare.h"
#include "core/language.h"
#include "core/supervisor.h"

namespace sjudge {

namespace messages {
    const char* const BLOCKED = "Blocked by security policy";
    const char* const RUNTIME_ERROR = "Runtime error";
    const char* const EXECUTION_TIMEOUT = "Execution timeout";
    const char* const PSEUDO_CASE = "Run without test cases";
}

/**
 * @brief 单用例实际使用的超时
 *
 * 用例自带的正数超时优先（限制在 [50ms, 30s]），否则用提交级默认值。
 */
inline int effective_timeout_ms(const TestCase &tc, int default_ms) {
    if (tc.timeout_ms && *tc.timeout_ms > 0) {
        return std::clamp(*tc.timeout_ms, limits::MIN_CASE_TIMEOUT_MS, limits::MAX_CASE_TIMEOUT_MS);
    }
    return default_ms;
}

inline std::string case_description(const TestCase &tc, int case_number) {
    if (!tc.description.empty()) {
        return tc.description;
    }
    return "Test case " + std::to_string(case_number);
}

class Evaluator {
private:
    const LanguageRegistry &registry_;
    EngineSettings settings_;

    static size_t output_limit_bytes(const EvaluateOptions &opts) {
        return static_cast<size_t>(std::max(1, opts.max_output_kb)) * 1024;
    }

    static void record_failure(EvaluationReport &report, const TestCaseResult &r) {
        report.failed++;
        report.errors.push_back(preview("Case " + std::to_string(r.case_number) + " (" +
                                        r.description + "): " + r.error.value_or(""),
                                        limits::FIELD_PREVIEW));
    }

    /**
     * @brief 运行一个用例并分类
     */
    TestCaseResult run_case(int case_number, const TestCase &tc, const LanguagePlugin &plugin,
                            const LaunchSpec &launch, const EvaluateOptions &opts) const {
        TestCaseResult r;
        r.case_number = case_number;
        r.description = case_description(tc, case_number);
        r.points = tc.points;

        int timeout_used = effective_timeout_ms(tc, opts.timeout_ms);

        auto res = run_process(plugin.launch_for_case(launch, timeout_used), tc.input,
                               timeout_used, output_limit_bytes(opts));
        if (!res.ok()) {
            if (res.error().is(ErrorCode::TIMEOUT)) {
                r.status = CaseStatus::TIMEOUT;
                r.error = "Timeout after " + std::to_string(timeout_used) + "ms";
            } else {
                if (is_system_error(res.error().code())) {
                    LOG_ERROR << "Case " << case_number << ": " << res.error().to_string();
                }
                r.status = CaseStatus::ERROR;
                r.error = preview(res.error().message(), limits::FIELD_PREVIEW);
            }
            return r;
        }

        const ExecutionOutcome &out = res.value();
        if (out.return_code != 0) {
            std::string msg = trim(!out.stderr_text.empty() ? out.stderr_text : out.stdout_text);
            r.status = CaseStatus::RUNTIME_ERROR;
            r.error = msg.empty() ? std::string(messages::RUNTIME_ERROR) : preview(msg, limits::FIELD_PREVIEW);
            if (!out.stderr_text.empty()) {
                r.stderr_text = preview(out.stderr_text, limits::FIELD_PREVIEW);
            }
            return r;
        }

        std::string actual = trim(out.stdout_text);
        CompareResult cmp = compare(actual, tc.expected_output, tc.comparison_mode);
        if (cmp.matches) {
            r.status = CaseStatus::PASSED;
            r.output = preview(actual, limits::FIELD_PREVIEW);
        } else {
            r.status = CaseStatus::FAILED;
            r.error = preview(cmp.message.value_or(""), limits::FIELD_PREVIEW);
            r.expected = preview(tc.expected_output, limits::FIELD_PREVIEW);
            r.actual = preview(actual, limits::FIELD_PREVIEW);
        }
        return r;
    }

    /**
     * @brief 没有测试用例时只运行一次，按退出码判定
     */
    void run_once(EvaluationReport &report, const LanguagePlugin &plugin, const LaunchSpec &launch,
                  const EvaluateOptions &opts) const {
        TestCaseResult r;
        r.case_number = 1;
        r.description = messages::PSEUDO_CASE;
        r.points = 1;
        report.total_points = 1;

        auto res = run_process(plugin.launch_for_case(launch, opts.timeout_ms), "",
                               opts.timeout_ms, output_limit_bytes(opts));
        if (!res.ok()) {
            if (res.error().is(ErrorCode::TIMEOUT)) {
                r.status = CaseStatus::TIMEOUT;
                r.error = messages::EXECUTION_TIMEOUT;
            } else {
                r.status = CaseStatus::ERROR;
                r.error = preview(res.error().message(), limits::FIELD_PREVIEW);
            }
        } else if (res.value().return_code == 0) {
            r.status = CaseStatus::PASSED;
            r.output = preview(res.value().stdout_text, limits::FIELD_PREVIEW);
        } else {
            const ExecutionOutcome &out = res.value();
            std::string msg = trim(!out.stderr_text.empty() ? out.stderr_text : out.stdout_text);
            r.status = CaseStatus::FAILED;
            r.error = msg.empty() ? std::string(messages::RUNTIME_ERROR) : preview(msg, limits::FIELD_PREVIEW);
            if (!out.stderr_text.empty()) {
                r.stderr_text = preview(out.stderr_text, limits::FIELD_PREVIEW);
            }
        }

        if (r.status == CaseStatus::PASSED) {
            report.passed = 1;
            report.earned_points = 1;
        } else {
            report.failed = 1;
            report.errors.push_back(*r.error);
        }
        report.test_results.push_back(r);
    }

    /**
     * @brief 准备或编译失败：整个提交不得分，每个用例标记为 error
     */
    static void fail_all(EvaluationReport &report, const std::vector<TestCase> &cases, const std::string &message) {
        std::string msg = preview(message, limits::FIELD_PREVIEW);
        report.errors.push_back(msg);

        if (cases.empty()) {
            TestCaseResult r;
            r.case_number = 1;
            r.description = messages::PSEUDO_CASE;
            r.points = 1;
            r.status = CaseStatus::ERROR;
            r.error = msg;
            report.total_points = 1;
            report.failed = 1;
            report.test_results.push_back(r);
            return;
        }

        for (size_t i = 0; i < cases.size(); i++) {
            int num = static_cast<int>(i) + 1;
            TestCaseResult r;
            r.case_number = num;
            r.description = case_description(cases[i], num);
            r.points = cases[i].points;
            r.status = CaseStatus::ERROR;
            r.error = msg;
            report.total_points += r.points;
            report.failed++;
            report.test_results.push_back(r);
        }
    }

    EvaluationReport evaluate_impl(const std::string &code, Language lang,
                                   const std::vector<TestCase> &cases,
                                   const EvaluateOptions &opts) const {
        EvaluationReport report;

        // 安全拦截总是基于检查结果，报告里是否展示警告由开关决定
        std::vector<std::string> warnings = check_code_quality(code, lang);
        if (opts.enable_quality_checks) {
            report.warnings = warnings;
        }

        if (opts.security_mode == SecurityMode::BLOCK &&
            std::any_of(warnings.begin(), warnings.end(), is_security_warning)) {
            LOG_INFO << "Submission blocked by security policy (" << language_to_string(lang) << ")";
            report.errors.push_back(messages::BLOCKED);
            return report;
        }

        LanguagePlugin *plugin = registry_.get(lang);
        if (!plugin) {
            report.errors.push_back(std::string("Language not supported: ") + language_to_string(lang));
            return report;
        }

        auto scratch = ScratchDir::create(settings_.scratch_root);
        if (!scratch.ok()) {
            LOG_ERROR << scratch.error().to_string();
            fail_all(report, cases, scratch.error().message());
            return report;
        }
        ScratchDir dir = std::move(scratch).value();

        PrepareContext ctx;
        ctx.code = code;
        ctx.work_dir = dir.path();
        ctx.timeout_ms = opts.timeout_ms;
        ctx.memory_limit_mb = opts.memory_limit_mb;

        auto prepared = plugin->prepare(ctx);
        if (!prepared.ok()) {
            if (is_system_error(prepared.error().code())) {
                LOG_ERROR << "Prepare failed: " << prepared.error().to_string();
            } else {
                LOG_INFO << plugin->id() << " submission rejected: " << error_code_str(prepared.error().code());
            }
            fail_all(report, cases, prepared.error().message());
            return report;
        }
        const LaunchSpec &launch = prepared.value();

        if (cases.empty()) {
            run_once(report, *plugin, launch, opts);
            return report;
        }

        for (size_t i = 0; i < cases.size(); i++) {
            int num = static_cast<int>(i) + 1;
            const TestCase &tc = cases[i];
            report.total_points += tc.points;

            TestCaseResult r;
            try {
                r = run_case(num, tc, *plugin, launch, opts);
            } catch (const std::exception &e) {
                LOG_ERROR << "Case " << num << " raised: " << e.what();
                r = TestCaseResult();
                r.case_number = num;
                r.description = case_description(tc, num);
                r.points = tc.points;
                r.status = CaseStatus::ERROR;
                r.error = preview(e.what(), limits::FIELD_PREVIEW);
            }

            if (r.status == CaseStatus::PASSED) {
                report.passed++;
                report.earned_points += r.points;
            } else {
                record_failure(report, r);
            }
            LOG_DEBUG << "Case " << num << ": " << case_status_to_string(r.status);
            report.test_results.push_back(r);
        }

        return report;
    }

public:
    explicit Evaluator(const LanguageRegistry &registry, const EngineSettings &settings = EngineSettings())
        : registry_(registry), settings_(settings) {}

    /**
     * @brief 评测一份提交
     *
     * @param code 源码
     * @param lang 语言
     * @param cases 测试用例，可以为空；负分按 0 计
     * @param opts 超时、内存、输出上限、检查开关和安全模式
     */
    EvaluationReport evaluate(const std::string &code, Language lang,
                              const std::vector<TestCase> &cases,
                              const EvaluateOptions &opts = EvaluateOptions()) const {
        std::vector<TestCase> checked = cases;
        for (size_t i = 0; i < checked.size(); i++) {
            if (checked[i].points < 0) {
                LOG_WARN << "Case " << (i + 1) << " has negative points (" << checked[i].points
                         << "), counted as 0";
                checked[i].points = 0;
            }
        }

        try {
            EvaluationReport report = evaluate_impl(code, lang, checked, opts);
            LOG_INFO << "Evaluated " << language_to_string(lang) << " submission ("
                     << code.size() << " bytes): " << report.passed << " passed, "
                     << report.failed << " failed, " << report.earned_points << "/"
                     << report.total_points << " points";
            return report;
        } catch (const std::exception &e) {
            LOG_ERROR << "Evaluation aborted: " << e.what();
            EvaluationReport report;
            fail_all(report, checked, std::string("Internal error: ") + e.what());
            return report;
        }
    }

    const EngineSettings& settings() const { return settings_; }
};

} // namespace sjudge

#endif // SJUDGE_CORE_HARNESS_H
