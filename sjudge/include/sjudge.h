/**
 * @file sjudge.h
 * @brief sjudge 评测引擎主头文件
 *
 * 使用方式：
 *   #include "sjudge.h"
 *   using namespace sjudge;
 *
 *   auto registry = languages::make_builtin_registry();
 *   Evaluator evaluator(registry);
 *   EvaluationReport report = evaluator.evaluate(code, Language::PYTHON, cases);
 */

#ifndef SJUDGE_H
#define SJUDGE_H

// 标准库
#include <string>
#include <vector>

// 核心模块
#include "core/error.h"
#include "core/logger.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/quality.h"
#include "core/compare.h"
#include "core/supervisor.h"
#include "core/language.h"
#include "core/harness.h"
#include "core/result.h"

// 语言插件
#include "languages/all.h"

namespace sjudge {

/**
 * @brief 一个评测作业：提交 + 测试数据 + 限制
 */
struct Job {
    Language language = Language::PYTHON;
    std::string code;
    std::vector<TestCase> cases;
    EvaluateOptions options;
};

/**
 * @brief 从 submission.conf 读取提交级参数
 */
inline Result<EvaluateOptions> load_options(const Config &config) {
    EvaluateOptions opts;

    auto timeout = config.get_int("timeout_ms", opts.timeout_ms);
    if (!timeout.ok()) return timeout.error();
    auto memory = config.get_int("memory_limit_mb", opts.memory_limit_mb);
    if (!memory.ok()) return memory.error();
    auto output = config.get_int("max_output_kb", opts.max_output_kb);
    if (!output.ok()) return output.error();
    auto quality = config.get_switch("enable_quality_checks", opts.enable_quality_checks);
    if (!quality.ok()) return quality.error();

    SJUDGE_ENSURE(timeout.value() > 0, ErrorCode::CONFIG_INVALID_VALUE, "timeout_ms must be positive");
    SJUDGE_ENSURE(memory.value() > 0, ErrorCode::CONFIG_INVALID_VALUE, "memory_limit_mb must be positive");
    SJUDGE_ENSURE(output.value() > 0, ErrorCode::CONFIG_INVALID_VALUE, "max_output_kb must be positive");

    opts.timeout_ms = timeout.value();
    opts.memory_limit_mb = memory.value();
    opts.max_output_kb = output.value();
    opts.enable_quality_checks = quality.value();

    std::string mode = config.get_str("security_mode", "warn");
    auto security = parse_security_mode(mode);
    if (!security) {
        return SJUDGE_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "Unknown security_mode: " + mode);
    }
    opts.security_mode = *security;
    return opts;
}

/**
 * @brief 读取第 num 个测试用例
 *
 * 输入文件可以缺省（视为空输入），期望输出文件必须存在。
 */
inline Result<TestCase> load_test_case(const Config &config, const std::string &work_path, int num) {
    TestCase tc;

    std::string input_file = work_path + "/" + config.get_input_filename(num);
    if (file_exists(input_file)) {
        auto input = read_file(input_file);
        if (!input.ok()) return input.error();
        tc.input = std::move(input).value();
    }

    auto expected = read_file(work_path + "/" + config.get_output_filename(num));
    if (!expected.ok()) return expected.error();
    tc.expected_output = std::move(expected).value();

    if (config.has("timeout_ms", num)) {
        auto t = config.get_int("timeout_ms", num, 0);
        if (!t.ok()) return t.error();
        tc.timeout_ms = t.value();
    }

    auto points = config.get_int("points", num, 1);
    if (!points.ok()) return points.error();
    SJUDGE_ENSURE(points.value() >= 0, ErrorCode::CONFIG_INVALID_VALUE,
                  "points_" + std::to_string(num) + " must not be negative");
    tc.points = points.value();

    tc.comparison_mode = config.get_str("comparison_mode", num, "exact");
    tc.description = config.get_str("description", num, "");
    return tc;
}

/**
 * @brief 加载作业目录
 *
 * <work_path>/submission.conf、answer.code、input<N>.txt、output<N>.txt
 */
inline Result<Job> load_job(const std::string &work_path) {
    Config config;
    SJUDGE_TRY(config.load(work_path + "/submission.conf"));

    Job job;
    std::string lang = config.get_str("language");
    auto parsed = parse_language(lang);
    if (!parsed) {
        return SJUDGE_ERROR(ErrorCode::UNSUPPORTED_LANGUAGE, "Language not supported: " + lang);
    }
    job.language = *parsed;

    auto opts = load_options(config);
    if (!opts.ok()) return opts.error();
    job.options = opts.value();

    auto code = read_file(work_path + "/answer.code");
    if (!code.ok()) return code.error();
    job.code = std::move(code).value();

    auto n_tests = config.get_int("n_tests", 0);
    if (!n_tests.ok()) return n_tests.error();
    SJUDGE_ENSURE(n_tests.value() >= 0, ErrorCode::CONFIG_INVALID_VALUE, "n_tests must not be negative");

    for (int i = 1; i <= n_tests.value(); i++) {
        auto tc = load_test_case(config, work_path, i);
        if (!tc.ok()) return tc.error();
        job.cases.push_back(std::move(tc).value());
    }
    return job;
}

/**
 * @brief 使用内置语言评测一份提交
 */
inline EvaluationReport evaluate(const std::string &code, Language lang,
                                 const std::vector<TestCase> &cases,
                                 const EvaluateOptions &opts = EvaluateOptions(),
                                 const EngineSettings &settings = EngineSettings()) {
    LanguageRegistry registry = languages::make_builtin_registry(settings);
    Evaluator evaluator(registry, settings);
    return evaluator.evaluate(code, lang, cases, opts);
}

} // namespace sjudge

#endif // SJUDGE_H
