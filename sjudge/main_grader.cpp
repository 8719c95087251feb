/**
 * @file main_grader.cpp
 * @brief 命令行评测入口
 *
 * 用法: sjudge_grader <work_path> <result_path> [engine.conf]
 *
 * work_path 下需要 submission.conf 与 answer.code，以及每个测试点的
 * input<N>.txt / output<N>.txt。结果写入 result_path/result.txt，
 * 反馈摘要打印到标准输出。
 *
 * 返回值：生成了报告（即使有用例失败）返回 0；作业本身无法评测返回 1。
 */

#include <iostream>
#include "sjudge.h"

using namespace sjudge;

static int fail_job(const std::string &result_path, const std::string &info) {
    LOG_ERROR << "Judgement failed: " << info;
    auto written = write_judgement_failed(result_path, info);
    if (!written.ok()) {
        LOG_ERROR << written.error().to_string();
    }
    return 1;
}

int main(int argc, char **argv) {
    if (argc != 3 && argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <work_path> <result_path> [engine.conf]" << std::endl;
        return 1;
    }

    std::string work_path = argv[1];
    std::string result_path = argv[2];

    EngineSettings settings;
    if (argc == 4) {
        Config engine_config;
        auto loaded = engine_config.load(argv[3]);
        if (!loaded.ok()) {
            return fail_job(result_path, loaded.error().message());
        }
        auto parsed = EngineSettings::from_config(engine_config);
        if (!parsed.ok()) {
            return fail_job(result_path, parsed.error().message());
        }
        settings = parsed.value();
    }

    if (settings.log_level) {
        LOG_SET_LEVEL(*settings.log_level);
    }
    if (!settings.log_file.empty() && !LOG_DEFAULT().add_file(settings.log_file)) {
        std::cerr << "Warning: cannot open log file " << settings.log_file << std::endl;
    }

    report_status(result_path, "Loading");
    auto job = load_job(work_path);
    if (!job.ok()) {
        return fail_job(result_path, job.error().message());
    }

    LOG_INFO << "Job " << work_path << ": " << language_to_string(job.value().language)
             << ", " << job.value().cases.size() << " test cases";

    LanguageRegistry registry = languages::make_builtin_registry(settings);
    Evaluator evaluator(registry, settings);

    report_status(result_path, "Judging");
    const Job &j = job.value();
    EvaluationReport report = evaluator.evaluate(j.code, j.language, j.cases, j.options);

    auto written = write_report(result_path, report);
    if (!written.ok()) {
        LOG_ERROR << written.error().to_string();
        return 1;
    }
    report_status_f(result_path, "Judged: %d/%d points", report.earned_points, report.total_points);

    std::string summary = format_summary(report);
    if (!summary.empty()) {
        std::cout << summary << std::endl;
    }
    return 0;
}
