/**
 * @file languages/javascript.h
 * @brief JavaScript 语言插件
 *
 * 直接用 node 运行 main.js。除了共用的超时和输出上限外不设资源限制。
 */

#ifndef SJUDGE_LANGUAGES_JAVASCRIPT_H
#define SJUDGE_LANGUAGES_JAVASCRIPT_H

#include <string>
#include "core/language.h"
#include "core/utils.h"

namespace sjudge {
namespace languages {

class JavaScriptLanguage : public LanguagePlugin {
private:
    std::string runtime_;

public:
    explicit JavaScriptLanguage(const std::string &runtime = "node") : runtime_(runtime) {}

    std::string id() const override { return "javascript"; }
    Language language() const override { return Language::JAVASCRIPT; }
    std::string display_name() const override { return "JavaScript (Node.js)"; }
    std::string source_extension() const override { return ".js"; }

    Result<LaunchSpec> prepare(const PrepareContext &ctx) override {
        std::string program_path = ctx.work_dir + "/main.js";
        SJUDGE_TRY(write_file(program_path, ctx.code));

        LaunchSpec spec;
        spec.command = {runtime_, program_path};
        spec.cwd = ctx.work_dir;
        return spec;
    }
};

} // namespace languages
} // namespace sjudge

#endif // SJUDGE_LANGUAGES_JAVASCRIPT_H
