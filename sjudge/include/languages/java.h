/**
 * @file languages/java.h
 * @brief Java 语言插件
 *
 * 源文件必须以 public 类名命名：取第一个 "public class X" 的 X，
 * 找不到时用 Main。编译只做一次，编译失败对整个提交生效。
 */

#ifndef SJUDGE_LANGUAGES_JAVA_H
#define SJUDGE_LANGUAGES_JAVA_H

#include <string>
#include <cctype>
#include "core/language.h"
#include "core/supervisor.h"
#include "core/utils.h"
#include "core/logger.h"

namespace sjudge {
namespace languages {

namespace detail {

inline bool is_java_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// 从 pos 开始至少一个空白，返回空白之后的位置，没有空白返回 npos
inline size_t skip_spaces(const std::string &s, size_t pos) {
    size_t i = pos;
    while (i < s.size() && is_java_space(s[i])) i++;
    return i == pos ? std::string::npos : i;
}

} // namespace detail

/**
 * @brief 提取主类名
 *
 * 找第一个 "public<空白>class<空白><标识符>"，取标识符。
 * 只看第一个匹配，不解析嵌套类或注释。
 */
inline std::string detect_java_class_name(const std::string &code) {
    static const std::string PUBLIC = "public";
    static const std::string CLASS = "class";

    for (size_t pos = code.find(PUBLIC); pos != std::string::npos; pos = code.find(PUBLIC, pos + 1)) {
        size_t i = detail::skip_spaces(code, pos + PUBLIC.size());
        if (i == std::string::npos || code.compare(i, CLASS.size(), CLASS) != 0) continue;

        i = detail::skip_spaces(code, i + CLASS.size());
        if (i == std::string::npos) continue;

        size_t end = i;
        while (end < code.size() && detail::is_word_char(code[end])) end++;
        if (end > i) {
            return code.substr(i, end - i);
        }
    }
    return "Main";
}

class JavaLanguage : public LanguagePlugin {
private:
    std::string javac_;
    std::string java_;
    int compile_timeout_ms_;

    static constexpr size_t COMPILER_OUTPUT_LIMIT = 1024 * 1024;

public:
    JavaLanguage(const std::string &javac = "javac", const std::string &java = "java",
                 int compile_timeout_ms = 30000)
        : javac_(javac), java_(java), compile_timeout_ms_(compile_timeout_ms) {}

    std::string id() const override { return "java"; }
    Language language() const override { return Language::JAVA; }
    std::string display_name() const override { return "Java"; }
    std::string source_extension() const override { return ".java"; }
    bool needs_compile() const override { return true; }

    Result<LaunchSpec> prepare(const PrepareContext &ctx) override {
        std::string class_name = detect_java_class_name(ctx.code);
        std::string source_path = ctx.work_dir + "/" + class_name + ".java";
        SJUDGE_TRY(write_file(source_path, ctx.code));

        LOG_DEBUG << "Compiling " << class_name << ".java with " << javac_;

        LaunchSpec compile;
        compile.command = {javac_, source_path};
        compile.cwd = ctx.work_dir;

        auto res = run_process(compile, "", compile_timeout_ms_, COMPILER_OUTPUT_LIMIT);
        if (!res.ok()) {
            return SJUDGE_ERROR(ErrorCode::COMPILATION_FAILED, "Compilation failed: " + res.error().message());
        }

        const ExecutionOutcome &out = res.value();
        if (out.return_code != 0) {
            std::string info = !out.stderr_text.empty() ? out.stderr_text : out.stdout_text;
            LOG_DEBUG << "javac exited with " << out.return_code;
            return SJUDGE_ERROR(ErrorCode::COMPILATION_FAILED, "Compilation failed: " + info);
        }

        LaunchSpec spec;
        spec.command = {java_, "-cp", ctx.work_dir, class_name};
        spec.cwd = ctx.work_dir;
        return spec;
    }
};

} // namespace languages
} // namespace sjudge

#endif // SJUDGE_LANGUAGES_JAVA_H
