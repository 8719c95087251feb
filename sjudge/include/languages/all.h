/**
 * @file languages/all.h
 * @brief 语言插件统一入口
 */

#ifndef SJUDGE_LANGUAGES_ALL_H
#define SJUDGE_LANGUAGES_ALL_H

#include "core/language.h"
#include "core/config.h"
#include "languages/python.h"
#include "languages/javascript.h"
#include "languages/java.h"

namespace sjudge {
namespace languages {

/**
 * @brief 构造包含全部内置语言的注册表
 *
 * 外部工具命令取自 settings，便于指向非默认安装位置。
 */
inline LanguageRegistry make_builtin_registry(const EngineSettings &settings = EngineSettings()) {
    LanguageRegistry registry;
    registry.register_language<PythonLanguage>(settings.python_command);
    registry.register_language<JavaScriptLanguage>(settings.node_command);
    registry.register_language<JavaLanguage>(settings.javac_command, settings.java_command,
                                             settings.compile_timeout_ms);
    return registry;
}

} // namespace languages
} // namespace sjudge

#endif // SJUDGE_LANGUAGES_ALL_H
