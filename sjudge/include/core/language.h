/**
 * @file language.h
 * @brief 语言插件系统
 *
 * 插件把源码落盘（必要时编译），给出运行命令；
 * 注册表由调用方显式构造并持有，不是全局单例。
 */

#ifndef SJUDGE_CORE_LANGUAGE_H
#define SJUDGE_CORE_LANGUAGE_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include "core/types.h"
#include "core/error.h"

namespace sjudge {

/**
 * @brief 准备上下文
 *
 * 每次提交只准备一次，所有测试用例共用同一个工作目录和启动命令。
 */
struct PrepareContext {
    std::string code;           ///< 提交的源码
    std::string work_dir;       ///< 本次评测的临时目录
    int timeout_ms = 2000;      ///< 提交级超时，部分语言据此设置 CPU 限制
    int memory_limit_mb = 256;  ///< 地址空间上限（尽力而为）
};

/**
 * @brief 语言插件接口
 */
class LanguagePlugin {
public:
    virtual ~LanguagePlugin() = default;

    /// 语言标识符（"python" / "javascript" / "java"）
    virtual std::string id() const = 0;

    virtual Language language() const = 0;

    virtual std::string display_name() const = 0;

    /// 源文件扩展名（含点）
    virtual std::string source_extension() const = 0;

    /// 是否有编译步骤
    virtual bool needs_compile() const { return false; }

    /**
     * @brief 写入源码（及包装脚本），需要时编译，返回运行命令
     *
     * @return 编译失败返回 COMPILATION_FAILED，消息即报告中展示的文本；
     *         写文件失败返回 FILE_WRITE_ERROR
     */
    virtual Result<LaunchSpec> prepare(const PrepareContext &ctx) = 0;

    /**
     * @brief 按单个用例的超时调整启动命令
     *
     * prepare 只做一次；CPU 限制需要跟随用例超时的语言在这里追加参数。
     * 默认原样返回。
     */
    virtual LaunchSpec launch_for_case(const LaunchSpec &prepared, int timeout_ms) const {
        (void)timeout_ms;
        return prepared;
    }
};

/**
 * @brief 语言注册表
 */
class LanguageRegistry {
private:
    std::map<Language, std::shared_ptr<LanguagePlugin>> plugins_;

public:
    LanguageRegistry() = default;

    void register_plugin(std::shared_ptr<LanguagePlugin> plugin) {
        Language lang = plugin->language();
        plugins_[lang] = std::move(plugin);
    }

    /// 注册语言插件（便捷模板）
    template<typename T, typename... Args>
    void register_language(Args&&... args) {
        register_plugin(std::make_shared<T>(std::forward<Args>(args)...));
    }

    /// 未注册时返回 nullptr
    LanguagePlugin* get(Language lang) const {
        auto it = plugins_.find(lang);
        return (it != plugins_.end()) ? it->second.get() : nullptr;
    }

    LanguagePlugin* get(const std::string &id) const {
        for (const auto &kv : plugins_) {
            if (kv.second->id() == id) return kv.second.get();
        }
        return nullptr;
    }

    bool has(Language lang) const {
        return plugins_.find(lang) != plugins_.end();
    }

    std::vector<std::string> list() const {
        std::vector<std::string> result;
        for (const auto &kv : plugins_) {
            result.push_back(kv.second->id());
        }
        return result;
    }

    size_t count() const {
        return plugins_.size();
    }
};

} // namespace sjudge

#endif // SJUDGE_CORE_LANGUAGE_H
