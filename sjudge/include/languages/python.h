/**
 * @file languages/python.h
 * @brief Python 语言插件
 *
 * 学生代码写入 main.py，另生成 _wrapper.py：
 * 先尝试设置地址空间与 CPU 时间上限（平台不支持时静默跳过），
 * 再以 __main__ 身份执行 main.py。CPU 秒数由每个用例作为第一个参数
 * 传入，缺省时用提交级超时。解释器以 -I -u 启动，
 * 忽略用户环境变量和 site 目录，输出不缓冲。
 */

#ifndef SJUDGE_LANGUAGES_PYTHON_H
#define SJUDGE_LANGUAGES_PYTHON_H

#include <string>
#include <sstream>
#include <algorithm>
#include "core/language.h"
#include "core/utils.h"
#include "core/logger.h"

namespace sjudge {
namespace languages {

class PythonLanguage : public LanguagePlugin {
private:
    std::string interpreter_;

    static int cpu_seconds_for(int timeout_ms) {
        return std::max(1, timeout_ms / 1000);
    }

    static std::string build_wrapper(const std::string &program_path, int memory_limit_mb, int timeout_ms) {
        long long memory_bytes = static_cast<long long>(std::max(1, memory_limit_mb)) * 1024 * 1024;

        std::ostringstream w;
        w << "import sys\n"
          << "\n"
          << "_cpu_seconds = " << cpu_seconds_for(timeout_ms) << "\n"
          << "if len(sys.argv) > 1:\n"
          << "    try:\n"
          << "        _cpu_seconds = max(1, int(sys.argv[1]))\n"
          << "    except ValueError:\n"
          << "        pass\n"
          << "\n"
          << "try:\n"
          << "    import resource\n"
          << "except ImportError:\n"
          << "    resource = None\n"
          << "\n"
          << "if resource is not None:\n"
          << "    try:\n"
          << "        resource.setrlimit(resource.RLIMIT_AS, (" << memory_bytes << ", " << memory_bytes << "))\n"
          << "    except Exception:\n"
          << "        pass\n"
          << "    try:\n"
          << "        resource.setrlimit(resource.RLIMIT_CPU, (_cpu_seconds, _cpu_seconds))\n"
          << "    except Exception:\n"
          << "        pass\n"
          << "\n"
          << "_path = " << quote_repr(program_path) << "\n"
          << "with open(_path, 'r', encoding='utf-8') as _f:\n"
          << "    _source = _f.read()\n"
          << "sys.argv = [_path]\n"
          << "exec(compile(_source, _path, 'exec'), {'__name__': '__main__', '__file__': _path})\n";
        return w.str();
    }

public:
    explicit PythonLanguage(const std::string &interpreter = "python3") : interpreter_(interpreter) {}

    std::string id() const override { return "python"; }
    Language language() const override { return Language::PYTHON; }
    std::string display_name() const override { return "Python 3"; }
    std::string source_extension() const override { return ".py"; }

    Result<LaunchSpec> prepare(const PrepareContext &ctx) override {
        std::string program_path = ctx.work_dir + "/main.py";
        std::string wrapper_path = ctx.work_dir + "/_wrapper.py";

        SJUDGE_TRY(write_file(program_path, ctx.code));
        SJUDGE_TRY(write_file(wrapper_path, build_wrapper(program_path, ctx.memory_limit_mb, ctx.timeout_ms)));

        LOG_DEBUG << "Prepared python program (" << ctx.code.size() << " bytes) in " << ctx.work_dir;

        LaunchSpec spec;
        spec.command = {interpreter_, "-I", "-u", wrapper_path};
        spec.cwd = ctx.work_dir;
        return spec;
    }

    LaunchSpec launch_for_case(const LaunchSpec &prepared, int timeout_ms) const override {
        LaunchSpec spec = prepared;
        spec.command.push_back(std::to_string(cpu_seconds_for(timeout_ms)));
        return spec;
    }
};

} // namespace languages
} // namespace sjudge

#endif // SJUDGE_LANGUAGES_PYTHON_H
