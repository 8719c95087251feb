/**
 * @file config.h
 * @brief 配置系统
 *
 * key-value 格式的配置文件：每行一个 "key value"，value 取到行尾，
 * 以 # 开头的行为注释。带编号的键写作 key_N。
 */

#ifndef SJUDGE_CORE_CONFIG_H
#define SJUDGE_CORE_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <climits>
#include <cerrno>
#include "core/error.h"
#include "core/logger.h"
#include "core/utils.h"

namespace sjudge {

/**
 * @brief 配置管理类
 */
class Config {
private:
    std::map<std::string, std::string> data_;

    static std::string numbered(const std::string &key, int num) {
        std::ostringstream sout;
        sout << key << "_" << num;
        return sout.str();
    }

public:
    Config() = default;

    /**
     * @brief 从文件加载配置，已有的键会被覆盖
     * @return 文件无法打开时返回 FILE_READ_ERROR
     */
    Result<void> load(const std::string &filename) {
        std::ifstream fin(filename.c_str());
        if (!fin) {
            return SJUDGE_ERROR(ErrorCode::FILE_READ_ERROR, "Cannot open config " + filename);
        }
        std::string line;
        while (std::getline(fin, line)) {
            parse_line(line);
        }
        return Ok();
    }

    /**
     * @brief 从字符串加载配置（测试用）
     */
    void load_string(const std::string &content) {
        std::istringstream in(content);
        std::string line;
        while (std::getline(in, line)) {
            parse_line(line);
        }
    }

    void parse_line(const std::string &raw) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            return;
        }
        size_t sep = line.find_first_of(" \t");
        if (sep == std::string::npos) {
            data_[line] = "";
            return;
        }
        data_[line.substr(0, sep)] = trim(line.substr(sep + 1));
    }

    void set(const std::string &key, const std::string &val) {
        data_[key] = val;
    }

    bool has(const std::string &key) const {
        return data_.count(key) != 0;
    }

    bool has(const std::string &key, int num) const {
        return has(numbered(key, num));
    }

    bool is(const std::string &key, const std::string &val) const {
        auto it = data_.find(key);
        return it != data_.end() && it->second == val;
    }

    std::string get_str(const std::string &key, const std::string &default_val = "") const {
        auto it = data_.find(key);
        return (it != data_.end()) ? it->second : default_val;
    }

    /**
     * @brief 获取带编号的字符串配置，只查 key_N
     */
    std::string get_str(const std::string &key, int num, const std::string &default_val) const {
        return get_str(numbered(key, num), default_val);
    }

    /**
     * @brief 获取整数配置
     *
     * 键不存在时返回默认值；存在但不是整数时返回 CONFIG_INVALID_VALUE。
     */
    Result<int> get_int(const std::string &key, int default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        const std::string &text = it->second;
        errno = 0;
        char *end = nullptr;
        long v = strtol(text.c_str(), &end, 10);
        if (text.empty() || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
            return SJUDGE_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                                "Invalid integer for " + key + ": " + text);
        }
        return static_cast<int>(v);
    }

    /**
     * @brief 获取带编号的整数配置，查找顺序: key_N -> default_val
     */
    Result<int> get_int(const std::string &key, int num, int default_val) const {
        return get_int(numbered(key, num), default_val);
    }

    /**
     * @brief on/off 开关
     */
    Result<bool> get_switch(const std::string &key, bool default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        if (it->second == "on") return true;
        if (it->second == "off") return false;
        return SJUDGE_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                            "Expected on/off for " + key + ": " + it->second);
    }

    std::string get_input_filename(int num) const {
        std::ostringstream name;
        name << get_str("input_pre", "input") << num << "." << get_str("input_suf", "txt");
        return name.str();
    }

    std::string get_output_filename(int num) const {
        std::ostringstream name;
        name << get_str("output_pre", "output") << num << "." << get_str("output_suf", "txt");
        return name.str();
    }

    const std::map<std::string, std::string>& data() const { return data_; }
};

/**
 * @brief 引擎级设置：外部工具命令、临时目录、日志
 */
struct EngineSettings {
    std::string python_command = "python3";
    std::string node_command = "node";
    std::string javac_command = "javac";
    std::string java_command = "java";
    int compile_timeout_ms = 30000;
    std::string scratch_root;
    std::optional<LogLevel> log_level;  ///< 未设置时沿用 SJUDGE_LOG_LEVEL 或默认级别
    std::string log_file;

    EngineSettings() {
        const char *tmp = getenv("TMPDIR");
        scratch_root = (tmp && *tmp) ? tmp : "/tmp";
    }

    static Result<EngineSettings> from_config(const Config &config) {
        EngineSettings s;
        s.python_command = config.get_str("python_command", s.python_command);
        s.node_command = config.get_str("node_command", s.node_command);
        s.javac_command = config.get_str("javac_command", s.javac_command);
        s.java_command = config.get_str("java_command", s.java_command);
        s.scratch_root = config.get_str("scratch_root", s.scratch_root);
        s.log_file = config.get_str("log_file");

        auto timeout = config.get_int("compile_timeout_ms", s.compile_timeout_ms);
        if (!timeout.ok()) return timeout.error();
        if (timeout.value() <= 0) {
            return SJUDGE_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "compile_timeout_ms must be positive");
        }
        s.compile_timeout_ms = timeout.value();

        if (config.has("log_level")) {
            auto level = parse_log_level(config.get_str("log_level"));
            if (!level) {
                return SJUDGE_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                                    "Unknown log_level: " + config.get_str("log_level"));
            }
            s.log_level = level;
        }
        return s;
    }
};

} // namespace sjudge

#endif // SJUDGE_CORE_CONFIG_H
