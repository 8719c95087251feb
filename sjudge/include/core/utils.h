/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 字符串处理（UTF-8 截断、容错转码、空白规范化）
 * - 文件操作
 * - 临时工作目录
 */

#ifndef SJUDGE_CORE_UTILS_H
#define SJUDGE_CORE_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <unistd.h>
#include <sys/stat.h>
#include "core/error.h"
#include "core/logger.h"

namespace sjudge {

//==============================================================================
// 字符串处理
//==============================================================================

/// 与 Python str.split() 相同的空白字符集
inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline std::string trim(const std::string &s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) start++;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) end--;
    return s.substr(start, end - start);
}

/**
 * @brief 去掉首尾空白，内部连续空白压缩为单个空格
 */
inline std::string normalize_whitespace(const std::string &s) {
    std::string r;
    r.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_space(c)) {
            pending_space = !r.empty();
            continue;
        }
        if (pending_space) {
            r += ' ';
            pending_space = false;
        }
        r += c;
    }
    return r;
}

/**
 * @brief 当前位置上一个完整 UTF-8 序列的长度，非法时返回 0
 */
inline size_t utf8_sequence_length(const std::string &s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len;
    if (c < 0x80) return 1;
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
    else return 0;

    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; k++) {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 0;
    }
    unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
    if (len == 3) {
        if (c == 0xE0 && c1 < 0xA0) return 0;   // 过长编码
        if (c == 0xED && c1 >= 0xA0) return 0;  // 代理区
    } else if (len == 4) {
        if (c == 0xF0 && c1 < 0x90) return 0;
        if (c == 0xF4 && c1 >= 0x90) return 0;
    }
    return len;
}

/**
 * @brief 把任意字节转成合法 UTF-8，非法字节替换为 U+FFFD
 */
inline std::string sanitize_utf8(const std::string &bytes) {
    std::string r;
    r.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            r += "\xEF\xBF\xBD";
            i++;
        } else {
            r.append(bytes, i, len);
            i += len;
        }
    }
    return r;
}

/**
 * @brief 字符数（按 UTF-8 码点计数，非法字节各算一个）
 */
inline size_t utf8_length(const std::string &s) {
    size_t i = 0, count = 0;
    while (i < s.size()) {
        size_t step = utf8_sequence_length(s, i);
        i += (step == 0 ? 1 : step);
        count++;
    }
    return count;
}

/**
 * @brief 截取前 len 个字符（按 UTF-8 码点计数），不追加省略号
 */
inline std::string preview(const std::string &s, size_t len = 500) {
    size_t i = 0, count = 0;
    while (i < s.size() && count < len) {
        size_t step = utf8_sequence_length(s, i);
        i += (step == 0 ? 1 : step);
        count++;
    }
    return s.substr(0, i);
}

/**
 * @brief 以 Python repr 的形式给字符串加引号，用于比对失败信息
 */
inline std::string quote_repr(const std::string &s) {
    bool has_single = s.find('\'') != std::string::npos;
    bool has_double = s.find('"') != std::string::npos;
    char q = (has_single && !has_double) ? '"' : '\'';

    std::string r(1, q);
    for (char c : s) {
        switch (c) {
            case '\\': r += "\\\\"; break;
            case '\n': r += "\\n"; break;
            case '\r': r += "\\r"; break;
            case '\t': r += "\\t"; break;
            default:
                if (c == q) {
                    r += '\\';
                    r += c;
                } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(c));
                    r += buf;
                } else {
                    r += c;
                }
        }
    }
    r += q;
    return r;
}

/**
 * @brief XML 文本/属性转义
 *
 * 先转成合法 UTF-8，再把 XML 1.0 不允许的控制字符（除 \t \n \r 外的
 * 0x00-0x1F）替换为 U+FFFD。
 */
inline std::string xml_escape(const std::string &s) {
    std::string clean = sanitize_utf8(s);
    std::string r;
    r.reserve(clean.size());
    for (char c : clean) {
        switch (c) {
            case '&':  r += "&amp;"; break;
            case '<':  r += "&lt;"; break;
            case '>':  r += "&gt;"; break;
            case '"':  r += "&quot;"; break;
            case '\'': r += "&apos;"; break;
            case '\t': case '\n': case '\r': r += c; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    r += "\xEF\xBF\xBD";
                } else {
                    r += c;
                }
        }
    }
    return r;
}

inline bool contains_ci(std::string haystack, std::string needle) {
    for (auto &c : haystack) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    for (auto &c : needle) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return haystack.find(needle) != std::string::npos;
}

//==============================================================================
// 文件操作
//==============================================================================

inline Result<void> write_file(const std::string &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return SJUDGE_ERROR(ErrorCode::FILE_WRITE_ERROR,
                            "Cannot open " + path + ": " + strerror(errno));
    }
    out << content;
    out.flush();
    if (!out) {
        return SJUDGE_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot write " + path);
    }
    return Ok();
}

inline Result<std::string> read_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return SJUDGE_ERROR(ErrorCode::FILE_READ_ERROR, "Cannot open " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

inline bool file_exists(const std::string &path) {
    return access(path.c_str(), F_OK) == 0;
}

/**
 * @brief 在 PATH 中查找可执行文件
 * @return 完整路径，找不到时返回空字符串
 */
inline std::string find_in_path(const std::string &name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char *path = getenv("PATH");
    if (!path) return "";

    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

//==============================================================================
// 临时工作目录
//==============================================================================

/**
 * @brief 每次评测一个的临时目录，析构时连同内容一起删除
 */
class ScratchDir {
private:
    std::string path_;

public:
    ScratchDir() = default;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ScratchDir(ScratchDir &&other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    ~ScratchDir() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN << "Failed to remove scratch dir " << path_ << ": " << ec.message();
        }
    }

    /**
     * @brief 在 root 下创建 prefixXXXXXX 目录
     */
    static Result<ScratchDir> create(const std::string &root, const std::string &prefix = "sjudge_eval_") {
        std::string tmpl = root + "/" + prefix + "XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            return SJUDGE_ERROR(ErrorCode::FILE_WRITE_ERROR,
                                "Cannot create scratch dir under " + root + ": " + strerror(errno));
        }
        ScratchDir dir;
        dir.path_ = buf.data();
        return Result<ScratchDir>(std::move(dir));
    }

    const std::string& path() const { return path_; }

    std::string file(const std::string &name) const {
        return path_ + "/" + name;
    }
};

} // namespace sjudge

#endif // SJUDGE_CORE_UTILS_H
