/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 文件操作
 * - 字符串处理
 * - 时间戳解析
 */

#ifndef HIRE_CORE_UTILS_H
#define HIRE_CORE_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <optional>
#include <chrono>
#include <ctime>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include "core/error.h"
#include "core/types.h"

namespace hire {

//==============================================================================
// 文件操作
//==============================================================================

/**
 * @brief 读取整个文件
 */
inline Result<std::string> read_file(const std::string &path) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) {
        return HIRE_ERROR(ErrorCode::FILE_NOT_FOUND, "cannot open " + path);
    }
    std::ostringstream oss;
    oss << fin.rdbuf();
    if (fin.bad()) {
        return HIRE_ERROR(ErrorCode::FILE_READ_ERROR, "cannot read " + path);
    }
    return oss.str();
}

/**
 * @brief 覆盖写入文件
 */
inline Result<void> write_file(const std::string &path, const std::string &content) {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout) {
        return HIRE_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot create " + path);
    }
    fout << content;
    fout.close();
    if (!fout) {
        return HIRE_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot write " + path);
    }
    return Ok();
}

/**
 * @brief 目录不存在时逐级创建
 */
inline Result<void> ensure_dir(const std::string &path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return HIRE_ERROR(ErrorCode::FILE_WRITE_ERROR,
            "cannot create directory " + path + ": " + ec.message());
    }
    return Ok();
}

//==============================================================================
// 字符串处理
//==============================================================================

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * @brief 去除首尾空白
 */
inline std::string trim(const std::string &s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) b++;
    while (e > b && is_space(s[e - 1])) e--;
    return s.substr(b, e - b);
}

/**
 * @brief 截断到 len 字节，超长时添加 "..."
 *
 * 不会把一个 UTF-8 多字节字符切成两半。
 */
inline std::string truncate_text(const std::string &s, size_t len) {
    if (s.size() <= len) {
        return s;
    }
    size_t cut = len;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return s.substr(0, cut) + "...";
}

inline std::vector<std::string> split_lines(const std::string &s) {
    std::vector<std::string> lines;
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &sep) {
    std::string res;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) res += sep;
        res += parts[i];
    }
    return res;
}

/**
 * @brief 四舍五入到 digits 位小数
 */
inline double round_to(double v, int digits) {
    double p = std::pow(10.0, digits);
    return std::round(v * p) / p;
}

/**
 * @brief 定点格式化，如 format_fixed(3.14159, 2) == "3.14"
 */
inline std::string format_fixed(double v, int digits) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(digits) << v;
    return oss.str();
}

//==============================================================================
// 时间戳
//==============================================================================

/**
 * @brief 解析 UTC 时间戳 YYYY-MM-DDTHH:MM:SS（允许空格分隔、Z 后缀和秒的小数部分）
 * @return 缺少字段、字段越界或有多余字符时返回 nullopt
 */
inline std::optional<TimePoint> parse_iso8601(const std::string &text) {
    std::string s = trim(text);
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
    }
    int year, mon, day, hour, min, sec;
    char sep;
    int used = 0;
    if (sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
               &year, &mon, &day, &sep, &hour, &min, &sec, &used) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != 't' && sep != ' ') {
        return std::nullopt;
    }
    // 秒后面只允许 ".数字"，小数部分忽略
    std::string rest = s.substr(static_cast<size_t>(used));
    if (!rest.empty()) {
        if (rest[0] != '.' || rest.size() == 1) {
            return std::nullopt;
        }
        for (size_t i = 1; i < rest.size(); i++) {
            if (rest[i] < '0' || rest[i] > '9') {
                return std::nullopt;
            }
        }
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour < 0 || hour > 23
        || min < 0 || min > 59 || sec < 0 || sec > 60) {
        return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t t = timegm(&tm);
    if (t == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    // timegm 会把 2 月 30 日之类的日期顺延，顺延过的不接受
    if (tm.tm_mday != day || tm.tm_mon != mon - 1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

/**
 * @brief 两个时间点之间的分钟数（可为小数）
 */
inline double minutes_between(const TimePoint &start, const TimePoint &end) {
    auto secs = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
    return secs.count() / 60.0;
}

} // namespace hire

#endif // HIRE_CORE_UTILS_H
