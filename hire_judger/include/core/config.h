/**
 * @file config.h
 * @brief 配置系统
 *
 * 管理 key-value 格式的引擎配置文件：
 *
 *   # 注释
 *   python_path /usr/bin/python3
 *   time_limit_ms 5000
 *   weight_coding 0.5
 */

#ifndef HIRE_CORE_CONFIG_H
#define HIRE_CORE_CONFIG_H

#include <string>
#include <map>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include "core/error.h"

namespace hire {

/**
 * @brief 配置管理类
 */
class Config {
private:
    std::map<std::string, std::string> data_;

public:
    Config() = default;

    /**
     * @brief 从文件加载配置，后加载的同名键覆盖先前的值
     */
    Result<void> load(const std::string &filename) {
        std::ifstream fin(filename.c_str());
        if (!fin) {
            return HIRE_ERROR(ErrorCode::FILE_NOT_FOUND, "cannot open config: " + filename);
        }
        std::string line;
        int lineno = 0;
        while (std::getline(fin, line)) {
            lineno++;
            size_t hash = line.find('#');
            if (hash != std::string::npos) {
                line.erase(hash);
            }
            std::istringstream iss(line);
            std::string key, val;
            if (!(iss >> key)) {
                continue;
            }
            if (!(iss >> val)) {
                return HIRE_ERROR(ErrorCode::CONFIG_PARSE_ERROR,
                    filename + ":" + std::to_string(lineno) + ": missing value for " + key);
            }
            data_[key] = val;
        }
        return Ok();
    }

    void set(const std::string &key, const std::string &val) {
        data_[key] = val;
    }

    std::string get_str(const std::string &key, const std::string &default_val = "") const {
        auto it = data_.find(key);
        return (it != data_.end()) ? it->second : default_val;
    }

    int get_int(const std::string &key, int default_val = 0) const {
        auto it = data_.find(key);
        return (it != data_.end()) ? atoi(it->second.c_str()) : default_val;
    }

    double get_double(const std::string &key, double default_val = 0) const {
        auto it = data_.find(key);
        return (it != data_.end()) ? atof(it->second.c_str()) : default_val;
    }

    /**
     * @brief on/off, true/false, yes/no, 1/0
     */
    bool get_bool(const std::string &key, bool default_val = false) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        const std::string &v = it->second;
        return v == "on" || v == "true" || v == "yes" || v == "1";
    }
};

} // namespace hire

#endif // HIRE_CORE_CONFIG_H
