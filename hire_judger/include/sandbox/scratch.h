/**
 * @file scratch.h
 * @brief 一次执行专用的临时目录
 *
 * 每次执行独占一个目录，对象析构时整个目录被删除，
 * 无论执行是正常结束、运行出错、超时还是宿主侧出错。
 */

#ifndef HIRE_SANDBOX_SCRATCH_H
#define HIRE_SANDBOX_SCRATCH_H

#include <string>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <climits>
#include <cstdlib>
#include <cerrno>
#include <cstring>

#include "core/error.h"

namespace hire {
namespace sandbox {

class ScratchDir {
private:
    std::string path_;

    explicit ScratchDir(std::string path) : path_(std::move(path)) {}

public:
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ScratchDir(ScratchDir &&other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    ScratchDir& operator=(ScratchDir &&other) noexcept {
        if (this != &other) {
            remove();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    ~ScratchDir() {
        remove();
    }

    /**
     * @brief 在 base 下创建 hire_XXXXXX 目录（0700）
     */
    static Result<ScratchDir> create(const std::string &base) {
        std::string tmpl = base + "/hire_XXXXXX";
        if (tmpl.size() >= PATH_MAX) {
            return HIRE_ERROR(ErrorCode::SCRATCH_CREATE_FAILED, "scratch path too long");
        }
        char buf[PATH_MAX];
        std::strcpy(buf, tmpl.c_str());
        if (mkdtemp(buf) == nullptr) {
            return HIRE_ERROR(ErrorCode::SCRATCH_CREATE_FAILED,
                "mkdtemp(" + tmpl + "): " + std::strerror(errno));
        }
        return ScratchDir(std::string(buf));
    }

    const std::string& path() const { return path_; }

    /**
     * @brief 写入目录内的文件，返回完整路径
     */
    Result<std::string> write_file(const std::string &name, const std::string &content) const {
        std::string full = path_ + "/" + name;
        std::ofstream out(full, std::ios::binary | std::ios::trunc);
        if (!out) {
            return HIRE_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot create " + full);
        }
        out << content;
        out.close();
        if (!out) {
            return HIRE_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot write " + full);
        }
        return full;
    }

    void remove() noexcept {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        path_.clear();
    }
};

} // namespace sandbox
} // namespace hire

#endif // HIRE_SANDBOX_SCRATCH_H
