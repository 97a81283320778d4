/**
 * @file process.h
 * @brief 子进程执行器
 *
 * 每次运行 fork 一个全新的子进程：
 * - 独立进程组，超时时整组 SIGKILL，不留孤儿进程
 * - 只通过 stdin / stdout / stderr 三个管道与父进程通信
 * - 环境变量完全替换为配置给出的最小集合
 * - rlimit 限制 CPU、地址空间、写文件大小，禁止 core dump
 * - 墙钟超时由父进程轮询控制
 *
 * 不做 seccomp / cgroup / namespace 隔离。
 */

#ifndef HIRE_SANDBOX_PROCESS_H
#define HIRE_SANDBOX_PROCESS_H

#include <string>
#include <vector>
#include <chrono>
#include <mutex>
#include <cstring>
#include <cerrno>
#include <algorithm>

#include <unistd.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include "core/error.h"

namespace hire {
namespace sandbox {

//==============================================================================
// 执行配置与结果
//==============================================================================

struct ProcessConfig {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::string> env;       ///< "KEY=VALUE"，子进程只看到这些
    std::string work_dir;
    std::string stdin_data;

    int time_limit_ms = 5000;           ///< 墙钟限制
    int memory_limit_kb = 524288;       ///< 0 表示不限制地址空间
    int output_limit_kb = 1024;         ///< 子进程写文件的上限
    size_t capture_limit = 65536;       ///< stdout/stderr 各自最多保留的字节数
};

enum class ExitKind {
    EXITED,
    SIGNALED,
    TIMEOUT
};

struct ProcessResult {
    ExitKind kind = ExitKind::EXITED;
    int exit_code = -1;
    int signal = 0;
    int real_time_ms = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool ok() const { return kind == ExitKind::EXITED && exit_code == 0; }
    bool timed_out() const { return kind == ExitKind::TIMEOUT; }
};

//==============================================================================
// 子进程执行器
//==============================================================================

class Process {
private:
    ProcessConfig config_;

    /**
     * @brief 管道两端，析构时关闭仍打开的一端
     */
    struct Pipe {
        int fd[2] = {-1, -1};

        ~Pipe() { close_read(); close_write(); }

        bool open() { return pipe2(fd, O_CLOEXEC) == 0; }
        void close_read() { if (fd[0] >= 0) { ::close(fd[0]); fd[0] = -1; } }
        void close_write() { if (fd[1] >= 0) { ::close(fd[1]); fd[1] = -1; } }
    };

    /**
     * @brief 父进程忽略 SIGPIPE：子进程提前退出时写 stdin 只返回 EPIPE
     */
    static void ignore_sigpipe() {
        static std::once_flag once;
        std::call_once(once, [] {
            struct sigaction sa;
            memset(&sa, 0, sizeof(sa));
            sa.sa_handler = SIG_IGN;
            sigaction(SIGPIPE, &sa, nullptr);
        });
    }

    static void set_nonblock(int fd) {
        int flags = fcntl(fd, F_GETFL);
        if (flags >= 0) {
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
    }

    /**
     * @brief 设置资源限制（子进程中调用）
     */
    static void setup_rlimits(const ProcessConfig &config) {
        struct rlimit rl;

        // CPU 时间，墙钟超时之外的兜底
        rl.rlim_cur = (config.time_limit_ms + 999) / 1000 + 1;
        rl.rlim_max = rl.rlim_cur + 1;
        setrlimit(RLIMIT_CPU, &rl);

        if (config.memory_limit_kb > 0) {
            rl.rlim_cur = rl.rlim_max = config.memory_limit_kb * 1024ULL;
            setrlimit(RLIMIT_AS, &rl);
        }

        rl.rlim_cur = rl.rlim_max = config.output_limit_kb * 1024ULL;
        setrlimit(RLIMIT_FSIZE, &rl);

        rl.rlim_cur = rl.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &rl);
    }

    /**
     * @brief 子进程执行
     *
     * fork 之后只允许 async-signal-safe 调用，argv/envp 在 fork 前构建好。
     */
    [[noreturn]] static void child_exec(const ProcessConfig &config,
                                        int in_fd, int out_fd, int err_fd,
                                        char *const *argv, char *const *envp) {
        setpgid(0, 0);

        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &sa, nullptr);

        if (dup2(in_fd, STDIN_FILENO) < 0 ||
            dup2(out_fd, STDOUT_FILENO) < 0 ||
            dup2(err_fd, STDERR_FILENO) < 0) {
            _exit(127);
        }

        if (!config.work_dir.empty() && chdir(config.work_dir.c_str()) < 0) {
            _exit(127);
        }

        setup_rlimits(config);

        execve(config.program.c_str(), argv, envp);
        _exit(127);
    }

    /**
     * @brief 读取一次可读数据，返回 false 表示 EOF 或出错
     */
    bool drain(int fd, std::string &buf, bool &truncated) const {
        char chunk[4096];
        while (true) {
            ssize_t n = read(fd, chunk, sizeof(chunk));
            if (n > 0) {
                size_t room = config_.capture_limit > buf.size()
                    ? config_.capture_limit - buf.size() : 0;
                size_t take = std::min(room, static_cast<size_t>(n));
                buf.append(chunk, take);
                if (take < static_cast<size_t>(n)) {
                    truncated = true;
                }
                continue;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

    static void kill_group(pid_t pid) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
    }

public:
    explicit Process(ProcessConfig config) : config_(std::move(config)) {}

    /**
     * @brief 执行程序
     *
     * 只有宿主侧故障（pipe/fork 失败）返回错误；
     * 子进程自身的任何结局都体现在 ProcessResult 中。
     */
    Result<ProcessResult> run() {
        ignore_sigpipe();

        // 1. fork 前准备 argv / envp
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(config_.program.c_str()));
        for (const auto &arg : config_.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        std::vector<char*> envp;
        for (const auto &e : config_.env) {
            envp.push_back(const_cast<char*>(e.c_str()));
        }
        envp.push_back(nullptr);

        // 2. 创建管道（O_CLOEXEC：并发 fork 的其他子进程不会继承）
        Pipe in, out, err;
        if (!in.open() || !out.open() || !err.open()) {
            return HIRE_ERROR(ErrorCode::PIPE_FAILED, std::string("pipe2: ") + strerror(errno));
        }

        auto start_time = std::chrono::steady_clock::now();
        auto deadline = start_time + std::chrono::milliseconds(config_.time_limit_ms);

        // 3. fork
        pid_t pid = fork();
        if (pid < 0) {
            return HIRE_ERROR(ErrorCode::FORK_FAILED, std::string("fork: ") + strerror(errno));
        }
        if (pid == 0) {
            child_exec(config_, in.fd[0], out.fd[1], err.fd[1], argv.data(), envp.data());
        }

        // 父进程
        setpgid(pid, pid);
        in.close_read();
        out.close_write();
        err.close_write();
        set_nonblock(in.fd[1]);
        set_nonblock(out.fd[0]);
        set_nonblock(err.fd[0]);

        ProcessResult result;
        size_t written = 0;
        if (config_.stdin_data.empty()) {
            in.close_write();
        }

        // 4. 写 stdin、读 stdout/stderr，直到两个输出都 EOF 或超时
        bool timed_out = false;
        while (out.fd[0] >= 0 || err.fd[0] >= 0) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                timed_out = true;
                break;
            }
            int wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - now).count()) + 1;

            struct pollfd fds[3];
            int nfds = 0;
            int in_idx = -1, out_idx = -1, err_idx = -1;
            if (in.fd[1] >= 0) {
                fds[nfds] = {in.fd[1], POLLOUT, 0};
                in_idx = nfds++;
            }
            if (out.fd[0] >= 0) {
                fds[nfds] = {out.fd[0], POLLIN, 0};
                out_idx = nfds++;
            }
            if (err.fd[0] >= 0) {
                fds[nfds] = {err.fd[0], POLLIN, 0};
                err_idx = nfds++;
            }

            int ready = poll(fds, nfds, wait_ms);
            if (ready < 0) {
                if (errno == EINTR) continue;
                kill_group(pid);
                waitpid(pid, nullptr, 0);
                return HIRE_ERROR(ErrorCode::SYSTEM_ERROR, std::string("poll: ") + strerror(errno));
            }
            if (ready == 0) {
                continue;
            }

            if (in_idx >= 0 && fds[in_idx].revents) {
                if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                    in.close_write();
                } else {
                    ssize_t n = write(in.fd[1], config_.stdin_data.data() + written,
                                      config_.stdin_data.size() - written);
                    if (n > 0) {
                        written += static_cast<size_t>(n);
                    } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                        in.close_write();
                    }
                    if (written >= config_.stdin_data.size()) {
                        in.close_write();
                    }
                }
            }
            if (out_idx >= 0 && fds[out_idx].revents) {
                if (!drain(out.fd[0], result.stdout_data, result.stdout_truncated)) {
                    out.close_read();
                }
            }
            if (err_idx >= 0 && fds[err_idx].revents) {
                if (!drain(err.fd[0], result.stderr_data, result.stderr_truncated)) {
                    err.close_read();
                }
            }
        }
        in.close_write();

        // 5. 等待子进程退出（WNOWAIT：先不回收，保证进程组号在 kill 时仍有效）
        while (!timed_out) {
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            int ret = waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT);
            if (ret == 0 && info.si_pid == pid) break;
            if (ret < 0 && errno != EINTR) {
                kill_group(pid);
                waitpid(pid, nullptr, 0);
                return HIRE_ERROR(ErrorCode::SYSTEM_ERROR, std::string("waitid: ") + strerror(errno));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            usleep(1000);
        }

        // 整组 SIGKILL：超时的子进程，以及正常退出后仍残留的后代
        kill_group(pid);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

        auto end_time = std::chrono::steady_clock::now();
        result.real_time_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time).count());

        // 6. 分析结果
        if (timed_out) {
            result.kind = ExitKind::TIMEOUT;
        } else if (WIFEXITED(status)) {
            result.kind = ExitKind::EXITED;
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
            // RLIMIT_CPU 触发的 SIGXCPU 同样视为超时
            result.kind = (result.signal == SIGXCPU) ? ExitKind::TIMEOUT : ExitKind::SIGNALED;
        }
        return result;
    }

    const ProcessConfig& config() const { return config_; }
};

} // namespace sandbox
} // namespace hire

#endif // HIRE_SANDBOX_PROCESS_H
