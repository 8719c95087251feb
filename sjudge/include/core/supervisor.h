/**
 * @file supervisor.h
 * @brief 受限进程监管器
 *
 * 负责一个子进程一次执行的完整生命周期：
 * 1. fork + exec，stdin/stdout/stderr 全部接管道
 * 2. 两个排水线程并发读取 stdout/stderr（4 KiB 一块），
 *    任一流超过字节上限就置位共享标志并杀掉子进程
 * 3. 主线程写入 stdin 后关闭，同时以墙上时间为限等待子进程退出
 * 4. 超时则杀进程并返回 TIMEOUT 错误
 *
 * 两个流必须与等待并发排空：管道缓冲区有限，只读一个流会让
 * 往另一个流大量写入的子进程阻塞，最终整体死锁。
 */

#ifndef SJUDGE_CORE_SUPERVISOR_H
#define SJUDGE_CORE_SUPERVISOR_H

#include <string>
#include <vector>
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <climits>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/logger.h"

namespace sjudge {

struct SupervisorConfig {
    LaunchSpec launch;
    std::string stdin_text;
    int timeout_ms = 2000;
    size_t max_output_bytes = 64 * 1024;
};

class Supervisor {
private:
    static constexpr size_t CHUNK_SIZE = 4096;
    static constexpr int MIN_WAIT_MS = 100;
    static constexpr int DRAIN_GRACE_MS = 200;
    static constexpr int POLL_INTERVAL_MS = 20;

    SupervisorConfig config_;

    /**
     * @brief 排水线程与主线程共享的状态
     *
     * reaped 由 kill_mutex 保护：子进程回收之后不能再按 pid 发信号，
     * 否则可能打到复用了该 pid 的其他进程。
     */
    struct Shared {
        pid_t pid = -1;
        std::mutex kill_mutex;
        bool reaped = false;
        std::atomic<bool> exceeded{false};
        std::atomic<bool> abandon{false};
        std::atomic<int> active_drains{0};
    };

    struct Drain {
        int fd = -1;
        std::string data;
        size_t total = 0;
    };

    /**
     * @brief 杀掉子进程及其进程组，重复调用和已退出的进程都是安全的
     */
    static void kill_child(Shared &shared) {
        std::lock_guard<std::mutex> lock(shared.kill_mutex);
        if (shared.reaped || shared.pid <= 0) {
            return;
        }
        // ESRCH 表示已经不存在，忽略
        kill(-shared.pid, SIGKILL);
        kill(shared.pid, SIGKILL);
    }

    static void drain_loop(Drain &drain, Shared &shared, size_t limit) {
        char buf[CHUNK_SIZE];

        while (!shared.abandon.load()) {
            struct pollfd pfd;
            pfd.fd = drain.fd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int r = poll(&pfd, 1, POLL_INTERVAL_MS);
            if (r < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (r == 0) continue;

            ssize_t n = read(drain.fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0) break;

            drain.total += static_cast<size_t>(n);
            if (drain.total > limit) {
                size_t room = limit > drain.data.size() ? limit - drain.data.size() : 0;
                drain.data.append(buf, std::min(room, static_cast<size_t>(n)));
                shared.exceeded.store(true);
                kill_child(shared);
                break;
            }
            drain.data.append(buf, static_cast<size_t>(n));
        }

        shared.active_drains.fetch_sub(1);
    }

    static void close_fd(int &fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    static void close_pipe(int p[2]) {
        close_fd(p[0]);
        close_fd(p[1]);
    }

    /**
     * @brief 子进程：接管标准流后 exec，失败时把 errno 写回父进程
     *
     * fork 之后只调用 async-signal-safe 的函数。
     */
    [[noreturn]] static void child_exec(const char *program, char *const argv[], const char *cwd,
                                        int in_fd, int out_fd, int err_fd, int status_fd) {
        setpgid(0, 0);

        // 父进程忽略了 SIGPIPE，忽略状态会跨 exec 继承，这里恢复默认
        signal(SIGPIPE, SIG_DFL);

        if (dup2(in_fd, STDIN_FILENO) < 0 ||
            dup2(out_fd, STDOUT_FILENO) < 0 ||
            dup2(err_fd, STDERR_FILENO) < 0) {
            int err = errno;
            ssize_t ignored = write(status_fd, &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        if (cwd[0] != '\0' && chdir(cwd) < 0) {
            int err = errno;
            ssize_t ignored = write(status_fd, &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        struct rlimit rl;
        rl.rlim_cur = rl.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &rl);

        execv(program, argv);

        int err = errno;
        ssize_t ignored = write(status_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    static void ignore_sigpipe() {
        static std::once_flag flag;
        std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
    }

    static int decode_status(int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

public:
    explicit Supervisor(const SupervisorConfig &config) : config_(config) {}

    /**
     * @brief 执行并等待子进程
     *
     * @return 正常结束（包括非零退出码、输出超限）返回 ExecutionOutcome；
     *         超时返回 ErrorCode::TIMEOUT；无法启动返回 EXEC_FAILED 等系统错误
     */
    Result<ExecutionOutcome> run() {
        const auto &command = config_.launch.command;
        if (command.empty()) {
            return SJUDGE_ERROR(ErrorCode::EXEC_FAILED, "Empty command");
        }

        std::string program = find_in_path(command[0]);
        if (program.empty()) {
            return SJUDGE_ERROR(ErrorCode::EXEC_FAILED, "Command not found: " + command[0]);
        }

        ignore_sigpipe();

        // fork 之前准备好 argv，子进程里不再分配内存
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (size_t i = 1; i < command.size(); i++) {
            argv.push_back(const_cast<char*>(command[i].c_str()));
        }
        argv.push_back(nullptr);

        int in_pipe[2] = {-1, -1};
        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        int status_pipe[2] = {-1, -1};

        if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 ||
            pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(status_pipe, O_CLOEXEC) < 0) {
            int err = errno;
            close_pipe(in_pipe);
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            close_pipe(status_pipe);
            return SJUDGE_ERROR(ErrorCode::PIPE_FAILED, std::string("Pipe creation failed: ") + strerror(err));
        }

        auto start_time = std::chrono::steady_clock::now();
        pid_t pid = fork();

        if (pid < 0) {
            int err = errno;
            close_pipe(in_pipe);
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            close_pipe(status_pipe);
            return SJUDGE_ERROR(ErrorCode::FORK_FAILED, std::string("Fork failed: ") + strerror(err));
        }

        if (pid == 0) {
            child_exec(program.c_str(), argv.data(), config_.launch.cwd.c_str(),
                       in_pipe[0], out_pipe[1], err_pipe[1], status_pipe[1]);
        }

        // 父进程
        setpgid(pid, pid);
        close_fd(in_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);
        close_fd(status_pipe[1]);

        // exec 成功时 O_CLOEXEC 关闭写端，这里读到 EOF
        int exec_errno = 0;
        ssize_t got;
        do {
            got = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
        } while (got < 0 && errno == EINTR);
        close_fd(status_pipe[0]);

        if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
            int status;
            waitpid(pid, &status, 0);
            close_fd(in_pipe[1]);
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            return SJUDGE_ERROR(ErrorCode::EXEC_FAILED,
                                "Failed to execute " + command[0] + ": " + strerror(exec_errno));
        }

        LOG_DEBUG << "Spawned pid " << pid << " (" << command[0] << ")";

        Shared shared;
        shared.pid = pid;
        shared.active_drains.store(2);

        Drain out_drain;
        Drain err_drain;
        out_drain.fd = out_pipe[0];
        err_drain.fd = err_pipe[0];

        size_t limit = config_.max_output_bytes;
        std::thread out_thread(drain_loop, std::ref(out_drain), std::ref(shared), limit);
        std::thread err_thread(drain_loop, std::ref(err_drain), std::ref(shared), limit);

        // 写 stdin 并等待退出
        int wait_ms = std::max(MIN_WAIT_MS, config_.timeout_ms);
        auto deadline = start_time + std::chrono::milliseconds(wait_ms);

        int stdin_fd = in_pipe[1];
        size_t written = 0;
        const std::string &input = config_.stdin_text;
        if (input.empty()) {
            close_fd(stdin_fd);
        }

        bool timed_out = false;
        while (true) {
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            // WNOWAIT: 只探测不回收，回收放到持锁的地方做
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
                break;
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                LOG_DEBUG << "Pid " << pid << " exceeded " << wait_ms << "ms, killing";
                kill_child(shared);
                break;
            }

            if (stdin_fd >= 0) {
                struct pollfd pfd;
                pfd.fd = stdin_fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int r = poll(&pfd, 1, 1);
                if (r > 0 && (pfd.revents & POLLOUT)) {
                    size_t chunk = std::min(static_cast<size_t>(PIPE_BUF), input.size() - written);
                    ssize_t n = write(stdin_fd, input.data() + written, chunk);
                    if (n > 0) {
                        written += static_cast<size_t>(n);
                    } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
                        // 子进程已关闭读端
                        close_fd(stdin_fd);
                    }
                    if (written >= input.size()) {
                        close_fd(stdin_fd);
                    }
                } else if (r > 0) {
                    close_fd(stdin_fd);
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        close_fd(stdin_fd);

        // 清掉可能残留的孙进程，然后回收
        int status = 0;
        {
            std::lock_guard<std::mutex> lock(shared.kill_mutex);
            kill(-pid, SIGKILL);
            struct rusage usage;
            pid_t ret;
            do {
                ret = wait4(pid, &status, 0, &usage);
            } while (ret < 0 && errno == EINTR);
            shared.reaped = true;
        }

        auto grace_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(DRAIN_GRACE_MS);
        while (shared.active_drains.load() > 0 && std::chrono::steady_clock::now() < grace_deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        shared.abandon.store(true);
        out_thread.join();
        err_thread.join();
        close_fd(out_drain.fd);
        close_fd(err_drain.fd);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        LOG_DEBUGF("Pid %d reaped after %lldms, stdout %zuB, stderr %zuB",
                   static_cast<int>(pid), static_cast<long long>(elapsed), out_drain.total, err_drain.total);

        ExecutionOutcome outcome;
        if (shared.exceeded.load()) {
            outcome.stdout_text = sanitize_utf8(out_drain.data);
            outcome.stderr_text = "Output limit exceeded";
            outcome.return_code = limits::OUTPUT_KILLED_CODE;
            outcome.truncated = true;
            return outcome;
        }

        if (timed_out) {
            return SJUDGE_ERROR(ErrorCode::TIMEOUT, "Timeout after " + std::to_string(config_.timeout_ms) + "ms");
        }

        outcome.stdout_text = sanitize_utf8(out_drain.data);
        outcome.stderr_text = sanitize_utf8(err_drain.data);
        outcome.return_code = decode_status(status);
        return outcome;
    }

    const SupervisorConfig& config() const { return config_; }
};

/**
 * @brief 便捷函数
 */
inline Result<ExecutionOutcome> run_process(const LaunchSpec &launch,
                                            const std::string &stdin_text,
                                            int timeout_ms,
                                            size_t max_output_bytes) {
    SupervisorConfig config;
    config.launch = launch;
    config.stdin_text = stdin_text;
    config.timeout_ms = timeout_ms;
    config.max_output_bytes = max_output_bytes;
    return Supervisor(config).run();
}

} // namespace sjudge

#endif // SJUDGE_CORE_SUPERVISOR_H
