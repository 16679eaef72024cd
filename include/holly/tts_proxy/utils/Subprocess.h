#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace holly::tts_proxy::utils {

/**
 * @brief 子进程启动失败（fork/pipe/exec）；err 为对应 errno
 */
class SubprocessError : public std::runtime_error {
public:
    SubprocessError(const std::string& what, int err)
        : std::runtime_error(what)
        , m_errno(err)
    {}

    int errorNumber() const { return m_errno; }

private:
    int m_errno;
};

struct SubprocessOptions {
    std::string command;                         // 按 PATH 查找
    std::vector<std::string> args;               // 不含 argv[0]
    std::map<std::string, std::string> env;      // 追加/覆盖到当前环境
    std::size_t stderrCapBytes = 8 * 1024;       // stderr 只保留前若干字节
};

struct ExitStatus {
    bool exited = false;   // 正常 exit（否则被信号终止）
    int code = -1;         // exited 时的退出码
    int signal = 0;        // 被信号终止时的信号编号

    bool success() const { return exited && code == 0; }
    std::string toString() const;
};

/**
 * @brief POSIX 子进程：stdin/stdout/stderr 三条管道
 *
 * - 子进程独占一个进程组，terminate() 对整个组发送 SIGTERM（不等待）
 * - exec 失败通过 close-on-exec 管道回报给 spawn()，以异常形式抛出
 * - stderr 由后台线程排空，避免子进程因 stderr 写满而阻塞
 * - wait() 先以 WNOWAIT 等待退出，再在锁内回收，terminate() 因此不会误杀复用的 pid
 * - spawn() 之前调用过 terminate() 时，spawn() 不再 fork，抛出 errno 为 ECANCELED 的 SubprocessError
 *
 * terminate() 可从任意线程调用；其余方法只应由持有者线程调用。
 */
class Subprocess {
public:
    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&&) = delete;
    Subprocess& operator=(Subprocess&&) = delete;

    // 启动子进程；失败或已被 terminate() 时抛 SubprocessError。只能调用一次。
    void spawn(const SubprocessOptions& options);

    // 写 stdin；子进程已关闭读端（EPIPE）时返回 false
    bool writeStdin(std::string_view data);
    void closeStdin();

    // 从 stdout 读取至多 maxBytes；EOF 返回 nullopt；读错误抛 std::system_error
    std::optional<std::string> readStdout(std::size_t maxBytes);

    // 向进程组发送 SIGTERM（fire-and-forget）；未启动时只记录请求，已回收时为 no-op
    void terminate() noexcept;

    // 阻塞直到子进程退出并回收；重复调用返回缓存结果
    ExitStatus wait();

    bool spawned() const;
    bool reaped() const;
    pid_t pid() const;

    // 已捕获的 stderr（截断到 stderrCapBytes）
    std::string stderrOutput() const;

private:
    void drainStderr();
    void closeFd(int& fd);
    void shutdown(std::chrono::milliseconds grace) noexcept;

    mutable std::mutex m_mu;      // 保护 m_pid/m_reaped/m_status/m_terminateRequested
    pid_t m_pid{-1};
    bool m_terminateRequested{false};
    bool m_reaped{false};
    ExitStatus m_status;

    int m_stdinFd{-1};
    int m_stdoutFd{-1};
    int m_stderrFd{-1};

    std::thread m_stderrThread;
    std::atomic<bool> m_stopDrain{false};
    mutable std::mutex m_stderrMu;
    std::string m_stderr;
    std::size_t m_stderrCap{8 * 1024};
};

} // namespace holly::tts_proxy::utils
