#include "holly/tts_proxy/utils/Subprocess.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace holly::tts_proxy::utils {

namespace {

void ignoreSigpipeOnce() {
    // 子进程先退出时写 stdin 会触发 SIGPIPE；改为由 write 返回 EPIPE
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void closeQuietly(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

ExitStatus decodeStatus(int status) {
    ExitStatus out;
    if (WIFEXITED(status)) {
        out.exited = true;
        out.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exited = false;
        out.signal = WTERMSIG(status);
    }
    return out;
}

} // namespace

std::string ExitStatus::toString() const {
    if (exited) return "exit " + std::to_string(code);
    if (signal != 0) return "signal " + std::to_string(signal);
    return "unknown";
}

Subprocess::~Subprocess() {
    shutdown(std::chrono::milliseconds(2000));
}

void Subprocess::spawn(const SubprocessOptions& options) {
    if (spawned()) {
        throw SubprocessError("Subprocess already spawned", EINVAL);
    }
    if (options.command.empty()) {
        throw SubprocessError("Empty command", EINVAL);
    }
    ignoreSigpipeOnce();
    m_stderrCap = options.stderrCapBytes;

    // argv / envp 在 fork 前构造：fork 后子进程只调用 async-signal-safe 函数
    std::vector<std::string> argvStore;
    argvStore.reserve(options.args.size() + 1);
    argvStore.push_back(options.command);
    argvStore.insert(argvStore.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::map<std::string, std::string> envMap;
    for (char** e = environ; e && *e; ++e) {
        const std::string kv(*e);
        const auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        envMap[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [k, v] : options.env) envMap[k] = v;
    std::vector<std::string> envStore;
    envStore.reserve(envMap.size());
    for (const auto& [k, v] : envMap) envStore.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& s : envStore) envp.push_back(s.data());
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1],
                       errPipe[0], errPipe[1], execPipe[0], execPipe[1]}) {
            closeQuietly(fd);
        }
    };

    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
        const int e = errno;
        closeAll();
        throw SubprocessError(std::string("pipe failed: ") + std::strerror(e), e);
    }

    const long maxFd = ::sysconf(_SC_OPEN_MAX);
    const int closeLimit = static_cast<int>((maxFd > 0 && maxFd < 65536) ? maxFd : 65536);

    // 终止请求与 fork 在同一把锁下判定：terminate() 之后不会再产生新进程
    std::unique_lock<std::mutex> lock(m_mu);
    if (m_terminateRequested) {
        lock.unlock();
        closeAll();
        throw SubprocessError("Subprocess terminated before spawn", ECANCELED);
    }
    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        lock.unlock();
        closeAll();
        throw SubprocessError(std::string("fork failed: ") + std::strerror(e), e);
    }

    if (pid == 0) {
        // 子进程：独立进程组，便于整组终止
        ::setpgid(0, 0);
        std::signal(SIGPIPE, SIG_DFL);

        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);

        // 不把服务端 socket 等描述符泄露给 worker（exec 错误管道除外）
        for (int fd = 3; fd < closeLimit; ++fd) {
            if (fd != execPipe[1]) ::close(fd);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        const int e = errno;
        ssize_t ignored = ::write(execPipe[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    // 父进程
    ::setpgid(pid, pid);
    m_pid = pid;
    m_reaped = false;
    lock.unlock();

    closeQuietly(inPipe[0]);
    closeQuietly(outPipe[1]);
    closeQuietly(errPipe[1]);
    closeQuietly(execPipe[1]);

    // exec 成功时写端随 exec 关闭，read 返回 0
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeQuietly(execPipe[0]);

    m_stdinFd = inPipe[1];
    m_stdoutFd = outPipe[0];
    m_stderrFd = errPipe[0];

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        (void)wait();
        closeFd(m_stdinFd);
        closeFd(m_stdoutFd);
        closeFd(m_stderrFd);
        throw SubprocessError("exec '" + options.command + "' failed: " + std::strerror(childErrno), childErrno);
    }

    m_stderrThread = std::thread([this]() { drainStderr(); });
}

bool Subprocess::writeStdin(std::string_view data) {
    if (m_stdinFd < 0) return false;
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(m_stdinFd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

void Subprocess::closeStdin() {
    closeFd(m_stdinFd);
}

std::optional<std::string> Subprocess::readStdout(std::size_t maxBytes) {
    if (m_stdoutFd < 0) return std::nullopt;
    std::string buf(maxBytes > 0 ? maxBytes : 4096, '\0');
    for (;;) {
        const ssize_t n = ::read(m_stdoutFd, buf.data(), buf.size());
        if (n > 0) {
            buf.resize(static_cast<std::size_t>(n));
            return buf;
        }
        if (n == 0) {
            closeFd(m_stdoutFd);
            return std::nullopt;
        }
        if (errno == EINTR) continue;
        throw std::system_error(errno, std::generic_category(), "read worker stdout");
    }
}

void Subprocess::terminate() noexcept {
    std::lock_guard<std::mutex> lk(m_mu);
    m_terminateRequested = true;
    if (m_pid <= 0 || m_reaped) return;
    // 负 pid：整个进程组（sh -c 派生的孙进程一并终止）
    if (::kill(-m_pid, SIGTERM) != 0) {
        ::kill(m_pid, SIGTERM);
    }
}

ExitStatus Subprocess::wait() {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_pid <= 0) return m_status;
        if (m_reaped) return m_status;
        pid = m_pid;
    }

    // 只等待不回收：回收前 pid 不会被复用，terminate() 的 kill 始终指向本进程
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
    } while (rc != 0 && errno == EINTR);

    ExitStatus result;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_reaped) return m_status;
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            m_status = decodeStatus(status);
        }
        m_reaped = true;
        result = m_status;
    }

    // 子进程已退出：排空 stderr 剩余内容后再返回，stderrOutput() 随即完整
    m_stopDrain.store(true);
    if (m_stderrThread.joinable()) {
        m_stderrThread.join();
    }
    return result;
}

bool Subprocess::spawned() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_pid > 0;
}

bool Subprocess::reaped() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_reaped;
}

pid_t Subprocess::pid() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_pid;
}

std::string Subprocess::stderrOutput() const {
    std::lock_guard<std::mutex> lk(m_stderrMu);
    return m_stderr;
}

void Subprocess::drainStderr() {
    char buf[1024];
    for (;;) {
        pollfd pfd{m_stderrFd, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, 100);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        // 停止请求只在没有待读数据时生效
        if (pr == 0) {
            if (m_stopDrain.load()) break;
            continue;
        }
        const ssize_t n = ::read(m_stderrFd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;
        std::lock_guard<std::mutex> lk(m_stderrMu);
        if (m_stderr.size() < m_stderrCap) {
            m_stderr.append(buf, std::min(static_cast<std::size_t>(n), m_stderrCap - m_stderr.size()));
        }
    }
}

void Subprocess::closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void Subprocess::shutdown(std::chrono::milliseconds grace) noexcept {
    closeFd(m_stdinFd);

    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_pid > 0 && !m_reaped) pid = m_pid;
    }
    if (pid > 0) {
        terminate();
        // SIGTERM 之后给一段宽限期，仍未退出则 SIGKILL
        const auto deadline = std::chrono::steady_clock::now() + grace;
        bool exited = false;
        while (std::chrono::steady_clock::now() < deadline) {
            siginfo_t info{};
            info.si_pid = 0;
            if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT | WNOHANG) == 0 &&
                info.si_pid == pid) {
                exited = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!exited) {
            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_reaped) {
                ::kill(-pid, SIGKILL);
                ::kill(pid, SIGKILL);
            }
        }
        (void)wait();
    }

    m_stopDrain.store(true);
    if (m_stderrThread.joinable()) {
        m_stderrThread.join();
    }
    closeFd(m_stdoutFd);
    closeFd(m_stderrFd);
}

} // namespace holly::tts_proxy::utils
