#include "../include/pty_process.hpp"
#include "../include/helpers.hpp"
#include "../include/dev_debug.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

extern char **environ;

namespace ptyshell {
namespace core {

namespace {

constexpr int WRITE_POLL_MS = 100;

// Child side of the fork: only async-signal-safe calls from here on.
[[noreturn]] void child_fail(const char* msg) noexcept {
    ssize_t ignored = ::write(STDERR_FILENO, msg, std::strlen(msg));
    (void)ignored;
    _exit(127);
}

} // namespace

PtyProcess::PtyProcess(ProcessConfig config) : config_(std::move(config)) {
    if (config_.read_buffer_size == 0) config_.read_buffer_size = 4096;
}

PtyProcess::~PtyProcess() {
    shutdown_streams();
    if (child_pid_ > 0 && !reaped()) {
        terminate(SIGKILL);
        if (!wait_for_exit(std::chrono::milliseconds(1000))) {
            PTYSHELL_DBG("LIFECYCLE", "pid=%d not reaped at destruction", static_cast<int>(child_pid_));
        }
    }
}

void PtyProcess::start(const std::string& script) {
    if (child_pid_ > 0) {
        throw std::logic_error("PtyProcess already started");
    }

    if (::access(config_.shell_path.c_str(), X_OK) != 0) {
        throw std::system_error(errno, std::generic_category(),
                                "shell '" + config_.shell_path + "' is not executable");
    }

    // Build argv/envp before fork(); the child must not allocate.
    std::vector<std::string> envStorage;
    for (char** e = environ; e && *e; ++e) {
        std::string_view kv(*e);
        auto eq = kv.find('=');
        if (eq != std::string_view::npos &&
            config_.environment.count(std::string(kv.substr(0, eq))) > 0) {
            continue; // overridden below
        }
        envStorage.emplace_back(kv);
    }
    for (const auto& [k, v] : config_.environment) {
        envStorage.push_back(k + "=" + v);
    }
    std::vector<char*> envp;
    envp.reserve(envStorage.size() + 1);
    for (auto& e : envStorage) envp.push_back(e.data());
    envp.push_back(nullptr);

    std::string shell = config_.shell_path;
    std::string dashC = "-c";
    std::string body  = script;
    char* argv[] = { shell.data(), dashC.data(), body.data(), nullptr };
    const char* workDir = config_.working_directory.empty() ? nullptr : config_.working_directory.c_str();

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = config_.rows;
    ws.ws_col = config_.cols;

    int master = -1;
    pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "forkpty");
    }

    if (pid == 0) {
        // --- Child process context ---
        // forkpty() already made us session leader with the slave on fds 0/1/2.
        // Restore default dispositions the host may have changed (e.g. SIGPIPE ignored).
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        for (int sig : {SIGPIPE, SIGINT, SIGQUIT, SIGTERM, SIGHUP, SIGCHLD}) {
            ::signal(sig, SIG_DFL);
        }

        if (workDir && ::chdir(workDir) != 0) {
            child_fail("ptyshell: cannot change to working directory\n");
        }

        ::execve(argv[0], argv, envp.data());
        child_fail("ptyshell: exec of shell failed\n");
    }

    // --- Parent process context ---
    child_pid_ = pid;

    // Parent end must not leak into later children; non-blocking so
    // read/write never stall once poll() has reported readiness.
    int fdFlags = ::fcntl(master, F_GETFD, 0);
    if (fdFlags != -1) ::fcntl(master, F_SETFD, fdFlags | FD_CLOEXEC);
    int flFlags = ::fcntl(master, F_GETFL, 0);
    if (flFlags != -1) ::fcntl(master, F_SETFL, flFlags | O_NONBLOCK);

    master_fd_.store(master, std::memory_order_release);

    PTYSHELL_DBG("LIFECYCLE", "spawned pid=%d master_fd=%d shell='%s' script_bytes=%zu",
                 static_cast<int>(pid), master, config_.shell_path.c_str(), script.size());
}

bool PtyProcess::terminate(int signo) noexcept {
    if (child_pid_ <= 0 || reaped()) return false;

    // Session leader => pgid == pid; reach backgrounded children too.
    if (::kill(-child_pid_, signo) == 0) return true;
    if (errno == ESRCH && ::kill(child_pid_, signo) == 0) return true;

    PTYSHELL_DBG("LIFECYCLE", "kill(pid=%d, sig=%d) failed: %s",
                 static_cast<int>(child_pid_), signo, helpers::errno_message(errno).c_str());
    return false;
}

bool PtyProcess::is_alive() noexcept {
    if (child_pid_ <= 0) return false;
    return !try_reap_();
}

bool PtyProcess::try_reap_() noexcept {
    std::lock_guard<std::mutex> lk(status_mutex_);
    if (reaped_.load(std::memory_order_relaxed)) return true;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(child_pid_, &status, WNOHANG);
    } while (r == -1 && errno == EINTR);

    if (r == 0) return false; // still running

    if (r == child_pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        PTYSHELL_DBG("LIFECYCLE", "reaped pid=%d exit=%d",
                     static_cast<int>(child_pid_), exit_code_ ? *exit_code_ : -1);
    } else {
        // ECHILD: the status was collected elsewhere (e.g. SIGCHLD set to SIG_IGN).
        PTYSHELL_DBG("LIFECYCLE", "waitpid(pid=%d) failed: %s; exit status unknown",
                     static_cast<int>(child_pid_), helpers::errno_message(errno).c_str());
    }
    reaped_.store(true, std::memory_order_release);
    return true;
}

bool PtyProcess::wait_for_exit(std::chrono::milliseconds timeout) noexcept {
    if (child_pid_ <= 0) return false;

    // Poll-based wait with WNOHANG and a short sleep, bounded by timeout.
    auto endTime = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (try_reap_()) return true;
        if (std::chrono::steady_clock::now() >= endTime) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<int> PtyProcess::exit_code() const noexcept {
    std::lock_guard<std::mutex> lk(status_mutex_);
    return exit_code_;
}

bool PtyProcess::write(std::string_view data) {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        if (closing_.load(std::memory_order_acquire)) return false;
        const int fd = master_fd();
        if (fd < 0) return false;

        ssize_t n = ::write(fd, p, left);
        if (n > 0) { p += n; left -= static_cast<size_t>(n); continue; }
        if (n == -1 && errno == EINTR) continue; // retry on signal
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Terminal input buffer full; wait for the child to consume some.
            struct pollfd pfd{fd, POLLOUT, 0};
            ::poll(&pfd, 1, WRITE_POLL_MS);
            continue;
        }
        PTYSHELL_DBG("IO", "write pid=%d failed: %s",
                     static_cast<int>(child_pid_), helpers::errno_message(errno).c_str());
        return false; // EIO once the slave side is gone
    }
    return true;
}

bool PtyProcess::try_write(std::string_view data) {
    std::unique_lock<std::mutex> lk(stdin_mutex_, std::try_to_lock);
    if (!lk.owns_lock()) return false; // a blocking writer is busy
    if (closing_.load(std::memory_order_acquire)) return false;
    const int fd = master_fd();
    if (fd < 0) return false;

    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n > 0) { done += static_cast<size_t>(n); continue; }
        if (n == -1 && errno == EINTR) continue;
        PTYSHELL_DBG("IO", "try_write pid=%d accepted %zu of %zu bytes",
                     static_cast<int>(child_pid_), done, data.size());
        return false;
    }
    return true;
}

std::optional<std::string> PtyProcess::read_output(int timeoutMs) {
    const int fd = master_fd();
    if (fd < 0) return std::nullopt;

    struct pollfd pfd{fd, POLLIN, 0};
    int ready = ::poll(&pfd, 1, timeoutMs);
    if (ready < 0) {
        if (errno == EINTR) return std::string{};
        return std::nullopt;
    }
    if (ready == 0) return std::string{};

    std::string buf(config_.read_buffer_size, '\0');
    for (;;) {
        ssize_t got = ::read(fd, buf.data(), buf.size());
        if (got > 0) {
            buf.resize(static_cast<size_t>(got));
            return buf;
        }
        if (got == 0) return std::nullopt;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return std::string{};
        // Linux reports EIO once every slave descriptor is closed.
        return std::nullopt;
    }
}

void PtyProcess::shutdown_streams() {
    closing_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    int fd = master_fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd != -1) {
        ::close(fd);
        PTYSHELL_DBG("LIFECYCLE", "closed master_fd=%d pid=%d", fd, static_cast<int>(child_pid_));
    }
}

} // namespace core
} // namespace ptyshell
