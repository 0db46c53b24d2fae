#pragma once

#include "process.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace ptyshell {
namespace core {

struct ProcessConfig {
    std::string shell_path{"/bin/bash"};
    std::string working_directory{};
    std::map<std::string, std::string> environment{};
    unsigned short rows{24};
    unsigned short cols{80};
    size_t read_buffer_size{4096};
};

/**
 * @brief `shell -c script` running on the slave side of a fresh PTY.
 *
 * The child leads its own session, so signals go to the whole process group.
 * Exit status is cached the first time the child is reaped.
 */
class PtyProcess final : public Process {
public:
    explicit PtyProcess(ProcessConfig config);
    ~PtyProcess() override;

    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;
    PtyProcess(PtyProcess&&) = delete;
    PtyProcess& operator=(PtyProcess&&) = delete;

    /// Allocates the PTY and forks. Throws std::system_error on failure.
    void start(const std::string& script);

    /// Signals the process group; false if already reaped or gone (ESRCH).
    bool terminate(int signo) noexcept;
    bool is_alive() noexcept;

    /// Polls for exit up to timeout; true once the child has been reaped.
    bool wait_for_exit(std::chrono::milliseconds timeout) noexcept;

    /// Exit code if reaped: WEXITSTATUS, or 128 + signal for signalled exits.
    std::optional<int> exit_code() const noexcept;
    bool reaped() const noexcept { return reaped_.load(std::memory_order_acquire); }

    /// Single non-blocking attempt; false unless every byte was accepted.
    bool try_write(std::string_view data);

    /// Makes pending and future writes fail fast; the descriptor stays open.
    void cancel_io() noexcept { closing_.store(true, std::memory_order_release); }

    bool write(std::string_view data) override;
    std::optional<std::string> read_output(int timeoutMs) override;
    void shutdown_streams() override;

    pid_t native_pid() const noexcept { return child_pid_; }
    int master_fd() const noexcept { return master_fd_.load(std::memory_order_acquire); }

private:
    bool try_reap_() noexcept;

    ProcessConfig config_;
    std::atomic<int> master_fd_{-1};
    pid_t child_pid_{-1};

    std::atomic<bool> closing_{false};
    std::atomic<bool> reaped_{false};
    mutable std::mutex status_mutex_;
    std::optional<int> exit_code_{};

    mutable std::mutex stdin_mutex_;
};

} // namespace core
} // namespace ptyshell
