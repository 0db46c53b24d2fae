#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "exec_state.hpp"
#include "execution_status.hpp"
#include "output_stream.hpp"

namespace ptyshell {
namespace core {

/**
 * @brief Runs shell scripts on pseudo-terminals and streams their output.
 *
 * Each execution is keyed by a caller-supplied identifier. At most one live
 * process exists per identifier; starting the same identifier again tears
 * down the previous run first. Output is delivered to the returned
 * OutputStream and kept in a bounded per-identifier cache so that a
 * consumer can reattach through getStatus().
 *
 * All public methods are thread-safe.
 */
class ScriptEngine {
public:
    /// @throws std::invalid_argument if the config is unusable.
    explicit ScriptEngine(Config config = Config{});
    ~ScriptEngine();

    ScriptEngine(const ScriptEngine&) = delete;
    ScriptEngine& operator=(const ScriptEngine&) = delete;
    ScriptEngine(ScriptEngine&&) = delete;
    ScriptEngine& operator=(ScriptEngine&&) = delete;

    /**
     * @brief Starts `shell -c script` under @p id.
     *
     * @param timeoutSeconds Budget for the whole run; 0 selects the configured default.
     * @param input Optional caller-owned channel forwarded verbatim to the PTY.
     * @return Stream of the run. Invalid requests and allocation failures yield a
     *         stream with a single error event.
     */
    OutputStream start(const std::string& id, const std::string& script,
                       int timeoutSeconds = 0,
                       std::shared_ptr<InputChannel> input = nullptr);

    /// Same as start() with a fresh input channel exposed on the stream.
    OutputStream startInteractive(const std::string& id, const std::string& script,
                                  int timeoutSeconds = 0);

    /// Writes bytes to the live run of @p id without blocking. Interactive runs
    /// queue the bytes for their writer thread; other runs get one non-blocking
    /// write. False when nothing is running there or the bytes were not accepted.
    bool writeInput(const std::string& id, std::string_view data);

    /// Terminates the live run of @p id and waits until its stream has ended.
    bool kill(const std::string& id);

    bool isRunning(const std::string& id) const;

    std::optional<ExecutionStatus> getStatus(const std::string& id) const;

    /// One row per known identifier, least recently started first.
    std::vector<StatusSummary> listAll() const;

    /// Kills every live run and forgets every identifier.
    void clearAll();

    const Config& config() const noexcept { return config_; }

private:
    std::shared_ptr<Execution> findLive_(const std::string& id) const;
    void stopExecution_(Execution& ex);

    void superviseLoop_(std::shared_ptr<Execution> ex);
    void publish_(Execution& ex, OutputEvent ev);
    void finish_(Execution& ex, ExecState state, std::optional<int> exitCode, OutputEvent terminal);
    void cleanup_(Execution& ex, bool awaitNaturalExit) noexcept;

    Config config_;

    mutable std::mutex stateMx_; ///< live_, records_, order_ and every ExecRecord
    std::unordered_map<std::string, std::shared_ptr<Execution>>  live_;
    std::unordered_map<std::string, std::shared_ptr<ExecRecord>> records_;
    std::vector<std::string> order_; ///< Start order of records_

    std::mutex lifecycleMx_; ///< Serializes start/kill/clearAll
    std::atomic<uint64_t> nextSeq_{1};

    std::mutex supervisorsMx_;
    std::condition_variable supervisorsCv_;
    size_t activeSupervisors_{0};
};

} // namespace core
} // namespace ptyshell
