#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "channel.hpp"
#include "execution_status.hpp"
#include "io_pump.hpp"
#include "output_cache.hpp"
#include "output_event.hpp"
#include "pty_process.hpp"
#include "utf8_decoder.hpp"

namespace ptyshell {
namespace core {

    /// Queryable part of an execution; outlives the process. Guarded by ScriptEngine::stateMx_.
    struct ExecRecord {
        std::string        id{};                          ///< Caller-supplied identifier
        ExecState          state{ExecState::Running};     ///< Lifecycle state
        std::optional<int> exitCode{};                    ///< Set once terminal and known
        OutputCache        cache;                         ///< Rolling replay buffer
        std::string        startedAt{};                   ///< ISO-8601
        std::string        lastOutputAt{};                ///< ISO-8601

        explicit ExecRecord(size_t capacity) : cache(capacity) {}
    };

    /// Live resources of one run: process, pump, queues and supervisor bookkeeping.
    struct Execution {
        uint64_t                                 seq{};          ///< Monotonic start counter
        std::string                              id{};           ///< Identifier
        std::unique_ptr<PtyProcess>              process{};      ///< Child on the PTY slave
        IoPump                                   pump{};         ///< Reader (+ writer) threads
        Utf8Decoder                              decoder{};      ///< Reader-thread only
        Channel<std::optional<OutputEvent>>      events{};       ///< Reader -> supervisor; nullopt = end-of-stream
        std::shared_ptr<Channel<OutputEvent>>    output{};       ///< Supervisor -> caller stream
        std::shared_ptr<InputChannel>            input{};        ///< Caller -> writer, interactive only
        std::shared_ptr<ExecRecord>              record{};       ///< Shared with the engine's record map
        int                                      timeoutSec{};   ///< Effective timeout in seconds
        std::chrono::steady_clock::time_point    tStart{};       ///< Start timestamp
        std::chrono::steady_clock::time_point    tDeadline{};    ///< Absolute deadline for timeout
        std::atomic<bool>                        timedOut{false};      ///< Deadline expired
        std::atomic<bool>                        killRequested{false}; ///< kill() or supersede
        std::atomic<bool>                        cleanedUp{false};     ///< Cleanup ran
        std::promise<void>                       finished{};     ///< Set when the supervisor exits
        std::shared_future<void>                 finishedFuture{finished.get_future().share()};
    };
}} // namespace ptyshell::core
