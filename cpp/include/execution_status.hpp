#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "output_event.hpp"

namespace ptyshell {
namespace core {

    /// Lifecycle of one execution. Only moves forward out of Running.
    enum class ExecState {
        Running,
        Completed, ///< Exit code 0
        Failed,    ///< Non-zero exit, killed, superseded or timed out
    };

    const char* to_string(ExecState state) noexcept;

    /**
     * @brief Snapshot of one identifier for reattaching consumers.
     */
    struct ExecutionStatus {
        std::string              id{};
        ExecState                state{ExecState::Running};
        std::vector<OutputEvent> cachedEvents{}; ///< Oldest first
        std::optional<int>       exitCode{};     ///< Present once terminal and known
        std::string              startedAt{};    ///< ISO-8601
        std::string              lastOutputAt{}; ///< ISO-8601; equals startedAt until output arrives
    };

    /**
     * @brief One row of ScriptEngine::listAll().
     */
    struct StatusSummary {
        std::string id{};
        ExecState   state{ExecState::Running};
        size_t      cachedEventCount{};
    };

} // namespace core
} // namespace ptyshell
