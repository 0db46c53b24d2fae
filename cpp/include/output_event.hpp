#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ptyshell {
namespace core {

    enum class EventKind {
        Stdout, ///< A chunk of merged terminal output
        Error,  ///< Failure, rejection or timeout; terminal
        Exit,   ///< Process exited; terminal
    };

    const char* to_string(EventKind kind) noexcept;
    std::optional<EventKind> parse_event_kind(std::string_view text) noexcept;

    /**
     * @brief One observable unit of an execution.
     *
     * Content is UTF-8 and keeps carriage returns untouched. Only Exit events
     * carry an exit code.
     */
    struct OutputEvent {
        EventKind          kind{EventKind::Stdout};
        std::string        content{};
        std::string        timestamp{}; ///< ISO-8601, UTC
        std::optional<int> exitCode{};

        static OutputEvent stdoutChunk(std::string text);
        static OutputEvent error(std::string message);
        static OutputEvent exit(int code);

        bool isTerminal() const noexcept { return kind != EventKind::Stdout; }
    };

    bool operator==(const OutputEvent& a, const OutputEvent& b);
    inline bool operator!=(const OutputEvent& a, const OutputEvent& b) { return !(a == b); }

    void to_json(nlohmann::json& j, const OutputEvent& ev);
    void from_json(const nlohmann::json& j, OutputEvent& ev);

} // namespace core
} // namespace ptyshell
