#include "../include/output_event.hpp"
#include "../include/helpers.hpp"

#include <stdexcept>

namespace ptyshell {
namespace core {

const char* to_string(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Stdout: return "stdout";
        case EventKind::Error:  return "error";
        case EventKind::Exit:   return "exit";
    }
    return "stdout";
}

std::optional<EventKind> parse_event_kind(std::string_view text) noexcept {
    if (text == "stdout") return EventKind::Stdout;
    if (text == "error")  return EventKind::Error;
    if (text == "exit")   return EventKind::Exit;
    return std::nullopt;
}

OutputEvent OutputEvent::stdoutChunk(std::string text) {
    OutputEvent ev;
    ev.kind = EventKind::Stdout;
    ev.content = std::move(text);
    ev.timestamp = helpers::iso_timestamp_now();
    return ev;
}

OutputEvent OutputEvent::error(std::string message) {
    OutputEvent ev;
    ev.kind = EventKind::Error;
    ev.content = std::move(message);
    ev.timestamp = helpers::iso_timestamp_now();
    return ev;
}

OutputEvent OutputEvent::exit(int code) {
    OutputEvent ev;
    ev.kind = EventKind::Exit;
    ev.content = "Process exited with code " + std::to_string(code);
    ev.timestamp = helpers::iso_timestamp_now();
    ev.exitCode = code;
    return ev;
}

bool operator==(const OutputEvent& a, const OutputEvent& b) {
    return a.kind == b.kind && a.content == b.content
        && a.timestamp == b.timestamp && a.exitCode == b.exitCode;
}

void to_json(nlohmann::json& j, const OutputEvent& ev) {
    j = nlohmann::json{
        {"type", to_string(ev.kind)},
        {"content", ev.content},
        {"timestamp", ev.timestamp},
    };
    if (ev.exitCode) j["exit_code"] = *ev.exitCode;
}

void from_json(const nlohmann::json& j, OutputEvent& ev) {
    const auto kind = parse_event_kind(j.at("type").get<std::string>());
    if (!kind) {
        throw std::invalid_argument("unknown event type '" + j.at("type").get<std::string>() + "'");
    }
    ev.kind = *kind;
    ev.content = j.value("content", std::string{});
    ev.timestamp = j.value("timestamp", std::string{});
    ev.exitCode.reset();
    if (auto it = j.find("exit_code"); it != j.end() && !it->is_null()) {
        ev.exitCode = it->get<int>();
    }
}

} // namespace core
} // namespace ptyshell
