#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "execution_status.hpp"
#include "output_event.hpp"

namespace ptyshell {
namespace protocol {

/// Malformed or incomplete client frame.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// First frame of a session: the script to run.
struct ExecuteRequest {
    std::string code{};
    int timeoutSeconds{0}; ///< 0 = engine default
};

/// {"type","content","timestamp"[, "exit_code"]}
std::string encodeEvent(const core::OutputEvent& ev);

/// @throws ProtocolError on invalid JSON, missing keys or an unknown type.
core::OutputEvent decodeEvent(std::string_view frame);

/// Reads {"code": "...", "timeout": N}. @throws ProtocolError
ExecuteRequest decodeExecuteRequest(std::string_view frame);

/**
 * Maps an inbound frame to bytes for the PTY:
 *  - {"type":"input","content":"..."} -> content
 *  - any other JSON value             -> nothing
 *  - non-JSON text                    -> text + "\n" (line-oriented clients)
 */
std::optional<std::string> decodeInputFrame(std::string_view frame);

/// {"script_id","status","cached_output":[...],"exit_code","started_at","last_output_at"}
nlohmann::json statusToJson(const core::ExecutionStatus& st);

/// [{"script_id","status","cached_lines"}, ...]
nlohmann::json summariesToJson(const std::vector<core::StatusSummary>& rows);

} // namespace protocol
} // namespace ptyshell
