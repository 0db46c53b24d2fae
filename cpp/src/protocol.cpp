#include "../include/protocol.hpp"
#include "../include/dev_debug.hpp"

namespace ptyshell {
namespace protocol {

using nlohmann::json;

namespace {

json parse_frame(std::string_view frame) {
    json j = json::parse(frame.begin(), frame.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw ProtocolError("frame is not valid JSON");
    }
    return j;
}

} // namespace

std::string encodeEvent(const core::OutputEvent& ev) {
    // Replace rather than throw if a caller hand-built an event with bad UTF-8.
    return json(ev).dump(-1, ' ', false, json::error_handler_t::replace);
}

core::OutputEvent decodeEvent(std::string_view frame) {
    json j = parse_frame(frame);
    if (!j.is_object() || !j.contains("type")) {
        throw ProtocolError("event frame must be an object with a 'type'");
    }
    try {
        return j.get<core::OutputEvent>();
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("malformed event frame: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(e.what());
    }
}

ExecuteRequest decodeExecuteRequest(std::string_view frame) {
    json j = parse_frame(frame);
    if (!j.is_object()) {
        throw ProtocolError("execute request must be a JSON object");
    }
    auto code = j.find("code");
    if (code == j.end() || !code->is_string()) {
        throw ProtocolError("execute request needs a string 'code'");
    }

    ExecuteRequest req;
    req.code = code->get<std::string>();
    if (auto t = j.find("timeout"); t != j.end() && !t->is_null()) {
        if (!t->is_number_integer()) {
            throw ProtocolError("'timeout' must be an integer number of seconds");
        }
        req.timeoutSeconds = t->get<int>();
    }
    PTYSHELL_DBG("PROTO", "execute request code_bytes=%zu timeout=%d", req.code.size(), req.timeoutSeconds);
    return req;
}

std::optional<std::string> decodeInputFrame(std::string_view frame) {
    json j = json::parse(frame.begin(), frame.end(), nullptr, false);
    if (j.is_discarded()) {
        return std::string(frame) + "\n";
    }
    auto type = j.is_object() ? j.find("type") : j.end();
    if (type != j.end() && type->is_string() && type->get<std::string>() == "input") {
        auto c = j.find("content");
        if (c != j.end() && c->is_string()) return c->get<std::string>();
    }
    PTYSHELL_DBG("PROTO", "ignored non-input frame bytes=%zu", frame.size());
    return std::nullopt;
}

json statusToJson(const core::ExecutionStatus& st) {
    json j{
        {"script_id", st.id},
        {"status", core::to_string(st.state)},
        {"cached_output", st.cachedEvents},
        {"started_at", st.startedAt},
        {"last_output_at", st.lastOutputAt},
    };
    j["exit_code"] = st.exitCode ? json(*st.exitCode) : json(nullptr);
    return j;
}

json summariesToJson(const std::vector<core::StatusSummary>& rows) {
    json arr = json::array();
    for (const auto& r : rows) {
        arr.push_back({
            {"script_id", r.id},
            {"status", core::to_string(r.state)},
            {"cached_lines", r.cachedEventCount},
        });
    }
    return arr;
}

} // namespace protocol
} // namespace ptyshell
