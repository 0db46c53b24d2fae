#include "../include/script_engine.hpp"
#include "../include/protocol.hpp"
#include "../include/dev_debug.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/gil.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>

namespace py = pybind11;

using ptyshell::core::Config;
using ptyshell::core::EventKind;
using ptyshell::core::ExecState;
using ptyshell::core::ExecutionStatus;
using ptyshell::core::InputChannel;
using ptyshell::core::OutputEvent;
using ptyshell::core::OutputStream;
using ptyshell::core::ScriptEngine;
using ptyshell::core::StatusSummary;

namespace {

std::string event_repr(const OutputEvent& ev) {
    std::string r = "<OutputEvent ";
    r += ptyshell::core::to_string(ev.kind);
    if (ev.exitCode) r += " exit_code=" + std::to_string(*ev.exitCode);
    r += " bytes=" + std::to_string(ev.content.size()) + ">";
    return r;
}

} // namespace

PYBIND11_MODULE(_ptyshell, m) {
    m.doc() = "Run shell scripts on pseudo-terminals and stream their output";

    py::register_exception<ptyshell::protocol::ProtocolError>(m, "ProtocolError", PyExc_ValueError);

    py::enum_<EventKind>(m, "EventKind")
        .value("STDOUT", EventKind::Stdout)
        .value("ERROR", EventKind::Error)
        .value("EXIT", EventKind::Exit);

    py::enum_<ExecState>(m, "ExecState")
        .value("RUNNING", ExecState::Running)
        .value("COMPLETED", ExecState::Completed)
        .value("FAILED", ExecState::Failed);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("shell_path", &Config::shellPath)
        .def_readwrite("working_directory", &Config::workingDirectory)
        .def_readwrite("timeout_seconds", &Config::timeoutSeconds)
        .def_readwrite("cache_capacity", &Config::cacheCapacity)
        .def_readwrite("read_buffer_size", &Config::readBufferSize)
        .def_readwrite("kill_grace_ms", &Config::killGraceMs)
        .def_readwrite("terminal_rows", &Config::terminalRows)
        .def_readwrite("terminal_cols", &Config::terminalCols)
        .def_readwrite("environment", &Config::environment);

    py::class_<OutputEvent>(m, "OutputEvent")
        .def_readonly("kind", &OutputEvent::kind)
        .def_property_readonly("type", [](const OutputEvent& ev) { return std::string(ptyshell::core::to_string(ev.kind)); })
        .def_readonly("content", &OutputEvent::content)
        .def_readonly("timestamp", &OutputEvent::timestamp)
        .def_readonly("exit_code", &OutputEvent::exitCode)
        .def("is_terminal", &OutputEvent::isTerminal)
        .def("to_json", [](const OutputEvent& ev) { return ptyshell::protocol::encodeEvent(ev); })
        .def("__eq__", [](const OutputEvent& a, const OutputEvent& b) { return a == b; })
        .def("__repr__", &event_repr);

    py::class_<ExecutionStatus>(m, "ExecutionStatus")
        .def_readonly("script_id", &ExecutionStatus::id)
        .def_readonly("state", &ExecutionStatus::state)
        .def_readonly("cached_output", &ExecutionStatus::cachedEvents)
        .def_readonly("exit_code", &ExecutionStatus::exitCode)
        .def_readonly("started_at", &ExecutionStatus::startedAt)
        .def_readonly("last_output_at", &ExecutionStatus::lastOutputAt)
        .def("to_json", [](const ExecutionStatus& st) { return ptyshell::protocol::statusToJson(st).dump(); });

    py::class_<StatusSummary>(m, "StatusSummary")
        .def_readonly("script_id", &StatusSummary::id)
        .def_readonly("state", &StatusSummary::state)
        .def_readonly("cached_lines", &StatusSummary::cachedEventCount);

    py::class_<InputChannel, std::shared_ptr<InputChannel>>(m, "InputChannel")
        .def(py::init<>())
        .def("send", [](InputChannel& ch, std::string data) { return ch.push(std::move(data)); },
             py::arg("data"))
        .def("close", [](InputChannel& ch) {
            ch.push(std::nullopt);
            ch.close();
        })
        .def_property_readonly("closed", &InputChannel::closed);

    py::class_<OutputStream>(m, "OutputStream")
        .def_property_readonly("script_id", &OutputStream::id)
        .def_property_readonly("interactive", &OutputStream::interactive)
        .def_property_readonly("done", &OutputStream::done)
        .def("send_input", &OutputStream::sendInput, py::arg("data"))
        .def("close_input", &OutputStream::closeInput)
        .def("__iter__", [](OutputStream& s) -> OutputStream& { return s; }, py::return_value_policy::reference_internal)
        .def("__next__", [](OutputStream& s) {
            std::optional<OutputEvent> ev;
            {
                // Blocks until the child produces output; let other Python threads run.
                py::gil_scoped_release release;
                ev = s.next();
            }
            if (!ev) throw py::stop_iteration();
            return *ev;
        });

    py::class_<ScriptEngine>(m, "Engine")
        .def(py::init<Config>(), py::arg("config") = Config{})
        .def("start", &ScriptEngine::start,
             py::arg("script_id"), py::arg("script"), py::arg("timeout") = 0,
             py::arg("input") = nullptr,
             py::call_guard<py::gil_scoped_release>())
        .def("start_interactive", &ScriptEngine::startInteractive,
             py::arg("script_id"), py::arg("script"), py::arg("timeout") = 0,
             py::call_guard<py::gil_scoped_release>())
        .def("write_input", [](ScriptEngine& e, const std::string& id, const std::string& data) {
                 py::gil_scoped_release release;
                 return e.writeInput(id, data);
             }, py::arg("script_id"), py::arg("data"))
        .def("kill", &ScriptEngine::kill, py::arg("script_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("is_running", &ScriptEngine::isRunning, py::arg("script_id"))
        .def("get_status", &ScriptEngine::getStatus, py::arg("script_id"))
        .def("list_all", &ScriptEngine::listAll)
        .def("clear_all", &ScriptEngine::clearAll,
             py::call_guard<py::gil_scoped_release>());

    m.def("encode_event", &ptyshell::protocol::encodeEvent, py::arg("event"));

    m.def("decode_input_frame", &ptyshell::protocol::decodeInputFrame, py::arg("frame"));

    m.def("decode_execute_request", [](const std::string& frame) {
        auto req = ptyshell::protocol::decodeExecuteRequest(frame);
        return py::make_tuple(req.code, req.timeoutSeconds);
    }, py::arg("frame"), "Returns (code, timeout_seconds); raises ProtocolError");

    m.def("enable_debug", [](bool on, std::string path) {
        ptyshell::dev::Logger::instance().enable(on, std::move(path));
    }, py::arg("on") = true, py::arg("path") = std::string{});
}
