#include "../include/script_engine.hpp"
#include "../include/helpers.hpp"
#include "../include/dev_debug.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace ptyshell {
namespace core {

const char* to_string(ExecState state) noexcept {
    switch (state) {
        case ExecState::Running:   return "running";
        case ExecState::Completed: return "completed";
        case ExecState::Failed:    return "failed";
    }
    return "failed";
}

namespace {

void validate_config(const Config& c) {
    if (c.shellPath.empty())   throw std::invalid_argument("shellPath must not be empty");
    if (c.timeoutSeconds <= 0) throw std::invalid_argument("timeoutSeconds must be positive");
    if (c.cacheCapacity == 0)  throw std::invalid_argument("cacheCapacity must be positive");
    if (c.readBufferSize == 0) throw std::invalid_argument("readBufferSize must be positive");
    if (c.killGraceMs < 0)     throw std::invalid_argument("killGraceMs must not be negative");
    if (c.terminalRows == 0 || c.terminalCols == 0) {
        throw std::invalid_argument("terminal size must be non-zero");
    }
}

ProcessConfig process_config(const Config& c) {
    ProcessConfig pc;
    pc.shell_path        = c.shellPath;
    pc.working_directory = c.workingDirectory;
    pc.environment       = c.environment;
    pc.rows              = c.terminalRows;
    pc.cols              = c.terminalCols;
    pc.read_buffer_size  = c.readBufferSize;
    return pc;
}

} // namespace

ScriptEngine::ScriptEngine(Config config) : config_(std::move(config)) {
    validate_config(config_);
    PTYSHELL_DBG("LIFECYCLE", "engine created shell='%s' timeout=%d cache=%zu",
                 config_.shellPath.c_str(), config_.timeoutSeconds, config_.cacheCapacity);
}

ScriptEngine::~ScriptEngine() {
    clearAll();

    // Supervisors are detached; they touch *this until the counter drops.
    std::unique_lock<std::mutex> lk(supervisorsMx_);
    supervisorsCv_.wait(lk, [this]{ return activeSupervisors_ == 0; });
    PTYSHELL_DBG("LIFECYCLE", "engine destroyed");
}

OutputStream ScriptEngine::start(const std::string& id, const std::string& script,
                                 int timeoutSeconds, std::shared_ptr<InputChannel> input) {
    // Protocol errors: reject before touching any state.
    if (id.empty()) {
        PTYSHELL_DBG("PROTO", "rejected start: empty identifier");
        return OutputStream::failed(id, "Invalid request: script identifier must not be empty");
    }
    if (script.empty()) {
        PTYSHELL_DBG("PROTO", "rejected start of '%s': empty script", id.c_str());
        return OutputStream::failed(id, "Invalid request: script must not be empty");
    }
    if (timeoutSeconds < 0) {
        PTYSHELL_DBG("PROTO", "rejected start of '%s': timeout=%d", id.c_str(), timeoutSeconds);
        return OutputStream::failed(id, "Invalid request: timeout must not be negative");
    }
    const int effectiveTimeout = timeoutSeconds > 0 ? timeoutSeconds : config_.timeoutSeconds;

    std::lock_guard<std::mutex> life(lifecycleMx_);

    // 1) Supersede whatever runs under this identifier, then forget its record.
    if (auto prev = findLive_(id)) {
        PTYSHELL_DBG("LIFECYCLE", "'%s' resubmitted; stopping seq=%llu",
                     id.c_str(), static_cast<unsigned long long>(prev->seq));
        stopExecution_(*prev);
    }
    {
        std::lock_guard<std::mutex> lk(stateMx_);
        records_.erase(id);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    // 2) Allocate PTY and spawn the child.
    auto ex = std::make_shared<Execution>();
    ex->seq        = nextSeq_.fetch_add(1);
    ex->id         = id;
    ex->input      = std::move(input);
    ex->output     = std::make_shared<Channel<OutputEvent>>();
    ex->timeoutSec = effectiveTimeout;
    ex->process    = std::make_unique<PtyProcess>(process_config(config_));
    try {
        ex->process->start(script);
    } catch (const std::system_error& e) {
        PTYSHELL_DBG("LIFECYCLE", "start of '%s' failed: %s", id.c_str(), e.what());
        return OutputStream::failed(id, std::string("Failed to start script: ") + e.what());
    }

    ex->tStart    = std::chrono::steady_clock::now();
    ex->tDeadline = ex->tStart + std::chrono::seconds(effectiveTimeout);

    ex->record = std::make_shared<ExecRecord>(config_.cacheCapacity);
    ex->record->id           = id;
    ex->record->startedAt    = helpers::iso_timestamp_now();
    ex->record->lastOutputAt = ex->record->startedAt;

    {
        std::lock_guard<std::mutex> lk(stateMx_);
        live_[id] = ex;
        records_[id] = ex->record;
        order_.push_back(id);
    }

    // 3) Reader (+ writer) and supervisor. The raw pointer stays valid: the
    //    pump is joined in cleanup_() while the supervisor still owns ex.
    Execution* raw = ex.get();
    auto onChunk = [raw](std::string_view chunk) {
        std::string text = raw->decoder.feed(chunk);
        if (!text.empty()) raw->events.push(OutputEvent::stdoutChunk(std::move(text)));
    };
    auto onEnd = [raw]() {
        std::string tail = raw->decoder.flush();
        if (!tail.empty()) raw->events.push(OutputEvent::stdoutChunk(std::move(tail)));
        raw->events.push(std::nullopt);
    };

    try {
        ex->pump.start(*ex->process, std::move(onChunk), std::move(onEnd), ex->input);

        {
            std::lock_guard<std::mutex> lk(supervisorsMx_);
            ++activeSupervisors_;
        }
        try {
            std::thread(&ScriptEngine::superviseLoop_, this, ex).detach();
        } catch (const std::system_error&) {
            std::lock_guard<std::mutex> lk(supervisorsMx_);
            --activeSupervisors_;
            throw;
        }
    } catch (const std::system_error& e) {
        PTYSHELL_DBG("LIFECYCLE", "thread start for '%s' failed: %s", id.c_str(), e.what());
        cleanup_(*ex, false);
        {
            std::lock_guard<std::mutex> lk(stateMx_);
            records_.erase(id);
            order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        }
        return OutputStream::failed(id, std::string("Failed to start script: ") + e.what());
    }

    PTYSHELL_DBG("LIFECYCLE", "started '%s' seq=%llu pid=%d timeout=%ds interactive=%d",
                 id.c_str(), static_cast<unsigned long long>(ex->seq),
                 static_cast<int>(ex->process->native_pid()), effectiveTimeout, int(ex->input != nullptr));

    return OutputStream(id, ex->output, ex->input);
}

OutputStream ScriptEngine::startInteractive(const std::string& id, const std::string& script,
                                            int timeoutSeconds) {
    return start(id, script, timeoutSeconds, std::make_shared<InputChannel>());
}

bool ScriptEngine::writeInput(const std::string& id, std::string_view data) {
    auto ex = findLive_(id);
    if (!ex) return false;
    // Interactive runs queue behind the writer thread; others get one
    // non-blocking attempt so a child that never reads cannot stall the caller.
    if (ex->input) return ex->input->push(std::string(data));
    return ex->process->try_write(data);
}

bool ScriptEngine::kill(const std::string& id) {
    std::lock_guard<std::mutex> life(lifecycleMx_);
    auto ex = findLive_(id);
    if (!ex) return false;
    PTYSHELL_DBG("LIFECYCLE", "kill '%s' seq=%llu", id.c_str(), static_cast<unsigned long long>(ex->seq));
    stopExecution_(*ex);
    return true;
}

bool ScriptEngine::isRunning(const std::string& id) const {
    std::lock_guard<std::mutex> lk(stateMx_);
    return live_.count(id) > 0;
}

std::optional<ExecutionStatus> ScriptEngine::getStatus(const std::string& id) const {
    std::lock_guard<std::mutex> lk(stateMx_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;

    const ExecRecord& r = *it->second;
    ExecutionStatus st;
    st.id           = r.id;
    st.state        = r.state;
    st.cachedEvents = r.cache.snapshot();
    st.exitCode     = r.exitCode;
    st.startedAt    = r.startedAt;
    st.lastOutputAt = r.lastOutputAt;
    return st;
}

std::vector<StatusSummary> ScriptEngine::listAll() const {
    std::lock_guard<std::mutex> lk(stateMx_);
    std::vector<StatusSummary> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = records_.find(id);
        if (it == records_.end()) continue;
        out.push_back(StatusSummary{id, it->second->state, it->second->cache.size()});
    }
    return out;
}

void ScriptEngine::clearAll() {
    std::lock_guard<std::mutex> life(lifecycleMx_);

    std::vector<std::shared_ptr<Execution>> running;
    {
        std::lock_guard<std::mutex> lk(stateMx_);
        running.reserve(live_.size());
        for (auto& kv : live_) running.push_back(kv.second);
    }
    for (auto& ex : running) stopExecution_(*ex);

    std::lock_guard<std::mutex> lk(stateMx_);
    PTYSHELL_DBG("LIFECYCLE", "clearAll stopped=%zu forgot=%zu", running.size(), records_.size());
    live_.clear();
    records_.clear();
    order_.clear();
}

std::shared_ptr<Execution> ScriptEngine::findLive_(const std::string& id) const {
    std::lock_guard<std::mutex> lk(stateMx_);
    auto it = live_.find(id);
    return it == live_.end() ? nullptr : it->second;
}

// Requires lifecycleMx_. Returns once the supervisor has ended the stream.
void ScriptEngine::stopExecution_(Execution& ex) {
    ex.killRequested.store(true, std::memory_order_release);
    ex.process->terminate(SIGTERM);
    ex.events.push(std::nullopt); // wake the supervisor even if the reader is stuck
    ex.finishedFuture.wait();
}

void ScriptEngine::superviseLoop_(std::shared_ptr<Execution> ex) {
    bool terminalSent = false;
    try {
        for (;;) {
            std::optional<OutputEvent> item;
            auto st = ex->events.pop_until(item, ex->tDeadline);

            if (st == Channel<std::optional<OutputEvent>>::PopStatus::Timeout) {
                ex->timedOut.store(true, std::memory_order_release);
                PTYSHELL_DBG("TIMEOUT", "'%s' seq=%llu exceeded %ds",
                             ex->id.c_str(), static_cast<unsigned long long>(ex->seq), ex->timeoutSec);
                ex->process->terminate(SIGTERM);
                finish_(*ex, ExecState::Failed, std::nullopt,
                        OutputEvent::error("Script execution timed out after " +
                                           std::to_string(ex->timeoutSec) +
                                           " seconds; process terminated"));
                terminalSent = true;

                cleanup_(*ex, false);
                {
                    std::lock_guard<std::mutex> lk(stateMx_);
                    ex->record->exitCode = ex->process->exit_code();
                }
                break;
            }

            if (st == Channel<std::optional<OutputEvent>>::PopStatus::Item && item) {
                publish_(*ex, std::move(*item));
                continue;
            }

            // End-of-stream sentinel (from the reader or from stopExecution_()).
            const bool forced = ex->killRequested.load(std::memory_order_acquire);
            cleanup_(*ex, !forced);

            // An uncollectable status (SIGCHLD ignored by the host) is reported
            // as code 0 but never counted as success.
            const auto code = ex->process->exit_code();
            const int reported = code.value_or(0);
            const ExecState state = (!forced && code && *code == 0) ? ExecState::Completed
                                                                    : ExecState::Failed;
            PTYSHELL_DBG("COMPLETE", "'%s' seq=%llu exit=%d state=%s forced=%d",
                         ex->id.c_str(), static_cast<unsigned long long>(ex->seq),
                         reported, to_string(state), int(forced));
            finish_(*ex, state, code, OutputEvent::exit(reported));
            terminalSent = true;
            break;
        }
    } catch (const std::exception& e) {
        PTYSHELL_DBG("COMPLETE", "supervisor for '%s' failed: %s", ex->id.c_str(), e.what());
        cleanup_(*ex, false);
        if (!terminalSent) {
            try {
                finish_(*ex, ExecState::Failed, ex->process->exit_code(),
                        OutputEvent::error(std::string("Script execution failed: ") + e.what()));
            } catch (const std::exception& e2) {
                PTYSHELL_DBG("COMPLETE", "could not publish failure for '%s': %s", ex->id.c_str(), e2.what());
            }
        }
    }

    ex->output->close();
    ex->finished.set_value();

    std::lock_guard<std::mutex> lk(supervisorsMx_);
    --activeSupervisors_;
    supervisorsCv_.notify_all();
}

void ScriptEngine::publish_(Execution& ex, OutputEvent ev) {
    {
        std::lock_guard<std::mutex> lk(stateMx_);
        ex.record->lastOutputAt = ev.timestamp;
        ex.record->cache.push(ev);
    }
    ex.output->push(std::move(ev));
}

// State is updated together with the cache so a status query made right after
// the terminal event never still reports running.
void ScriptEngine::finish_(Execution& ex, ExecState state, std::optional<int> exitCode, OutputEvent terminal) {
    {
        std::lock_guard<std::mutex> lk(stateMx_);
        ex.record->state        = state;
        ex.record->exitCode     = exitCode;
        ex.record->lastOutputAt = terminal.timestamp;
        ex.record->cache.push(terminal);
    }
    ex.output->push(std::move(terminal));
}

void ScriptEngine::cleanup_(Execution& ex, bool awaitNaturalExit) noexcept {
    if (ex.cleanedUp.exchange(true)) return; // idempotent

    try {
        // 1) Unblock a writer stuck on a full terminal buffer, then join the
        //    reader/writer threads; both wake within one poll interval.
        ex.process->cancel_io();
        if (ex.input) ex.input->close();
        ex.pump.stop();

        // 2) Master side of the PTY.
        ex.process->shutdown_streams();

        // 3) Process: natural exit first on the EOF path, then TERM -> KILL.
        const auto grace = std::chrono::milliseconds(config_.killGraceMs);
        bool exited = ex.process->reaped();
        if (!exited && awaitNaturalExit) exited = ex.process->wait_for_exit(grace);
        if (!exited) {
            ex.process->terminate(SIGTERM);
            exited = ex.process->wait_for_exit(grace);
        }
        if (!exited) {
            PTYSHELL_DBG("LIFECYCLE", "'%s' ignored SIGTERM; sending SIGKILL", ex.id.c_str());
            ex.process->terminate(SIGKILL);
            exited = ex.process->wait_for_exit(grace);
        }
        if (!exited) {
            PTYSHELL_DBG("LIFECYCLE", "'%s' pid=%d still not reaped after SIGKILL",
                         ex.id.c_str(), static_cast<int>(ex.process->native_pid()));
        }
    } catch (const std::exception& e) {
        PTYSHELL_DBG("LIFECYCLE", "cleanup of '%s' failed: %s", ex.id.c_str(), e.what());
    }

    // 4) Registry; a newer run may already own the identifier.
    std::lock_guard<std::mutex> lk(stateMx_);
    auto it = live_.find(ex.id);
    if (it != live_.end() && it->second.get() == &ex) live_.erase(it);
}

} // namespace core
} // namespace ptyshell
