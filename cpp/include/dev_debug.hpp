#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

#include "helpers.hpp"

// Environment switches, read once on first use:
//   PTYSHELL_DEBUG=1                   turn logging on
//   PTYSHELL_DEBUG_PATH=/tmp/ps.log    target file (default ./ptyshell_debug.log)
//   PTYSHELL_DEBUG_EXCLUDE=IO,PROTO    tags to drop

namespace ptyshell {
namespace dev {

// Process-wide debug sink. Off unless enabled; the file is opened on demand.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // An empty path keeps the current target.
    void enable(bool on, std::string path = {}) {
        std::lock_guard<std::mutex> lk(mx_);
        if (!on) {
            closeLocked_();
            on_.store(false, std::memory_order_relaxed);
            return;
        }
        if (!path.empty() && path != target_) {
            closeLocked_();
            target_ = std::move(path);
        }
        on_.store(true, std::memory_order_relaxed);
        openLocked_();
    }

    bool enabled() const noexcept { return on_.load(std::memory_order_relaxed); }

    // Comma separated; replaces the previous set.
    void setExcludedTags(std::string_view csv) {
        std::lock_guard<std::mutex> lk(mx_);
        excluded_.clear();
        while (!csv.empty()) {
            auto comma = csv.find(',');
            auto item = csv.substr(0, comma);
            while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
            while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
            if (!item.empty()) excluded_.emplace_back(item);
            if (comma == std::string_view::npos) break;
            csv.remove_prefix(comma + 1);
        }
    }

    void logf(const char* tag, const char* fmt, ...) {
        if (!enabled()) return;

        char msg[2048];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(msg, sizeof(msg), fmt, ap);
        va_end(ap);

        const std::string_view t = tag ? tag : "-";
        const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffffffULL;
        const std::string stamp = helpers::iso_timestamp_now();

        std::lock_guard<std::mutex> lk(mx_);
        for (const auto& ex : excluded_) {
            if (ex == t) return;
        }
        openLocked_();
        if (!out_) return;
        std::fprintf(out_, "%s %-9.*s tid=%06llx %s\n", stamp.c_str(),
                     static_cast<int>(t.size()), t.data(),
                     static_cast<unsigned long long>(tid), msg);
        std::fflush(out_);
    }

private:
    Logger() {
        if (const char* excl = std::getenv("PTYSHELL_DEBUG_EXCLUDE")) setExcludedTags(excl);
        if (const char* path = std::getenv("PTYSHELL_DEBUG_PATH"); path && *path) target_ = path;

        const char* on = std::getenv("PTYSHELL_DEBUG");
        if (on && std::string_view(on) == "1") {
            enable(true);
            logf("LOGGER", "enabled from environment, target=%s", target_.c_str());
        }
    }

    ~Logger() {
        std::lock_guard<std::mutex> lk(mx_);
        closeLocked_();
    }

    void openLocked_() {
        if (out_) return;
        if (target_.empty()) target_ = "ptyshell_debug.log";
        out_ = std::fopen(target_.c_str(), "a");
        if (out_) {
            std::fprintf(out_, "# ptyshell log opened pid=%d\n", static_cast<int>(::getpid()));
            std::fflush(out_);
        }
    }

    void closeLocked_() {
        if (!out_) return;
        std::fprintf(out_, "# ptyshell log closed\n");
        std::fclose(out_);
        out_ = nullptr;
    }

    std::atomic<bool>        on_{false};
    std::mutex               mx_;
    std::string              target_;
    std::vector<std::string> excluded_;
    std::FILE*               out_{nullptr};
};

} // namespace dev
} // namespace ptyshell

// Keeps call sites to one line; arguments are not evaluated while disabled.
#define PTYSHELL_DBG(TAG, FMT, ...) \
    do { if (::ptyshell::dev::Logger::instance().enabled()) \
        ::ptyshell::dev::Logger::instance().logf(TAG, FMT, ##__VA_ARGS__); } while (0)
