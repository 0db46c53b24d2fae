#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include "channel.hpp"
#include "output_event.hpp"

namespace ptyshell {
namespace core {

/**
 * @brief Caller side of one execution: a lazy, finite, single-pass event sequence.
 *
 * Yields stdout events in arrival order followed by exactly one terminal
 * event (exit or error), then ends. Destroying the stream before the end
 * does not affect the running process; the engine keeps caching its output.
 *
 * Interactive streams also carry the input channel feeding the PTY.
 */
class OutputStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = OutputEvent;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const OutputEvent*;
        using reference         = const OutputEvent&;

        iterator() = default;
        explicit iterator(OutputStream* owner) : owner_(owner) { advance_(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance_(); return *this; }
        void operator++(int) { advance_(); }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.owner_ == b.owner_;
        }
        friend bool operator!=(const iterator& a, const iterator& b) noexcept { return !(a == b); }

    private:
        void advance_() {
            current_ = owner_ ? owner_->next() : std::nullopt;
            if (!current_) owner_ = nullptr;
        }

        OutputStream*              owner_{nullptr};
        std::optional<OutputEvent> current_{};
    };

    OutputStream(std::string id,
                 std::shared_ptr<Channel<OutputEvent>> events,
                 std::shared_ptr<InputChannel> input = nullptr);

    /// A stream that yields exactly one error event (rejection or allocation failure).
    static OutputStream failed(std::string id, std::string message);

    OutputStream(OutputStream&&) noexcept = default;
    OutputStream& operator=(OutputStream&& other) noexcept;
    OutputStream(const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;
    /// Abandons the event channel when not read to the end; the run itself
    /// continues and keeps publishing to the cache.
    ~OutputStream();

    /// Blocks for the next event; std::nullopt once the terminal event was consumed.
    std::optional<OutputEvent> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    const std::string& id() const noexcept { return id_; }
    bool done() const noexcept { return done_; }

    bool interactive() const noexcept { return static_cast<bool>(input_); }
    /// Queues bytes for the PTY; false when not interactive or input was closed.
    bool sendInput(std::string data);
    /// Stops the writer after the already queued input.
    void closeInput();

private:
    void release_() noexcept;

    std::string                           id_;
    std::shared_ptr<Channel<OutputEvent>> events_;
    std::shared_ptr<InputChannel>         input_;
    bool                                  done_{false};
};

} // namespace core
} // namespace ptyshell
