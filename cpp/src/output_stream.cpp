#include "../include/output_stream.hpp"
#include "../include/dev_debug.hpp"

namespace ptyshell {
namespace core {

OutputStream::OutputStream(std::string id,
                           std::shared_ptr<Channel<OutputEvent>> events,
                           std::shared_ptr<InputChannel> input)
    : id_(std::move(id)), events_(std::move(events)), input_(std::move(input)) {}

OutputStream OutputStream::failed(std::string id, std::string message) {
    auto ch = std::make_shared<Channel<OutputEvent>>();
    ch->push(OutputEvent::error(std::move(message)));
    ch->close();
    return OutputStream(std::move(id), std::move(ch));
}

OutputStream::~OutputStream() {
    release_();
}

OutputStream& OutputStream::operator=(OutputStream&& other) noexcept {
    if (this != &other) {
        release_();
        id_     = std::move(other.id_);
        events_ = std::move(other.events_);
        input_  = std::move(other.input_);
        done_   = other.done_;
        other.done_ = true;
    }
    return *this;
}

void OutputStream::release_() noexcept {
    if (!events_ || done_) return;
    // Nobody reads this channel any more; the supervisor's pushes now fail
    // instead of piling up.
    PTYSHELL_DBG("LIFECYCLE", "stream for '%s' dropped before its terminal event", id_.c_str());
    events_->close_and_clear();
    events_.reset();
}

std::optional<OutputEvent> OutputStream::next() {
    if (done_ || !events_) return std::nullopt;

    // The channel closes only after cleanup, so reaching the end implies the
    // process is gone and the identifier is no longer live.
    auto ev = events_->pop();
    if (!ev) done_ = true;
    return ev;
}

bool OutputStream::sendInput(std::string data) {
    if (!input_) return false;
    return input_->push(std::move(data));
}

void OutputStream::closeInput() {
    if (!input_) return;
    // Sentinel first so the writer drains what is queued, then refuse more.
    input_->push(std::nullopt);
    input_->close();
}

} // namespace core
} // namespace ptyshell
