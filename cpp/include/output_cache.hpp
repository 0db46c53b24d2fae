#pragma once

#include <cstddef>
#include <deque>
#include <vector>

#include "output_event.hpp"

namespace ptyshell {
namespace core {

/**
 * @brief Bounded FIFO of events kept per identifier for replay.
 *
 * Not synchronized; the owning engine guards it with its state mutex.
 */
class OutputCache {
public:
    static constexpr size_t kDefaultCapacity = 1000;

    explicit OutputCache(size_t capacity = kDefaultCapacity);

    void push(OutputEvent ev);
    std::vector<OutputEvent> snapshot() const;
    void clear() noexcept { events_.clear(); }

    size_t size() const noexcept { return events_.size(); }
    size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return events_.empty(); }

private:
    size_t                  capacity_;
    std::deque<OutputEvent> events_;
};

} // namespace core
} // namespace ptyshell
