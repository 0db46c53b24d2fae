#include "../include/output_cache.hpp"

#include <stdexcept>

namespace ptyshell {
namespace core {

OutputCache::OutputCache(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("OutputCache capacity must be positive");
    }
}

void OutputCache::push(OutputEvent ev) {
    events_.push_back(std::move(ev));
    while (events_.size() > capacity_) {
        events_.pop_front(); // evict oldest
    }
}

std::vector<OutputEvent> OutputCache::snapshot() const {
    return std::vector<OutputEvent>(events_.begin(), events_.end());
}

} // namespace core
} // namespace ptyshell
