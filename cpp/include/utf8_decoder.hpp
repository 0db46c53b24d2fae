#pragma once

#include <string>
#include <string_view>

namespace ptyshell {
namespace core {

/**
 * @brief Incremental byte -> UTF-8 text decoder with replacement.
 *
 * Every maximal invalid subsequence becomes U+FFFD. A sequence cut off at the
 * end of one chunk is held back and completed by the next feed(); flush()
 * turns whatever is still pending into U+FFFD. Never throws on bad input.
 */
class Utf8Decoder {
public:
    std::string feed(std::string_view bytes);
    std::string flush();

    bool has_pending() const noexcept { return !pending_.empty(); }

private:
    std::string pending_;
};

} // namespace core
} // namespace ptyshell
