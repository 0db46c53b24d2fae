#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ptyshell {
namespace core {

/**
 * @brief Byte-stream endpoint of a child process as seen by IoPump.
 *
 * A terminal-attached child has a single merged output stream.
 */
class Process {
public:
    virtual ~Process() = default;

    /// Writes all bytes; false once the stream is gone (EIO, EPIPE, closed).
    virtual bool write(std::string_view data) = 0;

    /**
     * Waits up to timeoutMs for output.
     * @return bytes read, an empty string when nothing arrived in time,
     *         std::nullopt at end-of-stream or on a read error.
     */
    virtual std::optional<std::string> read_output(int timeoutMs) = 0;

    virtual void shutdown_streams() = 0;
};

} // namespace core
} // namespace ptyshell
