#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

#include "channel.hpp"

namespace ptyshell {
namespace core {

class Process; // process.hpp

/**
 * @brief Reader and optional writer threads around one Process.
 *
 * The reader forwards every chunk to the chunk handler in arrival order and
 * calls the end handler exactly once when it leaves its loop (EOF, read error
 * or stop()). The writer drains the input channel until the sentinel, channel
 * close, a failed write or stop().
 */
class IoPump {
public:
	using ChunkHandler = std::function<void(std::string_view chunk)>;
	using EndHandler   = std::function<void()>;

	static constexpr int POLL_INTERVAL_MS = 50;

	IoPump();
	~IoPump();

	IoPump(const IoPump&) = delete;
	IoPump& operator=(const IoPump&) = delete;

	void start(Process& process, ChunkHandler onChunk, EndHandler onEnd,
	           std::shared_ptr<InputChannel> input = nullptr);
	void stop();

	bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }
	bool reader_done() const noexcept { return readerDone_.load(std::memory_order_acquire); }
	bool writer_done() const noexcept { return writerDone_.load(std::memory_order_acquire); }

private:
	void reader_loop_();
	void writer_loop_();

	std::atomic<bool> running_{false};
	std::atomic<bool> readerDone_{false};
	std::atomic<bool> writerDone_{false};
	Process* process_{nullptr};

	std::mutex lifecycle_mutex_;
	ChunkHandler onChunk_{};
	EndHandler onEnd_{};
	std::shared_ptr<InputChannel> input_{};

	std::thread reader_thread_;
	std::thread writer_thread_;
};

} // namespace core
} // namespace ptyshell
