#include "../include/io_pump.hpp"
#include "../include/process.hpp"
#include "../include/dev_debug.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace ptyshell {
namespace core {

IoPump::IoPump() = default;

IoPump::~IoPump() {
	stop();
}

void IoPump::start(Process& process, ChunkHandler onChunk, EndHandler onEnd,
                   std::shared_ptr<InputChannel> input) {
	std::lock_guard<std::mutex> lk(lifecycle_mutex_);
	// Only start once by CAS; a pump is single-use.
	bool expected = false;
	if (!running_.compare_exchange_strong(expected, true)) {
		throw std::logic_error("IoPump already started");
	}

	process_ = &process;
	onChunk_ = std::move(onChunk);
	onEnd_   = std::move(onEnd);
	input_   = std::move(input);
	readerDone_.store(false);
	writerDone_.store(input_ == nullptr);

	// Spawn reader (+ writer); roll back if thread creation fails.
	try {
		reader_thread_ = std::thread(&IoPump::reader_loop_, this);
		if (input_) {
			writer_thread_ = std::thread(&IoPump::writer_loop_, this);
		}
	} catch (...) {
		running_ = false;
		if (reader_thread_.joinable()) reader_thread_.join();
		if (writer_thread_.joinable()) writer_thread_.join();
		throw;
	}
}

void IoPump::stop() {
	std::lock_guard<std::mutex> lk(lifecycle_mutex_);
	running_.store(false, std::memory_order_release);

	// Both loops wake at least every POLL_INTERVAL_MS and observe running_ = false.
	// NOTE: stop() must not be called from either pump thread (deadlock on join).
	if (reader_thread_.joinable()) reader_thread_.join();
	if (writer_thread_.joinable()) writer_thread_.join();
}

void IoPump::reader_loop_() {
	// Chunks go straight to the handler; it must copy what it keeps since the
	// buffer belongs to this loop.
	try {
		while (running_.load(std::memory_order_acquire)) {
			std::optional<std::string> chunk = process_->read_output(POLL_INTERVAL_MS);
			if (!chunk) {
				PTYSHELL_DBG("IO", "reader reached end-of-stream");
				break;
			}
			if (chunk->empty()) continue; // poll interval elapsed
			PTYSHELL_DBG("IO", "read bytes=%zu", chunk->size());
			onChunk_(*chunk);
		}
	} catch (const std::exception& ex) {
		PTYSHELL_DBG("IO", "reader loop failed: %s", ex.what());
	}

	readerDone_.store(true, std::memory_order_release);
	try {
		if (onEnd_) onEnd_();
	} catch (const std::exception& ex) {
		PTYSHELL_DBG("IO", "end handler failed: %s", ex.what());
	}
}

void IoPump::writer_loop_() {
	try {
		while (running_.load(std::memory_order_acquire)) {
			std::optional<std::string> item;
			auto st = input_->pop_for(item, std::chrono::milliseconds(POLL_INTERVAL_MS));
			if (st == InputChannel::PopStatus::Timeout) continue;
			if (st == InputChannel::PopStatus::Closed || !item) {
				PTYSHELL_DBG("IO", "writer received stop sentinel");
				break;
			}
			if (!process_->write(*item)) {
				// Child is gone or the terminal was closed; nothing more to deliver.
				PTYSHELL_DBG("IO", "writer stopping after failed write of %zu bytes", item->size());
				break;
			}
			PTYSHELL_DBG("IO", "wrote input bytes=%zu", item->size());
		}
	} catch (const std::exception& ex) {
		PTYSHELL_DBG("IO", "writer loop failed: %s", ex.what());
	}
	writerDone_.store(true, std::memory_order_release);
}

} // namespace core
} // namespace ptyshell
