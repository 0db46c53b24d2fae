#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../include/io_pump.hpp"
#include "../include/process.hpp"

namespace ptyshell::core {
namespace {

// Scripted stand-in for a PTY: reads replay queued chunks, writes are recorded.
class FakeProcess : public Process {
 public:
  void feed(std::string chunk) {
    std::lock_guard<std::mutex> lk(mx_);
    chunks_.push_back(std::move(chunk));
    cv_.notify_all();
  }
  void hangup() {
    std::lock_guard<std::mutex> lk(mx_);
    eof_ = true;
    cv_.notify_all();
  }
  void failWrites() { failWrites_ = true; }

  bool write(std::string_view data) override {
    if (failWrites_) return false;
    std::lock_guard<std::mutex> lk(mx_);
    written_.emplace_back(data);
    return true;
  }

  std::optional<std::string> read_output(int timeoutMs) override {
    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                 [this] { return eof_ || !chunks_.empty(); });
    if (!chunks_.empty()) {
      std::string c = std::move(chunks_.front());
      chunks_.pop_front();
      return c;
    }
    if (eof_) return std::nullopt;
    return std::string{};
  }

  void shutdown_streams() override { hangup(); }

  std::vector<std::string> written() {
    std::lock_guard<std::mutex> lk(mx_);
    return written_;
  }

 private:
  std::mutex mx_;
  std::condition_variable cv_;
  std::deque<std::string> chunks_;
  std::vector<std::string> written_;
  bool eof_{false};
  std::atomic<bool> failWrites_{false};
};

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
  auto end = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < end) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

TEST(IoPumpTest, ForwardsChunksInOrderThenEnds) {
  FakeProcess proc;
  std::mutex mx;
  std::vector<std::string> seen;
  std::atomic<int> ends{0};

  IoPump pump;
  pump.start(proc,
             [&](std::string_view c) { std::lock_guard<std::mutex> lk(mx); seen.emplace_back(c); },
             [&] { ends++; });

  proc.feed("one ");
  proc.feed("two ");
  proc.feed("three");
  proc.hangup();

  ASSERT_TRUE(WaitUntil([&] { return pump.reader_done(); }));
  pump.stop();

  EXPECT_EQ(ends.load(), 1);
  std::lock_guard<std::mutex> lk(mx);
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0], "one ");
  EXPECT_EQ(seen[2], "three");
}

TEST(IoPumpTest, StopEndsIdleReaderOnce) {
  FakeProcess proc;
  std::atomic<int> ends{0};

  IoPump pump;
  pump.start(proc, [](std::string_view) {}, [&] { ends++; });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  pump.stop();
  pump.stop();

  EXPECT_FALSE(pump.is_running());
  EXPECT_EQ(ends.load(), 1);
}

TEST(IoPumpTest, WriterForwardsInputUntilSentinel) {
  FakeProcess proc;
  auto input = std::make_shared<InputChannel>();

  IoPump pump;
  pump.start(proc, [](std::string_view) {}, [] {}, input);

  input->push(std::string("alice\n"));
  input->push(std::string("bob\n"));
  input->push(std::nullopt);
  input->push(std::string("ignored\n"));

  ASSERT_TRUE(WaitUntil([&] { return pump.writer_done(); }));
  auto written = proc.written();
  ASSERT_EQ(written.size(), 2u);
  EXPECT_EQ(written[0], "alice\n");
  EXPECT_EQ(written[1], "bob\n");

  proc.hangup();
  pump.stop();
}

TEST(IoPumpTest, WriterStopsOnFailedWrite) {
  FakeProcess proc;
  proc.failWrites();
  auto input = std::make_shared<InputChannel>();

  IoPump pump;
  pump.start(proc, [](std::string_view) {}, [] {}, input);
  input->push(std::string("lost\n"));

  EXPECT_TRUE(WaitUntil([&] { return pump.writer_done(); }));
  EXPECT_FALSE(pump.reader_done());
  pump.stop();
}

TEST(IoPumpTest, CannotStartTwice) {
  FakeProcess proc;
  IoPump pump;
  pump.start(proc, [](std::string_view) {}, [] {});
  EXPECT_THROW(pump.start(proc, [](std::string_view) {}, [] {}), std::logic_error);
  pump.stop();
}

}  // namespace
}  // namespace ptyshell::core
