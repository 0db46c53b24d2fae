#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "../include/output_cache.hpp"

namespace ptyshell::core {
namespace {

TEST(OutputCacheTest, KeepsNewestEventsOldestFirst) {
  OutputCache cache;
  for (int i = 0; i < 1100; ++i) {
    cache.push(OutputEvent::stdoutChunk(std::to_string(i)));
  }

  auto events = cache.snapshot();
  ASSERT_EQ(events.size(), 1000u);
  EXPECT_EQ(events.front().content, "100");
  EXPECT_EQ(events.back().content, "1099");
  for (size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].content, std::to_string(100 + i));
  }
}

TEST(OutputCacheTest, CustomCapacity) {
  OutputCache cache(3);
  cache.push(OutputEvent::stdoutChunk("a"));
  cache.push(OutputEvent::stdoutChunk("b"));
  EXPECT_EQ(cache.size(), 2u);

  cache.push(OutputEvent::stdoutChunk("c"));
  cache.push(OutputEvent::exit(0));
  auto events = cache.snapshot();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].content, "b");
  EXPECT_EQ(events[2].kind, EventKind::Exit);
  EXPECT_EQ(cache.capacity(), 3u);
}

TEST(OutputCacheTest, ClearEmptiesCache) {
  OutputCache cache(2);
  cache.push(OutputEvent::stdoutChunk("x"));
  cache.clear();
  EXPECT_TRUE(cache.empty());
  EXPECT_TRUE(cache.snapshot().empty());
}

TEST(OutputCacheTest, ZeroCapacityRejected) {
  EXPECT_THROW(OutputCache(0), std::invalid_argument);
}

}  // namespace
}  // namespace ptyshell::core
