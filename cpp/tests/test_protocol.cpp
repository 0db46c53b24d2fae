#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

#include "../include/protocol.hpp"

namespace ptyshell::protocol {
namespace {

using core::EventKind;
using core::ExecState;
using core::OutputEvent;
using nlohmann::json;

TEST(ProtocolTest, EncodesStdoutEventWithoutExitCode) {
  auto ev = OutputEvent::stdoutChunk("hi\r\n");
  json j = json::parse(encodeEvent(ev));
  EXPECT_EQ(j["type"], "stdout");
  EXPECT_EQ(j["content"], "hi\r\n");
  EXPECT_EQ(j["timestamp"], ev.timestamp);
  EXPECT_FALSE(j.contains("exit_code"));
}

TEST(ProtocolTest, EncodesExitCode) {
  json j = json::parse(encodeEvent(OutputEvent::exit(3)));
  EXPECT_EQ(j["type"], "exit");
  EXPECT_EQ(j["exit_code"], 3);
  EXPECT_EQ(j["content"], "Process exited with code 3");
}

TEST(ProtocolTest, DecodeEventRestoresFields) {
  auto ev = OutputEvent::exit(130);
  auto back = decodeEvent(encodeEvent(ev));
  EXPECT_EQ(back, ev);
}

TEST(ProtocolTest, DecodeEventRejectsGarbage) {
  EXPECT_THROW(decodeEvent("not json"), ProtocolError);
  EXPECT_THROW(decodeEvent(R"({"content":"x"})"), ProtocolError);
  EXPECT_THROW(decodeEvent(R"({"type":"bogus","content":"x"})"), ProtocolError);
  EXPECT_THROW(decodeEvent(R"({"type":"exit","exit_code":"three"})"), ProtocolError);
}

TEST(ProtocolTest, TimestampIsIsoUtc) {
  auto ev = OutputEvent::error("boom");
  ASSERT_EQ(ev.timestamp.size(), std::string("2024-05-01T12:30:00.123456Z").size());
  EXPECT_EQ(ev.timestamp[4], '-');
  EXPECT_EQ(ev.timestamp[10], 'T');
  EXPECT_EQ(ev.timestamp.back(), 'Z');
}

TEST(ProtocolTest, DecodeExecuteRequest) {
  auto req = decodeExecuteRequest(R"({"code":"echo hi","timeout":5})");
  EXPECT_EQ(req.code, "echo hi");
  EXPECT_EQ(req.timeoutSeconds, 5);

  EXPECT_EQ(decodeExecuteRequest(R"({"code":"ls"})").timeoutSeconds, 0);
  EXPECT_THROW(decodeExecuteRequest(R"({"script":"ls"})"), ProtocolError);
  EXPECT_THROW(decodeExecuteRequest(R"({"code":"ls","timeout":"soon"})"), ProtocolError);
  EXPECT_THROW(decodeExecuteRequest("[1,2]"), ProtocolError);
  EXPECT_THROW(decodeExecuteRequest("{"), ProtocolError);
}

TEST(ProtocolTest, DecodeInputFrame) {
  auto structured = decodeInputFrame(R"({"type":"input","content":"alice\n"})");
  ASSERT_TRUE(structured.has_value());
  EXPECT_EQ(*structured, "alice\n");

  auto legacy = decodeInputFrame("alice");
  ASSERT_TRUE(legacy.has_value());
  EXPECT_EQ(*legacy, "alice\n");

  EXPECT_FALSE(decodeInputFrame(R"({"type":"resize","rows":40})").has_value());
  EXPECT_FALSE(decodeInputFrame(R"({"type":5})").has_value());
  EXPECT_FALSE(decodeInputFrame("42").has_value());
}

TEST(ProtocolTest, StatusToJson) {
  core::ExecutionStatus st;
  st.id = "job-1";
  st.state = ExecState::Failed;
  st.exitCode = 3;
  st.cachedEvents = {OutputEvent::stdoutChunk("x"), OutputEvent::exit(3)};
  st.startedAt = "2024-01-01T00:00:00.000000Z";
  st.lastOutputAt = st.startedAt;

  json j = statusToJson(st);
  EXPECT_EQ(j["script_id"], "job-1");
  EXPECT_EQ(j["status"], "failed");
  EXPECT_EQ(j["exit_code"], 3);
  ASSERT_EQ(j["cached_output"].size(), 2u);
  EXPECT_EQ(j["cached_output"][1]["type"], "exit");

  st.state = ExecState::Running;
  st.exitCode.reset();
  json running = statusToJson(st);
  EXPECT_EQ(running["status"], "running");
  EXPECT_TRUE(running["exit_code"].is_null());
}

TEST(ProtocolTest, SummariesToJson) {
  std::vector<core::StatusSummary> rows{
      {"a", ExecState::Completed, 2},
      {"b", ExecState::Running, 0},
  };
  json j = summariesToJson(rows);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["script_id"], "a");
  EXPECT_EQ(j[0]["status"], "completed");
  EXPECT_EQ(j[0]["cached_lines"], 2);
  EXPECT_EQ(j[1]["status"], "running");
}

}  // namespace
}  // namespace ptyshell::protocol
