#include <gtest/gtest.h>

#include "agentstream/error.hpp"
#include "agentstream/session.hpp"

#include "support/env_guard.hpp"
#include "support/recording_observer.hpp"
#include "support/sse_builder.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;
using agentstream::testing::sse;

namespace testing_utils = agentstream::testing;

namespace {

struct LogRecord {
  agentstream::LogLevel level;
  std::string message;
  json details;
};

agentstream::SessionOptions capture_logs(std::vector<LogRecord>& records, agentstream::LogLevel level) {
  agentstream::SessionOptions options;
  options.log_level = level;
  options.logger = [&records](agentstream::LogLevel lvl, const std::string& message, const json& details) {
    records.push_back(LogRecord{lvl, message, details});
  };
  return options;
}

json tool_output(const std::string& id) {
  return json{{"kind", "tool.output"}, {"tool_call_id", id}, {"output", "ok"}};
}

class SessionTest : public ::testing::Test {
protected:
  testing_utils::SessionEnvGuard env_;
};

}  // namespace

TEST_F(SessionTest, FeedsFramesIntoAccumulator) {
  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);

  const std::string stream = sse(tool_output("call_1")) + sse(tool_output("call_2"));
  session.feed(stream.substr(0, 10));
  session.feed(stream.substr(10));
  session.finish();

  EXPECT_TRUE(session.finished());
  EXPECT_EQ(session.frame_count(), 2u);
  EXPECT_EQ(session.error_count(), 0u);
  ASSERT_EQ(observer.snapshots.size(), 2u);
  EXPECT_EQ(observer.latest().size(), 2u);
  EXPECT_EQ(session.accumulator().tool_count(), 2u);
}

TEST_F(SessionTest, PassthroughEventsReachObserverOnly) {
  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);

  session.feed(sse(json{{"kind", "usage"}, {"output_tokens", 12}}));
  session.feed(sse(json{{"kind", "lifecycle"}, {"phase", "started"}}));
  session.feed("event: agent_update\ndata: {\"agent\":\"triage\"}\n\n");

  EXPECT_TRUE(observer.snapshots.empty());
  ASSERT_EQ(observer.passthrough.size(), 3u);
  EXPECT_EQ(observer.passthrough[0].kind, agentstream::EventKind::Usage);
  EXPECT_EQ(observer.passthrough[0].raw["output_tokens"], 12);
  EXPECT_EQ(observer.passthrough[2].kind, agentstream::EventKind::AgentUpdate);
}

TEST_F(SessionTest, DecodeFailuresBecomeErrorEventsAndProcessingContinues) {
  testing_utils::RecordingObserver observer;
  std::vector<LogRecord> logs;
  agentstream::StreamSession session(&observer, capture_logs(logs, agentstream::LogLevel::Warn));

  session.feed("data: {broken\n\n");
  session.feed(sse(json{{"kind", "tool.arguments.delta"}, {"delta", "{"}}));
  session.feed(sse(tool_output("call_1")));

  EXPECT_EQ(session.error_count(), 2u);
  ASSERT_EQ(observer.passthrough.size(), 2u);
  for (const auto& event : observer.passthrough) {
    ASSERT_EQ(event.kind, agentstream::EventKind::Error);
    EXPECT_EQ(event.error->code, std::optional<std::string>("decode_error"));
  }
  EXPECT_EQ(observer.passthrough[0].error->raw_text, std::optional<std::string>("{broken"));
  ASSERT_EQ(observer.snapshots.size(), 1u);

  ASSERT_EQ(logs.size(), 2u);
  EXPECT_EQ(logs[0].level, agentstream::LogLevel::Warn);
  EXPECT_EQ(logs[0].message, "failed to decode stream event");
  EXPECT_EQ(logs[0].details["raw"], "{broken");
}

TEST_F(SessionTest, ProviderErrorsAreCountedButNotLoggedAsDecodeFailures) {
  testing_utils::RecordingObserver observer;
  std::vector<LogRecord> logs;
  agentstream::StreamSession session(&observer, capture_logs(logs, agentstream::LogLevel::Warn));

  session.feed(sse(json{{"kind", "error"}, {"message", "upstream timeout"}}));
  EXPECT_EQ(session.error_count(), 1u);
  ASSERT_EQ(observer.passthrough.size(), 1u);
  EXPECT_EQ(observer.passthrough[0].error->message, "upstream timeout");
  EXPECT_TRUE(logs.empty());
}

TEST_F(SessionTest, LogLevelFiltersMessages) {
  std::vector<LogRecord> logs;
  agentstream::StreamSession session(nullptr, capture_logs(logs, agentstream::LogLevel::Error));
  session.feed("data: nope\n\n");
  session.feed(sse(json{{"kind", "mystery"}}));
  session.finish();
  EXPECT_TRUE(logs.empty());
  EXPECT_EQ(session.error_count(), 1u);
}

TEST_F(SessionTest, DebugLoggingReportsUnknownKindsAndStrayChunkDone) {
  std::vector<LogRecord> logs;
  agentstream::StreamSession session(nullptr, capture_logs(logs, agentstream::LogLevel::Debug));
  session.feed(sse(json{{"kind", "mystery"}}));
  session.feed(sse(json{{"kind", "chunk.done"},
                        {"target", {{"entity_kind", "tool_call"}, {"entity_id", "ig"}, {"field", "partial_image_b64"}}}}));
  session.finish();

  ASSERT_EQ(logs.size(), 3u);
  EXPECT_EQ(logs[0].level, agentstream::LogLevel::Debug);
  EXPECT_EQ(logs[0].details["kind"], "mystery");
  EXPECT_EQ(logs[1].message, "chunk.done without pending chunks");
  EXPECT_TRUE(logs[1].details["part_index"].is_null());
  EXPECT_EQ(logs[2].level, agentstream::LogLevel::Info);
  EXPECT_EQ(logs[2].message, "stream finished");
  EXPECT_EQ(logs[2].details["frames"], 2);
}

TEST_F(SessionTest, FinishFlushesTrailingFrame) {
  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);
  session.feed("data: " + tool_output("call_1").dump());
  EXPECT_TRUE(observer.snapshots.empty());
  session.finish();
  EXPECT_EQ(observer.snapshots.size(), 1u);

  session.feed(sse(tool_output("call_2")));
  EXPECT_EQ(session.accumulator().tool_count(), 1u);
}

TEST_F(SessionTest, TracksEventIdAndRetry) {
  agentstream::StreamSession session;
  session.feed("retry: 2500\nid: evt_3\ndata: {\"kind\":\"usage\"}\n\n");
  EXPECT_EQ(session.last_event_id(), std::optional<std::string>("evt_3"));
  EXPECT_EQ(session.retry_ms(), std::optional<long long>(2500));
}

TEST_F(SessionTest, AbortStopsProcessingAtNextFrame) {
  testing_utils::RecordingObserver observer;
  std::vector<LogRecord> logs;
  agentstream::StreamSession session(&observer, capture_logs(logs, agentstream::LogLevel::Info));

  session.feed(sse(tool_output("call_1")));
  session.abort();
  session.feed(sse(tool_output("call_2")));
  session.finish();

  EXPECT_TRUE(session.aborted());
  EXPECT_FALSE(session.finished());
  EXPECT_EQ(session.accumulator().tool_count(), 1u);
  ASSERT_EQ(logs.size(), 1u);
  EXPECT_EQ(logs[0].message, "stream aborted");
}

TEST_F(SessionTest, AbortFromObserverSkipsRemainingFramesInChunk) {
  agentstream::StreamSession* session_ptr = nullptr;
  std::size_t snapshots = 0;
  agentstream::CallbackObserver observer([&](std::vector<agentstream::ToolState>) {
    ++snapshots;
    session_ptr->abort();
  });
  agentstream::StreamSession session(&observer);
  session_ptr = &session;

  session.feed(sse(tool_output("a")) + sse(tool_output("b")) + sse(tool_output("c")));
  EXPECT_EQ(snapshots, 1u);
  EXPECT_EQ(session.frame_count(), 1u);
  EXPECT_EQ(session.accumulator().tool_count(), 1u);
}

TEST_F(SessionTest, OversizedFramesAreReportedAsErrors) {
  testing_utils::RecordingObserver observer;
  agentstream::SessionOptions options;
  options.max_frame_bytes = 64;
  agentstream::StreamSession session(&observer, options);

  json big = tool_output("big");
  big["output"] = std::string(200, 'x');
  session.feed(sse(big) + sse(tool_output("small")));

  EXPECT_EQ(session.error_count(), 1u);
  ASSERT_EQ(observer.passthrough.size(), 1u);
  EXPECT_NE(observer.passthrough[0].error->message.find("max_frame_bytes"), std::string::npos);
  EXPECT_EQ(session.accumulator().tool_count(), 1u);
  EXPECT_TRUE(session.accumulator().get_tool_by_id("small").has_value());
}

TEST_F(SessionTest, OversizedFrameErrorKeepsArrivalOrder) {
  testing_utils::RecordingObserver observer;
  agentstream::SessionOptions options;
  options.max_frame_bytes = 128;
  agentstream::StreamSession session(&observer, options);

  json big = tool_output("big");
  big["output"] = std::string(400, 'x');
  session.feed(sse(tool_output("before")) + sse(big) + sse(tool_output("after")));

  const std::vector<std::string> expected{"tool_states:1", "error", "tool_states:2"};
  EXPECT_EQ(observer.sequence, expected);
  EXPECT_EQ(session.error_count(), 1u);
}

TEST_F(SessionTest, OversizedFrameSplitAcrossChunksIsReportedOnce) {
  testing_utils::RecordingObserver observer;
  agentstream::SessionOptions options;
  options.max_frame_bytes = 128;
  agentstream::StreamSession session(&observer, options);

  json big = tool_output("big");
  big["output"] = std::string(400, 'x');
  const std::string stream = sse(big) + sse(tool_output("after"));
  session.feed(stream.substr(0, 300));
  session.feed(stream.substr(300));
  session.finish();

  const std::vector<std::string> expected{"error", "tool_states:1"};
  EXPECT_EQ(observer.sequence, expected);
  EXPECT_EQ(session.error_count(), 1u);
}

TEST_F(SessionTest, OutOfRangeOutputIndexDoesNotReorderTools) {
  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);

  json first = tool_output("a");
  first["output_index"] = 1;
  session.feed(sse(first));
  session.feed(R"(data: {"kind":"tool.output","tool_call_id":"b","output_index":4294967296,"output":"ok"})"
               "\n\n");

  EXPECT_EQ(session.error_count(), 1u);
  ASSERT_EQ(observer.latest().size(), 1u);
  EXPECT_EQ(observer.latest()[0].id, "a");
  EXPECT_FALSE(session.accumulator().get_tool_by_id("b").has_value());
}

TEST_F(SessionTest, AgentToolScopedEventsStayOutOfTopLevelTools) {
  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);

  json scope = {{"type", "agent_tool"}, {"tool_call_id", "outer"}, {"tool_name", "researcher"}, {"agent", "research"}};
  session.feed(sse(json{{"kind", "output_item.added"},
                        {"item_id", "outer"},
                        {"output_index", 0},
                        {"item_type", "function_call"}}));
  session.feed(sse(json{{"kind", "tool.status"},
                        {"scope", scope},
                        {"tool",
                         {{"tool_call_id", "inner_ws"}, {"tool_type", "web_search"}, {"status", "completed"}}}}));
  session.feed(sse(json{{"kind", "message.delta"},
                        {"scope", scope},
                        {"item_id", "msg_1"},
                        {"output_index", 0},
                        {"content_index", 0},
                        {"delta", "Found "}}));
  session.feed(sse(json{{"kind", "message.delta"},
                        {"scope", scope},
                        {"item_id", "msg_1"},
                        {"output_index", 0},
                        {"content_index", 0},
                        {"delta", "three sources"}}));

  ASSERT_EQ(observer.snapshots.size(), 1u);
  ASSERT_EQ(observer.latest().size(), 1u);
  EXPECT_EQ(observer.latest()[0].id, "outer");
  EXPECT_EQ(session.accumulator().tool_count(), 1u);
  EXPECT_FALSE(session.accumulator().get_tool_by_id("inner_ws").has_value());

  ASSERT_FALSE(observer.agent_streams.empty());
  const auto& streams = observer.agent_streams.back();
  ASSERT_EQ(streams.size(), 1u);
  EXPECT_EQ(streams[0].tool_call_id, "outer");
  EXPECT_EQ(streams[0].tool_name, std::optional<std::string>("researcher"));
  EXPECT_EQ(streams[0].text, "Found three sources");
  EXPECT_TRUE(streams[0].streaming);
  EXPECT_TRUE(observer.passthrough.empty());
}

TEST_F(SessionTest, AgentToolScopeWithoutToolCallIdIsDropped) {
  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);

  session.feed(sse(json{{"kind", "tool.output"},
                        {"scope", {{"type", "agent_tool"}}},
                        {"tool_call_id", "inner"},
                        {"output", "ok"}}));

  EXPECT_TRUE(observer.sequence.empty());
  EXPECT_EQ(session.accumulator().tool_count(), 0u);
  EXPECT_EQ(session.agent_tool_streams().stream_count(), 0u);
}

TEST_F(SessionTest, ObserverExceptionsPropagateToCaller) {
  agentstream::CallbackObserver observer([](std::vector<agentstream::ToolState>) {
    throw std::runtime_error("observer failed");
  });
  agentstream::StreamSession session(&observer);
  EXPECT_THROW(session.feed(sse(tool_output("call_1"))), std::runtime_error);
}

TEST(SessionOptionsTest, ReadsEnvironment) {
  testing_utils::EnvVarGuard log_guard("AGENTSTREAM_LOG", std::string("DEBUG"));
  testing_utils::EnvVarGuard size_guard("AGENTSTREAM_MAX_FRAME_BYTES", std::string("4096"));

  auto options = agentstream::resolve_session_options({});
  EXPECT_EQ(options.log_level, agentstream::LogLevel::Debug);
  EXPECT_EQ(options.max_frame_bytes, std::optional<std::size_t>(4096));
}

TEST(SessionOptionsTest, ExplicitValuesWinOverEnvironment) {
  testing_utils::EnvVarGuard log_guard("AGENTSTREAM_LOG", std::string("debug"));
  testing_utils::EnvVarGuard size_guard("AGENTSTREAM_MAX_FRAME_BYTES", std::string("4096"));

  agentstream::SessionOptions explicit_options;
  explicit_options.log_level = agentstream::LogLevel::Warn;
  explicit_options.max_frame_bytes = 128;
  auto options = agentstream::resolve_session_options(explicit_options);
  EXPECT_EQ(options.log_level, agentstream::LogLevel::Warn);
  EXPECT_EQ(options.max_frame_bytes, std::optional<std::size_t>(128));
}

TEST(SessionOptionsTest, DefaultsWhenEnvironmentIsEmpty) {
  testing_utils::EnvVarGuard log_guard("AGENTSTREAM_LOG", std::nullopt);
  testing_utils::EnvVarGuard size_guard("AGENTSTREAM_MAX_FRAME_BYTES", std::nullopt);

  auto options = agentstream::resolve_session_options({});
  EXPECT_EQ(options.log_level, agentstream::LogLevel::Off);
  EXPECT_EQ(options.max_frame_bytes, std::optional<std::size_t>(agentstream::kDefaultMaxFrameBytes));
}

TEST(SessionOptionsTest, MalformedFrameLimitThrows) {
  testing_utils::EnvVarGuard size_guard("AGENTSTREAM_MAX_FRAME_BYTES", std::string("lots"));
  EXPECT_THROW(agentstream::StreamSession session, agentstream::AgentStreamError);
}
