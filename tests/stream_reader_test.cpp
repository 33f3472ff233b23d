#include <gtest/gtest.h>

#include "agentstream/error.hpp"
#include "agentstream/stream_reader.hpp"

#include "support/mock_http_client.hpp"
#include "support/env_guard.hpp"
#include "support/recording_observer.hpp"
#include "support/sse_builder.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using json = nlohmann::json;
using agentstream::testing::sse;

namespace testing_utils = agentstream::testing;

namespace {

json tool_output(const std::string& id) {
  return json{{"kind", "tool.output"}, {"tool_call_id", id}, {"output", "ok"}};
}

class StreamReaderTest : public ::testing::Test {
protected:
  testing_utils::SessionEnvGuard env_;
};

}  // namespace

TEST_F(StreamReaderTest, FeedsChunkedBodyIntoSession) {
  testing_utils::MockHttpClient client;
  const std::string body = sse(tool_output("call_1")) + ": ping\n\n" + sse(tool_output("call_2"));
  client.enqueue_stream({body.substr(0, 7), body.substr(7, 40), body.substr(47)});

  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);
  agentstream::StreamRequest request;
  request.url = "https://agents.example.com/v1/stream";
  request.headers["Authorization"] = "Bearer token";

  agentstream::read_event_stream(client, request, session);

  EXPECT_TRUE(session.finished());
  EXPECT_EQ(session.accumulator().tool_count(), 2u);
  EXPECT_EQ(observer.snapshots.size(), 2u);

  const auto& sent = client.last_request();
  ASSERT_TRUE(sent.has_value());
  EXPECT_EQ(sent->method, "GET");
  EXPECT_EQ(sent->url, "https://agents.example.com/v1/stream");
  EXPECT_EQ(sent->headers.at("Accept"), "text/event-stream");
  EXPECT_EQ(sent->headers.at("Authorization"), "Bearer token");
  EXPECT_EQ(sent->headers.count("Last-Event-ID"), 0u);
  EXPECT_EQ(sent->headers.at("Cache-Control"), "no-cache");
  EXPECT_TRUE(static_cast<bool>(sent->on_head));
}

TEST_F(StreamReaderTest, ResumesWithLastEventId) {
  testing_utils::MockHttpClient client;
  client.enqueue_stream({testing_utils::sse_with_id(tool_output("call_2"), "evt_2")});

  agentstream::StreamSession session;
  session.feed(testing_utils::sse_with_id(tool_output("call_1"), "evt_1"));

  agentstream::StreamRequest request;
  request.url = "https://agents.example.com/v1/stream";
  request.method = "POST";
  request.body = R"({"input":"hi"})";
  request.timeout = std::chrono::milliseconds(30000);
  request.connect_timeout = std::chrono::milliseconds(5000);
  agentstream::read_event_stream(client, request, session);

  const auto& sent = client.last_request();
  ASSERT_TRUE(sent.has_value());
  EXPECT_EQ(sent->headers.at("Last-Event-ID"), "evt_1");
  EXPECT_EQ(sent->headers.at("Content-Type"), "application/json");
  EXPECT_EQ(sent->body, R"({"input":"hi"})");
  EXPECT_EQ(sent->timeout, std::chrono::milliseconds(30000));
  EXPECT_EQ(sent->connect_timeout, std::chrono::milliseconds(5000));
  EXPECT_EQ(session.last_event_id(), std::optional<std::string>("evt_2"));
}

TEST_F(StreamReaderTest, NonSuccessStatusThrowsHttpError) {
  testing_utils::MockHttpClient client;
  client.enqueue_stream({R"({"error":{"message":"nope"}})"}, 503);

  agentstream::StreamSession session;
  agentstream::StreamRequest request;
  request.url = "https://agents.example.com/v1/stream";

  try {
    agentstream::read_event_stream(client, request, session);
    FAIL() << "expected HttpError";
  } catch (const agentstream::HttpError& error) {
    EXPECT_EQ(error.status_code(), 503);
    EXPECT_NE(error.body().find("nope"), std::string::npos);
    EXPECT_EQ(error.headers().at("content-type"), "text/event-stream");
  }
  EXPECT_FALSE(session.finished());
}

TEST_F(StreamReaderTest, ErrorBodyIsNotFedToSession) {
  testing_utils::MockHttpClient client;
  const std::string body = sse(tool_output("call_1")) + std::string(8000, 'x');
  client.enqueue_stream({body.substr(0, 20), body.substr(20)}, 502);

  testing_utils::RecordingObserver observer;
  agentstream::StreamSession session(&observer);
  agentstream::StreamRequest request;
  request.url = "https://agents.example.com/v1/stream";

  try {
    agentstream::read_event_stream(client, request, session);
    FAIL() << "expected HttpError";
  } catch (const agentstream::HttpError& error) {
    EXPECT_EQ(error.status_code(), 502);
    EXPECT_EQ(error.body().size(), 4096u);
    EXPECT_EQ(error.body().rfind("data: ", 0), 0u);
  }
  EXPECT_EQ(session.frame_count(), 0u);
  EXPECT_TRUE(observer.sequence.empty());
}

TEST_F(StreamReaderTest, TransportFailureSurfacesConnectionError) {
  testing_utils::MockHttpClient client;
  client.enqueue_error("connection reset");

  agentstream::StreamSession session;
  agentstream::StreamRequest request;
  request.url = "https://agents.example.com/v1/stream";
  EXPECT_THROW(agentstream::read_event_stream(client, request, session), agentstream::StreamConnectionError);
}

TEST_F(StreamReaderTest, AbortedSessionDoesNotConnect) {
  testing_utils::MockHttpClient client;
  agentstream::StreamSession session;
  session.abort();

  agentstream::StreamRequest request;
  request.url = "https://agents.example.com/v1/stream";
  EXPECT_THROW(agentstream::read_event_stream(client, request, session), agentstream::StreamAbortedError);
  EXPECT_FALSE(client.last_request().has_value());
}

TEST_F(StreamReaderTest, AbortMidStreamKeepsAppliedFrames) {
  testing_utils::MockHttpClient client;
  client.enqueue_stream({sse(tool_output("call_1")), sse(tool_output("call_2"))});

  agentstream::StreamSession* session_ptr = nullptr;
  agentstream::CallbackObserver observer([&](std::vector<agentstream::ToolState>) { session_ptr->abort(); });
  agentstream::StreamSession session(&observer);
  session_ptr = &session;

  agentstream::StreamRequest request;
  request.url = "https://agents.example.com/v1/stream";
  EXPECT_THROW(agentstream::read_event_stream(client, request, session), agentstream::StreamAbortedError);
  EXPECT_EQ(session.accumulator().tool_count(), 1u);
  EXPECT_FALSE(session.finished());
}
