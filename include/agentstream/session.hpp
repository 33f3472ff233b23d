#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "agentstream/agent_tool_streams.hpp"
#include "agentstream/events.hpp"
#include "agentstream/logging.hpp"
#include "agentstream/observer.hpp"
#include "agentstream/streaming.hpp"
#include "agentstream/tool_accumulator.hpp"

namespace agentstream {

inline constexpr std::size_t kDefaultMaxFrameBytes = 32 * 1024 * 1024;

struct SessionOptions {
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
  std::optional<std::size_t> max_frame_bytes;
};

// AGENTSTREAM_LOG applies only while the level is Off. Throws AgentStreamError on malformed values.
SessionOptions resolve_session_options(SessionOptions options);

// One per stream. Everything except abort() belongs to the feeding thread.
class StreamSession {
public:
  explicit StreamSession(ToolStateObserver* observer = nullptr, SessionOptions options = {});

  StreamSession(const StreamSession&) = delete;
  StreamSession& operator=(const StreamSession&) = delete;

  void feed(const char* data, std::size_t size);
  void feed(std::string_view chunk) { feed(chunk.data(), chunk.size()); }

  void finish();

  void abort() { abort_requested_.store(true); }

  [[nodiscard]] bool aborted() const { return abort_requested_.load(); }
  [[nodiscard]] bool finished() const { return finished_; }

  [[nodiscard]] const ToolAccumulator& accumulator() const { return accumulator_; }
  [[nodiscard]] const AgentToolStreamAccumulator& agent_tool_streams() const { return agent_streams_; }
  [[nodiscard]] const std::optional<std::string>& last_event_id() const { return stream_.parser().last_event_id(); }
  [[nodiscard]] const std::optional<long long>& retry_ms() const { return stream_.parser().retry_ms(); }
  [[nodiscard]] std::size_t frame_count() const { return frames_seen_; }
  [[nodiscard]] std::size_t error_count() const { return errors_seen_; }
  [[nodiscard]] const SessionOptions& options() const { return options_; }

private:
  bool handle_frame(const SseFrame& frame);
  void handle_event(const ProtocolEvent& event);
  void report_dropped_frames(std::size_t dropped);
  bool check_abort();
  void log(LogLevel level, const std::string& message, const nlohmann::json& details = nlohmann::json::object()) const;

  SessionOptions options_;
  ToolStateObserver* observer_;
  ToolAccumulator accumulator_;
  AgentToolStreamAccumulator agent_streams_;
  SSEEventStream stream_;
  std::atomic<bool> abort_requested_{false};
  bool abort_logged_ = false;
  bool finished_ = false;
  std::size_t frames_seen_ = 0;
  std::size_t errors_seen_ = 0;
  std::size_t dropped_reported_ = 0;
};

}  // namespace agentstream
