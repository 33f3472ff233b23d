#include "agentstream/session.hpp"

#include <utility>

#include "agentstream/utils/env.hpp"

namespace agentstream {
namespace {

using json = nlohmann::json;

constexpr std::size_t kLoggedRawTextLimit = 256;

std::string clip(const std::string& text) {
  if (text.size() <= kLoggedRawTextLimit) {
    return text;
  }
  return text.substr(0, kLoggedRawTextLimit) + "...";
}

}  // namespace

SessionOptions resolve_session_options(SessionOptions options) {
  if (options.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("AGENTSTREAM_LOG")) {
      if (!env_log->empty()) {
        options.log_level = parse_log_level(*env_log, options.log_level);
      }
    }
  }
  if (!options.max_frame_bytes) {
    options.max_frame_bytes = utils::read_env_positive("AGENTSTREAM_MAX_FRAME_BYTES").value_or(kDefaultMaxFrameBytes);
  }
  return options;
}

StreamSession::StreamSession(ToolStateObserver* observer, SessionOptions options)
    : options_(resolve_session_options(std::move(options))),
      observer_(observer),
      accumulator_(observer),
      agent_streams_(observer),
      stream_([this](const SseFrame& frame) { return handle_frame(frame); },
              *options_.max_frame_bytes,
              false) {}

void StreamSession::feed(const char* data, std::size_t size) {
  if (finished_ || check_abort()) {
    return;
  }
  stream_.feed(data, size);
  report_dropped_frames(stream_.parser().dropped_frames());
}

void StreamSession::finish() {
  if (finished_ || check_abort()) {
    return;
  }
  stream_.finalize();
  report_dropped_frames(stream_.parser().dropped_frames());
  finished_ = true;
  log(LogLevel::Info, "stream finished",
      json{{"frames", frames_seen_}, {"errors", errors_seen_}, {"tools", accumulator_.tool_count()}});
}

bool StreamSession::check_abort() {
  if (!aborted()) {
    return false;
  }
  stream_.stop();
  if (!abort_logged_) {
    abort_logged_ = true;
    log(LogLevel::Info, "stream aborted",
        json{{"frames", frames_seen_}, {"tools", accumulator_.tool_count()}});
  }
  return true;
}

bool StreamSession::handle_frame(const SseFrame& frame) {
  if (check_abort()) {
    return false;
  }
  report_dropped_frames(frame.dropped_before);
  if (aborted()) {
    return false;
  }
  ++frames_seen_;
  handle_event(decode_protocol_event(frame));
  return !aborted();
}

void StreamSession::handle_event(const ProtocolEvent& event) {
  if (event.scope && event.scope->is_agent_tool()) {
    if (!event.scope->tool_call_id) {
      log(LogLevel::Debug, "ignoring agent_tool event without tool_call_id", json{{"kind", event.kind_name}});
      return;
    }
    agent_streams_.apply(event);
    return;
  }

  switch (event.kind) {
    case EventKind::Error:
      ++errors_seen_;
      if (event.error && event.error->raw_text) {
        log(LogLevel::Warn, "failed to decode stream event",
            json{{"reason", event.error->message}, {"raw", clip(*event.error->raw_text)}});
      }
      break;
    case EventKind::Unknown:
      log(LogLevel::Debug, "ignoring unknown event kind", json{{"kind", event.kind_name}});
      return;
    case EventKind::MessageDelta:
    case EventKind::MessageCitation:
    case EventKind::RefusalDelta:
    case EventKind::RefusalDone:
      log(LogLevel::Debug, "ignoring top-level text event", json{{"kind", event.kind_name}});
      return;
    case EventKind::ChunkDone:
      if (event.chunk_done && !accumulator_.has_pending_chunk(event.chunk_done->target)) {
        const auto& target = event.chunk_done->target;
        log(LogLevel::Debug, "chunk.done without pending chunks",
            json{{"entity_kind", target.entity_kind},
                 {"entity_id", target.entity_id},
                 {"field", target.field},
                 {"part_index", target.part_index ? json(*target.part_index) : json(nullptr)}});
      }
      break;
    default:
      break;
  }

  if (is_passthrough(event.kind)) {
    if (observer_) {
      observer_->on_passthrough_event(event);
    }
    return;
  }
  accumulator_.apply(event);
}

void StreamSession::report_dropped_frames(std::size_t dropped) {
  while (dropped_reported_ < dropped) {
    ++dropped_reported_;
    log(LogLevel::Warn, "dropped oversized frame", json{{"max_frame_bytes", *options_.max_frame_bytes}});
    handle_event(make_error_event("frame exceeded max_frame_bytes (" + std::to_string(*options_.max_frame_bytes) + ")"));
  }
}

void StreamSession::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!options_.logger) {
    return;
  }
  if (static_cast<int>(level) > static_cast<int>(options_.log_level)) {
    return;
  }
  options_.logger(level, message, details);
}

}  // namespace agentstream
