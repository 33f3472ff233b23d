#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "agentstream/chunks.hpp"
#include "agentstream/streaming.hpp"

namespace agentstream {

enum class EventKind {
  ToolStatus,
  ToolArgumentsDelta,
  ToolArgumentsDone,
  ToolCodeDelta,
  ToolCodeDone,
  ToolOutput,
  ToolApproval,
  ChunkDelta,
  ChunkDone,
  OutputItemAdded,
  OutputItemDone,
  MessageDelta,
  MessageCitation,
  RefusalDelta,
  RefusalDone,
  RawResponse,
  Lifecycle,
  AgentUpdate,
  Usage,
  Error,
  Unknown
};

const char* to_string(EventKind kind);

bool is_passthrough(EventKind kind);

struct ToolStatusDetails {
  std::string tool_type;
  std::optional<std::string> tool_call_id;
  std::string status;
  std::optional<std::string> name;
  std::optional<std::string> tool_name;
  std::optional<std::string> server_label;
  std::optional<nlohmann::json> query;
  std::optional<nlohmann::json> sources;
  std::optional<nlohmann::json> queries;
  std::optional<nlohmann::json> results;
  std::optional<std::string> container_id;
  std::optional<std::string> container_mode;
  std::optional<std::string> format;
  std::optional<std::string> revised_prompt;
  std::optional<std::string> arguments_text;
  std::optional<nlohmann::json> arguments_json;
  std::optional<nlohmann::json> output;
  nlohmann::json raw = nlohmann::json::object();
};

struct ToolArgumentsDeltaEvent {
  std::string tool_name;
  std::string tool_type;
  std::string delta;
};

struct ToolArgumentsDoneEvent {
  std::string tool_name;
  std::string tool_type;
  std::string arguments_text;
  std::optional<nlohmann::json> arguments_json;
};

struct ToolCodeDeltaEvent {
  std::string delta;
};

struct ToolCodeDoneEvent {
  std::string code;
};

struct ToolOutputEvent {
  std::optional<nlohmann::json> output;
};

struct ToolApprovalEvent {
  std::string tool_name;
  std::string tool_type;
  std::optional<std::string> server_label;
  bool approved = false;
  std::optional<std::string> reason;
  std::optional<std::string> approval_request_id;
};

struct ChunkDeltaEvent {
  ChunkTarget target;
  std::string encoding;
  int chunk_index = 0;
  std::string data;
};

struct ChunkDoneEvent {
  ChunkTarget target;
};

struct OutputItemEvent {
  std::string item_type;
  std::optional<std::string> role;
  std::optional<std::string> status;
};

struct TextDeltaEvent {
  int content_index = 0;
  std::string delta;
};

struct TextDoneEvent {
  int content_index = 0;
  std::string text;
};

struct CitationEvent {
  nlohmann::json citation;
};

// Set on events produced by a nested agent running as a tool.
struct EventScope {
  std::string type;
  std::optional<std::string> tool_call_id;
  std::optional<std::string> tool_name;
  std::optional<std::string> agent;

  [[nodiscard]] bool is_agent_tool() const { return type == "agent_tool"; }
};

struct ErrorDetails {
  std::string message;
  std::optional<std::string> code;
  // Frame data that failed to decode, when the error was produced locally.
  std::optional<std::string> raw_text;
};

struct ProtocolEvent {
  EventKind kind = EventKind::Unknown;
  std::string kind_name;
  std::optional<std::string> server_timestamp;
  std::optional<std::string> item_id;
  std::optional<int> output_index;
  std::optional<std::string> tool_call_id;
  std::optional<std::string> event_id;
  std::optional<EventScope> scope;

  std::optional<ToolStatusDetails> tool;
  std::optional<ToolArgumentsDeltaEvent> arguments_delta;
  std::optional<ToolArgumentsDoneEvent> arguments_done;
  std::optional<ToolCodeDeltaEvent> code_delta;
  std::optional<ToolCodeDoneEvent> code_done;
  std::optional<ToolOutputEvent> tool_output;
  std::optional<ToolApprovalEvent> approval;
  std::optional<ChunkDeltaEvent> chunk_delta;
  std::optional<ChunkDoneEvent> chunk_done;
  std::optional<OutputItemEvent> output_item;
  std::optional<TextDeltaEvent> text_delta;
  std::optional<TextDoneEvent> text_done;
  std::optional<CitationEvent> citation;
  std::optional<ErrorDetails> error;

  nlohmann::json raw = nlohmann::json::object();
};

ProtocolEvent decode_protocol_event(const nlohmann::json& payload);

ProtocolEvent decode_protocol_event(const SseFrame& frame);

ProtocolEvent make_error_event(std::string message, std::optional<std::string> raw_text = std::nullopt);

}  // namespace agentstream
