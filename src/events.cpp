#include "agentstream/events.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace agentstream {
namespace {

using json = nlohmann::json;

class DecodeFailure {
public:
  explicit DecodeFailure(std::string reason) : reason_(std::move(reason)) {}
  const std::string& reason() const { return reason_; }

private:
  std::string reason_;
};

std::optional<std::string> optional_string(const json& payload, const char* key) {
  if (payload.contains(key) && payload.at(key).is_string()) {
    return payload.at(key).get<std::string>();
  }
  return std::nullopt;
}

std::optional<int> optional_int(const json& payload, const char* key) {
  if (!payload.contains(key) || !payload.at(key).is_number_integer()) {
    return std::nullopt;
  }
  const auto& value = payload.at(key);
  constexpr auto kMax = std::numeric_limits<int>::max();
  constexpr auto kMin = std::numeric_limits<int>::min();
  if (value.is_number_unsigned()) {
    const auto number = value.get<std::uint64_t>();
    if (number > static_cast<std::uint64_t>(kMax)) {
      throw DecodeFailure(std::string("field '") + key + "' is out of range: " + value.dump());
    }
    return static_cast<int>(number);
  }
  const auto number = value.get<std::int64_t>();
  if (number < kMin || number > kMax) {
    throw DecodeFailure(std::string("field '") + key + "' is out of range: " + value.dump());
  }
  return static_cast<int>(number);
}

std::optional<json> optional_value(const json& payload, const char* key) {
  if (payload.contains(key) && !payload.at(key).is_null()) {
    return payload.at(key);
  }
  return std::nullopt;
}

std::string required_string(const json& payload, const char* key, const std::string& kind) {
  if (auto value = optional_string(payload, key)) {
    return *value;
  }
  throw DecodeFailure(kind + " event missing string field '" + key + "'");
}

std::optional<EventScope> parse_scope(const json& payload) {
  if (!payload.contains("scope") || !payload.at("scope").is_object()) {
    return std::nullopt;
  }
  const auto& scope_json = payload.at("scope");
  EventScope scope;
  scope.type = scope_json.value("type", std::string{});
  scope.tool_call_id = optional_string(scope_json, "tool_call_id");
  scope.tool_name = optional_string(scope_json, "tool_name");
  scope.agent = optional_string(scope_json, "agent");
  return scope;
}

void require_item_id(const ProtocolEvent& event) {
  if (!event.item_id) {
    throw DecodeFailure(event.kind_name + " event missing string field 'item_id'");
  }
}

ChunkTarget parse_chunk_target(const json& payload, const std::string& kind) {
  if (!payload.contains("target") || !payload.at("target").is_object()) {
    throw DecodeFailure(kind + " event missing object field 'target'");
  }
  const auto& target_json = payload.at("target");
  ChunkTarget target;
  target.entity_kind = required_string(target_json, "entity_kind", kind);
  target.entity_id = required_string(target_json, "entity_id", kind);
  target.field = required_string(target_json, "field", kind);
  target.part_index = optional_int(target_json, "part_index");
  return target;
}

ToolStatusDetails parse_tool_details(const json& payload) {
  if (!payload.contains("tool") || !payload.at("tool").is_object()) {
    throw DecodeFailure("tool.status event missing object field 'tool'");
  }
  const auto& tool_json = payload.at("tool");
  ToolStatusDetails tool;
  tool.raw = tool_json;
  tool.tool_type = tool_json.value("tool_type", std::string{});
  tool.tool_call_id = optional_string(tool_json, "tool_call_id");
  tool.status = tool_json.value("status", std::string{});
  tool.name = optional_string(tool_json, "name");
  tool.tool_name = optional_string(tool_json, "tool_name");
  tool.server_label = optional_string(tool_json, "server_label");
  tool.query = optional_value(tool_json, "query");
  tool.sources = optional_value(tool_json, "sources");
  tool.queries = optional_value(tool_json, "queries");
  tool.results = optional_value(tool_json, "results");
  tool.container_id = optional_string(tool_json, "container_id");
  tool.container_mode = optional_string(tool_json, "container_mode");
  tool.format = optional_string(tool_json, "format");
  tool.revised_prompt = optional_string(tool_json, "revised_prompt");
  tool.arguments_text = optional_string(tool_json, "arguments_text");
  tool.arguments_json = optional_value(tool_json, "arguments_json");
  tool.output = optional_value(tool_json, "output");
  return tool;
}

EventKind kind_from_name(const std::string& name) {
  if (name == "tool.status") return EventKind::ToolStatus;
  if (name == "tool.arguments.delta") return EventKind::ToolArgumentsDelta;
  if (name == "tool.arguments.done") return EventKind::ToolArgumentsDone;
  if (name == "tool.code.delta") return EventKind::ToolCodeDelta;
  if (name == "tool.code.done") return EventKind::ToolCodeDone;
  if (name == "tool.output") return EventKind::ToolOutput;
  if (name == "tool.approval") return EventKind::ToolApproval;
  if (name == "chunk.delta") return EventKind::ChunkDelta;
  if (name == "chunk.done") return EventKind::ChunkDone;
  if (name == "output_item.added") return EventKind::OutputItemAdded;
  if (name == "output_item.done") return EventKind::OutputItemDone;
  if (name == "message.delta") return EventKind::MessageDelta;
  if (name == "message.citation") return EventKind::MessageCitation;
  if (name == "refusal.delta") return EventKind::RefusalDelta;
  if (name == "refusal.done") return EventKind::RefusalDone;
  if (name == "raw_response") return EventKind::RawResponse;
  if (name == "lifecycle") return EventKind::Lifecycle;
  if (name == "agent_update" || name == "agent.updated") return EventKind::AgentUpdate;
  if (name == "usage") return EventKind::Usage;
  if (name == "error") return EventKind::Error;
  return EventKind::Unknown;
}

void decode_body(ProtocolEvent& event, const json& payload) {
  const std::string& kind = event.kind_name;
  switch (event.kind) {
    case EventKind::ToolStatus:
      event.tool = parse_tool_details(payload);
      if (!event.tool_call_id) {
        event.tool_call_id = event.tool->tool_call_id;
      }
      if (!event.tool_call_id && !event.item_id) {
        throw DecodeFailure("tool.status event carries neither tool_call_id nor item_id");
      }
      break;
    case EventKind::ToolArgumentsDelta: {
      event.tool_call_id = required_string(payload, "tool_call_id", kind);
      ToolArgumentsDeltaEvent delta;
      delta.tool_name = payload.value("tool_name", std::string{});
      delta.tool_type = payload.value("tool_type", std::string{"function"});
      delta.delta = payload.value("delta", std::string{});
      event.arguments_delta = std::move(delta);
      break;
    }
    case EventKind::ToolArgumentsDone: {
      event.tool_call_id = required_string(payload, "tool_call_id", kind);
      ToolArgumentsDoneEvent done;
      done.tool_name = payload.value("tool_name", std::string{});
      done.tool_type = payload.value("tool_type", std::string{"function"});
      done.arguments_text = payload.value("arguments_text", std::string{});
      done.arguments_json = optional_value(payload, "arguments_json");
      event.arguments_done = std::move(done);
      break;
    }
    case EventKind::ToolCodeDelta:
      event.tool_call_id = required_string(payload, "tool_call_id", kind);
      event.code_delta = ToolCodeDeltaEvent{payload.value("delta", std::string{})};
      break;
    case EventKind::ToolCodeDone:
      event.tool_call_id = required_string(payload, "tool_call_id", kind);
      event.code_done = ToolCodeDoneEvent{payload.value("code", std::string{})};
      break;
    case EventKind::ToolOutput:
      event.tool_call_id = required_string(payload, "tool_call_id", kind);
      event.tool_output = ToolOutputEvent{optional_value(payload, "output")};
      break;
    case EventKind::ToolApproval: {
      event.tool_call_id = required_string(payload, "tool_call_id", kind);
      ToolApprovalEvent approval;
      approval.tool_name = payload.value("tool_name", std::string{});
      approval.tool_type = payload.value("tool_type", std::string{"mcp"});
      approval.server_label = optional_string(payload, "server_label");
      if (payload.contains("approved") && payload.at("approved").is_boolean()) {
        approval.approved = payload.at("approved").get<bool>();
      }
      approval.reason = optional_string(payload, "reason");
      approval.approval_request_id = optional_string(payload, "approval_request_id");
      event.approval = std::move(approval);
      break;
    }
    case EventKind::ChunkDelta: {
      ChunkDeltaEvent delta;
      delta.target = parse_chunk_target(payload, kind);
      delta.encoding = payload.value("encoding", std::string{});
      delta.chunk_index = optional_int(payload, "chunk_index").value_or(0);
      delta.data = payload.value("data", std::string{});
      event.chunk_delta = std::move(delta);
      break;
    }
    case EventKind::ChunkDone:
      event.chunk_done = ChunkDoneEvent{parse_chunk_target(payload, kind)};
      break;
    case EventKind::OutputItemAdded:
    case EventKind::OutputItemDone: {
      require_item_id(event);
      OutputItemEvent item;
      item.item_type = payload.value("item_type", std::string{});
      item.role = optional_string(payload, "role");
      item.status = optional_string(payload, "status");
      event.output_item = std::move(item);
      break;
    }
    case EventKind::MessageDelta:
    case EventKind::RefusalDelta:
      require_item_id(event);
      event.text_delta = TextDeltaEvent{optional_int(payload, "content_index").value_or(0),
                                        payload.value("delta", std::string{})};
      break;
    case EventKind::RefusalDone:
      require_item_id(event);
      event.text_done = TextDoneEvent{optional_int(payload, "content_index").value_or(0),
                                      payload.value("refusal_text", std::string{})};
      break;
    case EventKind::MessageCitation:
      require_item_id(event);
      event.citation = CitationEvent{optional_value(payload, "citation").value_or(payload)};
      break;
    case EventKind::Error: {
      ErrorDetails error;
      if (auto message = optional_string(payload, "message")) {
        error.message = *message;
      } else if (payload.contains("error") && payload.at("error").is_object()) {
        error.message = payload.at("error").value("message", std::string{});
        error.code = optional_string(payload.at("error"), "code");
      } else if (auto text = optional_string(payload, "error")) {
        error.message = *text;
      }
      if (!error.code) {
        error.code = optional_string(payload, "code");
      }
      event.error = std::move(error);
      break;
    }
    case EventKind::RawResponse:
    case EventKind::Lifecycle:
    case EventKind::AgentUpdate:
    case EventKind::Usage:
    case EventKind::Unknown:
      break;
  }
}

ProtocolEvent decode_with_fallback_name(const json& payload, const std::optional<std::string>& frame_event) {
  if (!payload.is_object()) {
    return make_error_event("event payload is not a JSON object", payload.dump());
  }

  ProtocolEvent event;
  event.raw = payload;
  if (auto kind = optional_string(payload, "kind")) {
    event.kind_name = *kind;
  } else if (frame_event && !frame_event->empty()) {
    event.kind_name = *frame_event;
  } else {
    return make_error_event("event missing kind", payload.dump());
  }
  event.kind = kind_from_name(event.kind_name);

  try {
    event.server_timestamp = optional_string(payload, "server_timestamp");
    event.item_id = optional_string(payload, "item_id");
    event.output_index = optional_int(payload, "output_index");
    event.tool_call_id = optional_string(payload, "tool_call_id");
    event.scope = parse_scope(payload);
    decode_body(event, payload);
  } catch (const DecodeFailure& failure) {
    return make_error_event(failure.reason(), payload.dump());
  } catch (const json::exception& ex) {
    return make_error_event(event.kind_name + " event has malformed fields: " + ex.what(), payload.dump());
  }
  return event;
}

}  // namespace

const char* to_string(EventKind kind) {
  switch (kind) {
    case EventKind::ToolStatus: return "tool.status";
    case EventKind::ToolArgumentsDelta: return "tool.arguments.delta";
    case EventKind::ToolArgumentsDone: return "tool.arguments.done";
    case EventKind::ToolCodeDelta: return "tool.code.delta";
    case EventKind::ToolCodeDone: return "tool.code.done";
    case EventKind::ToolOutput: return "tool.output";
    case EventKind::ToolApproval: return "tool.approval";
    case EventKind::ChunkDelta: return "chunk.delta";
    case EventKind::ChunkDone: return "chunk.done";
    case EventKind::OutputItemAdded: return "output_item.added";
    case EventKind::OutputItemDone: return "output_item.done";
    case EventKind::MessageDelta: return "message.delta";
    case EventKind::MessageCitation: return "message.citation";
    case EventKind::RefusalDelta: return "refusal.delta";
    case EventKind::RefusalDone: return "refusal.done";
    case EventKind::RawResponse: return "raw_response";
    case EventKind::Lifecycle: return "lifecycle";
    case EventKind::AgentUpdate: return "agent_update";
    case EventKind::Usage: return "usage";
    case EventKind::Error: return "error";
    case EventKind::Unknown: return "unknown";
  }
  return "unknown";
}

bool is_passthrough(EventKind kind) {
  switch (kind) {
    case EventKind::OutputItemDone:
    case EventKind::RawResponse:
    case EventKind::Lifecycle:
    case EventKind::AgentUpdate:
    case EventKind::Usage:
    case EventKind::Error:
      return true;
    default:
      return false;
  }
}

ProtocolEvent make_error_event(std::string message, std::optional<std::string> raw_text) {
  ProtocolEvent event;
  event.kind = EventKind::Error;
  event.kind_name = "error";
  ErrorDetails error;
  error.message = std::move(message);
  error.code = "decode_error";
  error.raw_text = std::move(raw_text);
  event.error = std::move(error);
  return event;
}

ProtocolEvent decode_protocol_event(const nlohmann::json& payload) {
  return decode_with_fallback_name(payload, std::nullopt);
}

ProtocolEvent decode_protocol_event(const SseFrame& frame) {
  json payload;
  try {
    payload = json::parse(frame.data);
  } catch (const json::exception& ex) {
    auto event = make_error_event(std::string("invalid JSON in frame data: ") + ex.what(), frame.data);
    event.event_id = frame.id;
    return event;
  }
  auto event = decode_with_fallback_name(payload, frame.event);
  event.event_id = frame.id;
  return event;
}

}  // namespace agentstream
