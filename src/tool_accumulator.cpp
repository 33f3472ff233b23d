#include "agentstream/tool_accumulator.hpp"

#include <algorithm>
#include <utility>

#include "agentstream/utils/time.hpp"

namespace agentstream {
namespace {

using json = nlohmann::json;

constexpr const char* kImageGeneration = "image_generation";
constexpr const char* kPartialImageField = "partial_image_b64";
constexpr const char* kToolFailedText = "Tool failed";

template <typename Map>
void move_preferring_target(Map& map, const std::string& from_id, const std::string& to_id) {
  auto it = map.find(from_id);
  if (it == map.end()) {
    return;
  }
  auto value = std::move(it->second);
  map.erase(it);
  map.try_emplace(to_id, std::move(value));
}

json optional_to_json(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

json arguments_input(const std::string& tool_type,
                     const std::optional<std::string>& tool_name,
                     const std::optional<std::string>& server_label,
                     const std::optional<std::string>& arguments_text,
                     const std::optional<json>& arguments_json) {
  json input = json::object();
  input["tool_type"] = tool_type;
  input["tool_name"] = optional_to_json(tool_name);
  if (tool_type == "mcp") {
    input["server_label"] = optional_to_json(server_label);
  }
  if (arguments_text) input["arguments_text"] = *arguments_text;
  if (arguments_json) input["arguments_json"] = *arguments_json;
  return input;
}

std::optional<std::string> non_empty(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

}  // namespace

std::optional<std::string> placeholder_name_for_item_type(const std::string& item_type) {
  if (item_type == "web_search_call") return std::string("web_search");
  if (item_type == "file_search_call") return std::string("file_search");
  if (item_type == "code_interpreter_call") return std::string("code_interpreter");
  if (item_type == "image_generation_call") return std::string(kImageGeneration);
  if (item_type == "mcp_call") return std::string("mcp");
  if (item_type == "function_call" || item_type == "custom_tool_call") return std::string("function");
  return std::nullopt;
}

void ToolAccumulator::apply(const ProtocolEvent& event) {
  switch (event.kind) {
    case EventKind::OutputItemAdded:
      if (event.item_id && event.output_item) {
        ensure_placeholder_for_output_item(
            OutputItemPlaceholder{*event.item_id, event.output_item->item_type, event.output_index});
      }
      break;
    case EventKind::ToolStatus:
      if (event.tool) apply_tool_status(event);
      break;
    case EventKind::ToolArgumentsDelta:
      if (event.arguments_delta) apply_arguments_delta(event);
      break;
    case EventKind::ToolArgumentsDone:
      if (event.arguments_done) apply_arguments_done(event);
      break;
    case EventKind::ToolCodeDelta:
      if (event.code_delta) apply_code_delta(event);
      break;
    case EventKind::ToolCodeDone:
      if (event.code_done) apply_code_done(event);
      break;
    case EventKind::ToolOutput:
      if (event.tool_output) apply_tool_output(event);
      break;
    case EventKind::ToolApproval:
      if (event.approval) apply_tool_approval(event);
      break;
    case EventKind::ChunkDelta:
      if (event.chunk_delta) apply_chunk_delta(event);
      break;
    case EventKind::ChunkDone:
      if (event.chunk_done) apply_chunk_done(event);
      break;
    default:
      break;
  }
}

void ToolAccumulator::ensure_placeholder_for_output_item(const OutputItemPlaceholder& placeholder) {
  auto name = placeholder_name_for_item_type(placeholder.item_type);
  if (!name) {
    return;
  }

  const std::string tool_id = ids_.canonicalize(placeholder.item_id);
  auto it = tools_.find(tool_id);
  if (it == tools_.end()) {
    ToolStatePatch patch;
    patch.name = std::move(name);
    patch.status = ToolStatus::InputStreaming;
    patch.output_index = placeholder.output_index;
    upsert(tool_id, patch);
    return;
  }
  if (!it->second.state.output_index && placeholder.output_index) {
    ToolStatePatch patch;
    patch.output_index = placeholder.output_index;
    upsert(tool_id, patch);
  }
}

std::vector<ToolState> ToolAccumulator::get_tools_sorted() const {
  std::vector<const Entry*> entries;
  entries.reserve(tools_.size());
  for (const auto& [id, entry] : tools_) {
    entries.push_back(&entry);
  }
  std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
    const bool a_indexed = a->state.output_index.has_value();
    const bool b_indexed = b->state.output_index.has_value();
    if (a_indexed != b_indexed) {
      return a_indexed;
    }
    if (a_indexed && *a->state.output_index != *b->state.output_index) {
      return *a->state.output_index < *b->state.output_index;
    }
    return a->sequence < b->sequence;
  });

  std::vector<ToolState> sorted;
  sorted.reserve(entries.size());
  for (const auto* entry : entries) {
    sorted.push_back(entry->state);
  }
  return sorted;
}

std::optional<ToolState> ToolAccumulator::get_tool_by_id(const std::string& id) const {
  auto it = tools_.find(ids_.canonicalize(id));
  if (it == tools_.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

std::optional<std::int64_t> ToolAccumulator::get_first_seen_ms(const std::string& id) const {
  auto it = first_seen_ms_.find(ids_.canonicalize(id));
  if (it == first_seen_ms_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ToolAccumulator::bind_alias(const std::string& any_id, const std::string& canonical_id) {
  if (merge_aliases(any_id, canonical_id)) {
    emit();
  }
}

bool ToolAccumulator::merge_aliases(const std::string& any_id, const std::string& canonical_id) {
  auto binding = ids_.bind_alias(any_id, canonical_id);
  if (!binding.merged_id) {
    return false;
  }
  const std::string& from_id = *binding.merged_id;
  const std::string& to_id = binding.canonical_id;

  bool tools_changed = false;
  if (auto from = tools_.find(from_id); from != tools_.end()) {
    Entry moved = std::move(from->second);
    tools_.erase(from);
    auto to = tools_.find(to_id);
    if (to != tools_.end()) {
      to->second.state = merge_tool_states(moved.state, std::move(to->second.state));
      to->second.sequence = std::min(to->second.sequence, moved.sequence);
    } else {
      moved.state.id = to_id;
      tools_.emplace(to_id, std::move(moved));
    }
    tools_changed = true;
  }

  move_preferring_target(arguments_text_, from_id, to_id);
  move_preferring_target(arguments_json_, from_id, to_id);
  move_preferring_target(code_, from_id, to_id);
  images_.rebind(from_id, to_id);

  if (auto seen = first_seen_ms_.find(from_id); seen != first_seen_ms_.end()) {
    const std::int64_t from_ms = seen->second;
    first_seen_ms_.erase(seen);
    auto [target, inserted] = first_seen_ms_.try_emplace(to_id, from_ms);
    if (!inserted && from_ms < target->second) {
      target->second = from_ms;
    }
  }
  return tools_changed;
}

std::optional<std::string> ToolAccumulator::resolve_event_tool(const ProtocolEvent& event) {
  if (!event.tool_call_id && !event.item_id) {
    return std::nullopt;
  }
  const std::string& primary = event.tool_call_id ? *event.tool_call_id : *event.item_id;
  if (event.item_id && *event.item_id != primary) {
    merge_aliases(*event.item_id, primary);
  }
  ids_.bind_alias(primary, primary);
  return ids_.canonicalize(primary);
}

void ToolAccumulator::upsert(const std::string& tool_id, const ToolStatePatch& patch) {
  const std::string id = ids_.canonicalize(tool_id);
  auto it = tools_.find(id);
  if (it == tools_.end()) {
    Entry entry;
    entry.state.id = id;
    entry.sequence = next_sequence_++;
    it = tools_.emplace(id, std::move(entry)).first;
  }
  it->second.state = apply_patch(std::move(it->second.state), patch);
  it->second.state.id = id;
  emit();
}

void ToolAccumulator::refresh_image_frames(const std::string& tool_id) {
  const std::string id = ids_.canonicalize(tool_id);
  auto frames = images_.frames(id);
  if (frames.empty()) {
    return;
  }
  ToolStatePatch patch;
  patch.name = kImageGeneration;
  patch.output = json(frames);
  upsert(id, patch);
}

void ToolAccumulator::note_first_seen(const std::string& tool_id, const std::optional<std::string>& timestamp) {
  if (!timestamp) {
    return;
  }
  auto ms = utils::parse_timestamp_ms(*timestamp);
  if (!ms) {
    return;
  }
  auto [it, inserted] = first_seen_ms_.try_emplace(tool_id, *ms);
  if (!inserted && *ms < it->second) {
    it->second = *ms;
  }
}

void ToolAccumulator::emit() {
  if (observer_) {
    observer_->on_tool_states(get_tools_sorted());
  }
}

void ToolAccumulator::apply_tool_status(const ProtocolEvent& event) {
  const ToolStatusDetails& tool = *event.tool;
  const auto resolved = resolve_event_tool(event);
  if (!resolved) {
    return;
  }
  const std::string& tool_id = *resolved;
  note_first_seen(tool_id, event.server_timestamp);

  ToolStatePatch patch;
  patch.status = status_from_provider(tool.status);
  patch.output_index = event.output_index;
  if (tool.status == "failed") {
    patch.error_text = kToolFailedText;
  }

  if (tool.tool_type == "web_search") {
    patch.name = "web_search";
    patch.input = tool.query;
    patch.output = tool.sources;
    upsert(tool_id, patch);
    return;
  }

  if (tool.tool_type == "file_search") {
    patch.name = "file_search";
    patch.input = tool.queries;
    patch.output = tool.results;
    upsert(tool_id, patch);
    return;
  }

  if (tool.tool_type == "code_interpreter") {
    patch.name = "code_interpreter";
    if (auto code = code_.find(tool_id); code != code_.end()) {
      patch.input = json(code->second);
    }
    if (tool.container_id || tool.container_mode) {
      patch.output = json{{"container_id", optional_to_json(tool.container_id)},
                          {"container_mode", optional_to_json(tool.container_mode)}};
    }
    upsert(tool_id, patch);
    return;
  }

  if (tool.tool_type == kImageGeneration) {
    images_.set_meta(tool_id, ImageMeta{tool.format, tool.revised_prompt});
    patch.name = kImageGeneration;
    if (tool.revised_prompt) {
      patch.input = json(*tool.revised_prompt);
    }
    upsert(tool_id, patch);
    refresh_image_frames(tool_id);
    return;
  }

  // Function calls and everything else (MCP) carry arguments.
  const bool is_function = tool.tool_type == "function";
  const std::string tool_type = is_function ? "function" : "mcp";
  std::optional<std::string> tool_name = is_function ? (tool.name ? tool.name : tool.tool_name)
                                                     : (tool.tool_name ? tool.tool_name : tool.name);

  std::optional<std::string> arguments_text = tool.arguments_text;
  if (!arguments_text) {
    if (auto it = arguments_text_.find(tool_id); it != arguments_text_.end()) {
      arguments_text = it->second;
    }
  }
  std::optional<json> arguments_json = tool.arguments_json;
  if (!arguments_json) {
    if (auto it = arguments_json_.find(tool_id); it != arguments_json_.end()) {
      arguments_json = it->second;
    }
  }

  const bool includes_arguments = (arguments_text && !arguments_text->empty()) || arguments_json.has_value();
  patch.name = tool_name;
  if (includes_arguments) {
    patch.input = arguments_input(tool_type, tool_name, tool.server_label, arguments_text, arguments_json);
  }
  patch.output = tool.output;
  upsert(tool_id, patch);
}

void ToolAccumulator::apply_arguments_delta(const ProtocolEvent& event) {
  const auto& delta = *event.arguments_delta;
  const auto resolved = resolve_event_tool(event);
  if (!resolved) {
    return;
  }
  const std::string& tool_id = *resolved;
  note_first_seen(tool_id, event.server_timestamp);

  std::string& text = arguments_text_[tool_id];
  text += delta.delta;

  ToolStatePatch patch;
  patch.name = non_empty(delta.tool_name);
  patch.status = ToolStatus::InputStreaming;
  patch.output_index = event.output_index;
  patch.input = arguments_input(delta.tool_type, non_empty(delta.tool_name), std::nullopt, text, std::nullopt);
  upsert(tool_id, patch);
}

void ToolAccumulator::apply_arguments_done(const ProtocolEvent& event) {
  const auto& done = *event.arguments_done;
  const auto resolved = resolve_event_tool(event);
  if (!resolved) {
    return;
  }
  const std::string& tool_id = *resolved;
  note_first_seen(tool_id, event.server_timestamp);

  arguments_text_[tool_id] = done.arguments_text;
  if (done.arguments_json) {
    arguments_json_[tool_id] = *done.arguments_json;
  }

  ToolStatePatch patch;
  patch.name = non_empty(done.tool_name);
  patch.status = ToolStatus::InputAvailable;
  patch.output_index = event.output_index;
  patch.input = arguments_input(done.tool_type, non_empty(done.tool_name), std::nullopt, done.arguments_text,
                                done.arguments_json);
  upsert(tool_id, patch);
}

void ToolAccumulator::apply_code_delta(const ProtocolEvent& event) {
  const auto resolved = resolve_event_tool(event);
  if (!resolved) {
    return;
  }
  const std::string& tool_id = *resolved;
  note_first_seen(tool_id, event.server_timestamp);

  std::string& code = code_[tool_id];
  code += event.code_delta->delta;

  ToolStatePatch patch;
  patch.name = "code_interpreter";
  patch.status = ToolStatus::InputStreaming;
  patch.output_index = event.output_index;
  patch.input = json(code);
  upsert(tool_id, patch);
}

void ToolAccumulator::apply_code_done(const ProtocolEvent& event) {
  const auto resolved = resolve_event_tool(event);
  if (!resolved) {
    return;
  }
  const std::string& tool_id = *resolved;
  note_first_seen(tool_id, event.server_timestamp);

  code_[tool_id] = event.code_done->code;

  ToolStatePatch patch;
  patch.name = "code_interpreter";
  patch.status = ToolStatus::InputAvailable;
  patch.output_index = event.output_index;
  patch.input = json(event.code_done->code);
  upsert(tool_id, patch);
}

void ToolAccumulator::apply_tool_output(const ProtocolEvent& event) {
  const auto resolved = resolve_event_tool(event);
  if (!resolved) {
    return;
  }
  const std::string& tool_id = *resolved;
  note_first_seen(tool_id, event.server_timestamp);

  ToolStatePatch patch;
  patch.status = ToolStatus::OutputAvailable;
  patch.output_index = event.output_index;
  patch.output = event.tool_output->output;
  upsert(tool_id, patch);
}

void ToolAccumulator::apply_tool_approval(const ProtocolEvent& event) {
  const auto& approval = *event.approval;
  const auto resolved = resolve_event_tool(event);
  if (!resolved) {
    return;
  }
  const std::string& tool_id = *resolved;
  note_first_seen(tool_id, event.server_timestamp);

  ToolStatePatch patch;
  patch.name = non_empty(approval.tool_name);
  patch.status = ToolStatus::OutputAvailable;
  patch.output_index = event.output_index;
  patch.output = json{{"tool_type", approval.tool_type},
                      {"tool_name", approval.tool_name},
                      {"server_label", optional_to_json(approval.server_label)},
                      {"approved", approval.approved},
                      {"reason", optional_to_json(approval.reason)},
                      {"approval_request_id", optional_to_json(approval.approval_request_id)}};
  upsert(tool_id, patch);
}

void ToolAccumulator::apply_chunk_delta(const ProtocolEvent& event) {
  const auto& delta = *event.chunk_delta;
  chunks_.apply_delta(delta.target, delta.encoding, delta.chunk_index, delta.data);
}

void ToolAccumulator::apply_chunk_done(const ProtocolEvent& event) {
  const ChunkTarget& target = event.chunk_done->target;
  auto chunk = chunks_.take_chunk(target);
  if (!chunk) {
    return;
  }

  if (target.entity_kind != "tool_call" || target.field != kPartialImageField || !target.part_index) {
    return;
  }

  const std::string tool_id = ids_.canonicalize(target.entity_id);
  note_first_seen(tool_id, event.server_timestamp);
  images_.store_part(tool_id, *target.part_index, *chunk);
  refresh_image_frames(tool_id);
}

}  // namespace agentstream
