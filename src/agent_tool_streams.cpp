#include "agentstream/agent_tool_streams.hpp"

#include <algorithm>
#include <utility>

#include "agentstream/observer.hpp"

namespace agentstream {
namespace {

using json = nlohmann::json;

std::string assembled(const std::unordered_map<std::string, std::map<int, std::string>>& parts,
                      const std::string& item_id) {
  auto it = parts.find(item_id);
  if (it == parts.end()) {
    return {};
  }
  std::string text;
  for (const auto& [index, part] : it->second) {
    text += part;
  }
  return text;
}

json optional_to_json(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

}  // namespace

void to_json(json& j, const AgentToolStream& stream) {
  json items = json::array();
  for (const auto& item : stream.items) {
    items.push_back(json{{"item_id", item.item_id},
                         {"output_index", item.output_index},
                         {"text", item.text},
                         {"done", item.done}});
  }
  j = json{{"tool_call_id", stream.tool_call_id},
           {"tool_name", optional_to_json(stream.tool_name)},
           {"agent", optional_to_json(stream.agent)},
           {"text", stream.text},
           {"items", std::move(items)},
           {"streaming", stream.streaming},
           {"citations", stream.citations ? *stream.citations : json(nullptr)},
           {"last_updated_at", optional_to_json(stream.last_updated_at)}};
}

void AgentToolStreamAccumulator::apply(const ProtocolEvent& event) {
  if (!event.scope || !event.scope->is_agent_tool() || !event.scope->tool_call_id) {
    return;
  }
  State& state = state_for(*event.scope, event.server_timestamp);
  const int output_index = event.output_index.value_or(0);

  switch (event.kind) {
    case EventKind::OutputItemAdded:
    case EventKind::OutputItemDone:
      if (!event.item_id) return;
      ensure_item(state, *event.item_id, output_index);
      if (event.kind == EventKind::OutputItemDone) {
        state.done[*event.item_id] = true;
      }
      break;
    case EventKind::MessageDelta:
      if (!event.item_id || !event.text_delta) return;
      ensure_item(state, *event.item_id, output_index);
      state.message_text[*event.item_id][event.text_delta->content_index] += event.text_delta->delta;
      break;
    case EventKind::MessageCitation:
      if (!event.item_id || !event.citation) return;
      state.citations[*event.item_id].push_back(event.citation->citation);
      break;
    case EventKind::RefusalDelta:
      if (!event.item_id || !event.text_delta) return;
      ensure_item(state, *event.item_id, output_index);
      state.refusal_text[*event.item_id][event.text_delta->content_index] += event.text_delta->delta;
      break;
    case EventKind::RefusalDone:
      if (!event.item_id || !event.text_done) return;
      ensure_item(state, *event.item_id, output_index);
      state.refusal_text[*event.item_id][event.text_done->content_index] = event.text_done->text;
      state.done[*event.item_id] = true;
      break;
    default:
      return;
  }
  emit();
}

std::vector<AgentToolStream> AgentToolStreamAccumulator::get_streams() const {
  std::vector<AgentToolStream> out;
  for (const auto& state : streams_) {
    if (auto stream = build(state)) {
      out.push_back(std::move(*stream));
    }
  }
  return out;
}

std::optional<AgentToolStream> AgentToolStreamAccumulator::get_stream(const std::string& tool_call_id) const {
  auto it = index_.find(tool_call_id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return build(streams_[it->second]);
}

AgentToolStreamAccumulator::State& AgentToolStreamAccumulator::state_for(const EventScope& scope,
                                                                         const std::optional<std::string>& timestamp) {
  const std::string& id = *scope.tool_call_id;
  auto it = index_.find(id);
  if (it == index_.end()) {
    State created;
    created.tool_call_id = id;
    created.tool_name = scope.tool_name;
    created.agent = scope.agent;
    created.last_updated_at = timestamp;
    index_.emplace(id, streams_.size());
    streams_.push_back(std::move(created));
    return streams_.back();
  }

  State& existing = streams_[it->second];
  if (scope.tool_name && !existing.tool_name) existing.tool_name = scope.tool_name;
  if (scope.agent && !existing.agent) existing.agent = scope.agent;
  if (timestamp) existing.last_updated_at = timestamp;
  return existing;
}

void AgentToolStreamAccumulator::ensure_item(State& state, const std::string& item_id, int output_index) {
  auto existing = std::find_if(state.order.begin(), state.order.end(),
                               [&](const ItemOrder& entry) { return entry.item_id == item_id; });
  if (existing != state.order.end()) {
    existing->output_index = output_index;
    return;
  }
  state.done.try_emplace(item_id, false);
  auto insert_at = std::find_if(state.order.begin(), state.order.end(),
                                [&](const ItemOrder& entry) { return entry.output_index > output_index; });
  state.order.insert(insert_at, ItemOrder{item_id, output_index});
}

std::optional<AgentToolStream> AgentToolStreamAccumulator::build(const State& state) {
  std::vector<ItemOrder> ordered = state.order;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const ItemOrder& a, const ItemOrder& b) { return a.output_index < b.output_index; });

  AgentToolStream stream;
  for (const auto& entry : ordered) {
    std::string text = assembled(state.refusal_text, entry.item_id);
    if (text.empty()) {
      text = assembled(state.message_text, entry.item_id);
    }
    if (text.empty()) {
      continue;
    }
    auto done = state.done.find(entry.item_id);
    stream.items.push_back(AgentToolStreamItem{
        entry.item_id, entry.output_index, std::move(text), done != state.done.end() && done->second});
  }
  if (stream.items.empty()) {
    return std::nullopt;
  }

  for (const auto& item : stream.items) {
    if (!stream.text.empty()) stream.text += "\n\n";
    stream.text += item.text;
    if (!item.done) stream.streaming = true;
  }
  if (stream.items.size() == 1) {
    auto citations = state.citations.find(stream.items.front().item_id);
    if (citations != state.citations.end() && !citations->second.empty()) {
      stream.citations = json(citations->second);
    }
  }

  stream.tool_call_id = state.tool_call_id;
  stream.tool_name = state.tool_name;
  stream.agent = state.agent;
  stream.last_updated_at = state.last_updated_at;
  return stream;
}

void AgentToolStreamAccumulator::emit() {
  if (observer_) {
    observer_->on_agent_tool_streams(get_streams());
  }
}

}  // namespace agentstream
