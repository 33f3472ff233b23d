#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentstream/events.hpp"

namespace agentstream {

class ToolStateObserver;

struct AgentToolStreamItem {
  std::string item_id;
  int output_index = 0;
  std::string text;
  bool done = false;
};

struct AgentToolStream {
  std::string tool_call_id;
  std::optional<std::string> tool_name;
  std::optional<std::string> agent;
  std::string text;
  std::vector<AgentToolStreamItem> items;
  bool streaming = false;
  // Only set when the stream has exactly one item.
  std::optional<nlohmann::json> citations;
  std::optional<std::string> last_updated_at;
};

void to_json(nlohmann::json& j, const AgentToolStream& stream);

// Text produced by nested agents that run as tools, keyed by the outer tool call.
class AgentToolStreamAccumulator {
public:
  explicit AgentToolStreamAccumulator(ToolStateObserver* observer = nullptr) : observer_(observer) {}

  void apply(const ProtocolEvent& event);

  [[nodiscard]] std::vector<AgentToolStream> get_streams() const;
  [[nodiscard]] std::optional<AgentToolStream> get_stream(const std::string& tool_call_id) const;
  [[nodiscard]] std::size_t stream_count() const { return streams_.size(); }

private:
  struct ItemOrder {
    std::string item_id;
    int output_index = 0;
  };

  using TextParts = std::map<int, std::string>;

  struct State {
    std::string tool_call_id;
    std::optional<std::string> tool_name;
    std::optional<std::string> agent;
    std::vector<ItemOrder> order;
    std::unordered_map<std::string, bool> done;
    std::unordered_map<std::string, TextParts> message_text;
    std::unordered_map<std::string, TextParts> refusal_text;
    std::unordered_map<std::string, std::vector<nlohmann::json>> citations;
    std::optional<std::string> last_updated_at;
  };

  State& state_for(const EventScope& scope, const std::optional<std::string>& timestamp);
  static void ensure_item(State& state, const std::string& item_id, int output_index);
  static std::optional<AgentToolStream> build(const State& state);
  void emit();

  ToolStateObserver* observer_;
  std::vector<State> streams_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace agentstream
