#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentstream/chunks.hpp"
#include "agentstream/events.hpp"
#include "agentstream/identity.hpp"
#include "agentstream/image_frames.hpp"
#include "agentstream/observer.hpp"
#include "agentstream/tool_state.hpp"

namespace agentstream {

struct OutputItemPlaceholder {
  std::string item_id;
  std::string item_type;
  std::optional<int> output_index;
};

std::optional<std::string> placeholder_name_for_item_type(const std::string& item_type);

class ToolAccumulator {
public:
  explicit ToolAccumulator(ToolStateObserver* observer = nullptr) : observer_(observer) {}

  void apply(const ProtocolEvent& event);
  void ensure_placeholder_for_output_item(const OutputItemPlaceholder& placeholder);

  [[nodiscard]] std::vector<ToolState> get_tools_sorted() const;
  [[nodiscard]] std::optional<ToolState> get_tool_by_id(const std::string& id) const;
  [[nodiscard]] std::optional<std::int64_t> get_first_seen_ms(const std::string& id) const;

  [[nodiscard]] std::size_t tool_count() const { return tools_.size(); }
  [[nodiscard]] std::size_t pending_chunks() const { return chunks_.pending_count(); }
  [[nodiscard]] bool has_pending_chunk(const ChunkTarget& target) const { return chunks_.has_pending(target); }
  [[nodiscard]] std::string canonical_id(const std::string& id) const { return ids_.canonicalize(id); }

  // Declares both ids the same tool call, folding any state already kept under the losing id.
  void bind_alias(const std::string& any_id, const std::string& canonical_id);

private:
  struct Entry {
    ToolState state;
    std::uint64_t sequence = 0;
  };

  bool merge_aliases(const std::string& any_id, const std::string& canonical_id);
  std::optional<std::string> resolve_event_tool(const ProtocolEvent& event);
  void upsert(const std::string& tool_id, const ToolStatePatch& patch);
  void refresh_image_frames(const std::string& tool_id);
  void note_first_seen(const std::string& tool_id, const std::optional<std::string>& timestamp);
  void emit();

  void apply_tool_status(const ProtocolEvent& event);
  void apply_arguments_delta(const ProtocolEvent& event);
  void apply_arguments_done(const ProtocolEvent& event);
  void apply_code_delta(const ProtocolEvent& event);
  void apply_code_done(const ProtocolEvent& event);
  void apply_tool_output(const ProtocolEvent& event);
  void apply_tool_approval(const ProtocolEvent& event);
  void apply_chunk_delta(const ProtocolEvent& event);
  void apply_chunk_done(const ProtocolEvent& event);

  ToolStateObserver* observer_;
  IdentityCanonicalizer ids_;
  std::unordered_map<std::string, Entry> tools_;
  std::uint64_t next_sequence_ = 0;

  std::unordered_map<std::string, std::string> arguments_text_;
  std::unordered_map<std::string, nlohmann::json> arguments_json_;
  std::unordered_map<std::string, std::string> code_;
  std::unordered_map<std::string, std::int64_t> first_seen_ms_;
  ImageFrameAssembler images_;
  ChunkReassembler chunks_;
};

}  // namespace agentstream
