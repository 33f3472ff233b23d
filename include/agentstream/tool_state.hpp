#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace agentstream {

enum class ToolStatus { InputStreaming, InputAvailable, OutputAvailable, OutputError };

constexpr int status_rank(ToolStatus status) {
  switch (status) {
    case ToolStatus::InputStreaming: return 0;
    case ToolStatus::InputAvailable: return 1;
    case ToolStatus::OutputAvailable: return 2;
    case ToolStatus::OutputError: return 3;
  }
  return 0;
}

constexpr ToolStatus upgrade_status(ToolStatus current, ToolStatus incoming) {
  return status_rank(incoming) > status_rank(current) ? incoming : current;
}

const char* to_string(ToolStatus status);

std::optional<ToolStatus> parse_tool_status(const std::string& value);

ToolStatus status_from_provider(const std::string& provider_status);

struct ToolState {
  std::string id;
  std::optional<std::string> name;
  std::optional<int> output_index;
  ToolStatus status = ToolStatus::InputStreaming;
  std::optional<nlohmann::json> input;
  std::optional<nlohmann::json> output;
  std::optional<std::string> error_text;
};

struct ToolStatePatch {
  std::optional<std::string> name;
  std::optional<int> output_index;
  std::optional<ToolStatus> status;
  std::optional<nlohmann::json> input;
  std::optional<nlohmann::json> output;
  std::optional<std::string> error_text;
};

// Patch values replace existing ones when present; status goes through upgrade_status.
ToolState apply_patch(ToolState state, const ToolStatePatch& patch);

// Folds `from` into `into`. Values already on `into` win.
ToolState merge_tool_states(const ToolState& from, ToolState into);

void to_json(nlohmann::json& j, const ToolState& state);

}  // namespace agentstream
