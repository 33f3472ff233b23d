#include "agentstream/tool_state.hpp"

namespace agentstream {

const char* to_string(ToolStatus status) {
  switch (status) {
    case ToolStatus::InputStreaming: return "input-streaming";
    case ToolStatus::InputAvailable: return "input-available";
    case ToolStatus::OutputAvailable: return "output-available";
    case ToolStatus::OutputError: return "output-error";
  }
  return "input-streaming";
}

std::optional<ToolStatus> parse_tool_status(const std::string& value) {
  if (value == "input-streaming") return ToolStatus::InputStreaming;
  if (value == "input-available") return ToolStatus::InputAvailable;
  if (value == "output-available") return ToolStatus::OutputAvailable;
  if (value == "output-error") return ToolStatus::OutputError;
  return std::nullopt;
}

ToolStatus status_from_provider(const std::string& provider_status) {
  if (provider_status == "completed") return ToolStatus::OutputAvailable;
  if (provider_status == "failed") return ToolStatus::OutputError;
  return ToolStatus::InputAvailable;
}

ToolState apply_patch(ToolState state, const ToolStatePatch& patch) {
  if (patch.name) state.name = patch.name;
  if (patch.output_index) state.output_index = patch.output_index;
  if (patch.input) state.input = patch.input;
  if (patch.output) state.output = patch.output;
  if (patch.error_text) state.error_text = patch.error_text;
  if (patch.status) state.status = upgrade_status(state.status, *patch.status);
  return state;
}

ToolState merge_tool_states(const ToolState& from, ToolState into) {
  if (!into.name) into.name = from.name;
  if (!into.output_index) into.output_index = from.output_index;
  if (!into.input) into.input = from.input;
  if (!into.output) into.output = from.output;
  if (!into.error_text) into.error_text = from.error_text;
  into.status = upgrade_status(into.status, from.status);
  return into;
}

void to_json(nlohmann::json& j, const ToolState& state) {
  j = nlohmann::json::object();
  j["id"] = state.id;
  j["status"] = to_string(state.status);
  j["name"] = state.name ? nlohmann::json(*state.name) : nlohmann::json(nullptr);
  j["outputIndex"] = state.output_index ? nlohmann::json(*state.output_index) : nlohmann::json(nullptr);
  if (state.input) j["input"] = *state.input;
  if (state.output) j["output"] = *state.output;
  j["errorText"] = state.error_text ? nlohmann::json(*state.error_text) : nlohmann::json(nullptr);
}

}  // namespace agentstream
