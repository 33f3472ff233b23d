#include <gtest/gtest.h>

#include "agentstream/tool_state.hpp"

using agentstream::ToolState;
using agentstream::ToolStatePatch;
using agentstream::ToolStatus;

TEST(ToolStateTest, UpgradeNeverMovesDown) {
  EXPECT_EQ(agentstream::upgrade_status(ToolStatus::InputStreaming, ToolStatus::InputAvailable),
            ToolStatus::InputAvailable);
  EXPECT_EQ(agentstream::upgrade_status(ToolStatus::OutputAvailable, ToolStatus::InputStreaming),
            ToolStatus::OutputAvailable);
  EXPECT_EQ(agentstream::upgrade_status(ToolStatus::OutputError, ToolStatus::OutputAvailable),
            ToolStatus::OutputError);
  EXPECT_EQ(agentstream::upgrade_status(ToolStatus::OutputAvailable, ToolStatus::OutputError),
            ToolStatus::OutputError);
  static_assert(agentstream::status_rank(ToolStatus::InputStreaming) < agentstream::status_rank(ToolStatus::OutputError));
}

TEST(ToolStateTest, StatusStringsRoundTrip) {
  for (auto status : {ToolStatus::InputStreaming, ToolStatus::InputAvailable, ToolStatus::OutputAvailable,
                      ToolStatus::OutputError}) {
    EXPECT_EQ(agentstream::parse_tool_status(agentstream::to_string(status)), status);
  }
  EXPECT_FALSE(agentstream::parse_tool_status("done").has_value());
}

TEST(ToolStateTest, ProviderStatusMapping) {
  EXPECT_EQ(agentstream::status_from_provider("completed"), ToolStatus::OutputAvailable);
  EXPECT_EQ(agentstream::status_from_provider("failed"), ToolStatus::OutputError);
  EXPECT_EQ(agentstream::status_from_provider("in_progress"), ToolStatus::InputAvailable);
  EXPECT_EQ(agentstream::status_from_provider("searching"), ToolStatus::InputAvailable);
  EXPECT_EQ(agentstream::status_from_provider(""), ToolStatus::InputAvailable);
}

TEST(ToolStateTest, PatchReplacesPresentFieldsOnly) {
  ToolState state;
  state.id = "t";
  state.name = "web_search";
  state.status = ToolStatus::OutputAvailable;
  state.input = nlohmann::json("query");

  ToolStatePatch patch;
  patch.status = ToolStatus::InputStreaming;
  patch.output = nlohmann::json::array();
  patch.output_index = 4;

  auto patched = agentstream::apply_patch(state, patch);
  EXPECT_EQ(patched.name, std::optional<std::string>("web_search"));
  EXPECT_EQ(patched.status, ToolStatus::OutputAvailable);
  EXPECT_EQ(patched.input, std::optional<nlohmann::json>("query"));
  EXPECT_EQ(patched.output_index, std::optional<int>(4));
  ASSERT_TRUE(patched.output.has_value());
  EXPECT_TRUE(patched.output->is_array());
}

TEST(ToolStateTest, MergeKeepsTargetValues) {
  ToolState from;
  from.id = "item_1";
  from.name = "function";
  from.output_index = 0;
  from.status = ToolStatus::OutputAvailable;

  ToolState into;
  into.id = "call_1";
  into.name = "get_weather";
  into.status = ToolStatus::InputStreaming;

  auto merged = agentstream::merge_tool_states(from, into);
  EXPECT_EQ(merged.id, "call_1");
  EXPECT_EQ(merged.name, std::optional<std::string>("get_weather"));
  EXPECT_EQ(merged.output_index, std::optional<int>(0));
  EXPECT_EQ(merged.status, ToolStatus::OutputAvailable);
}

TEST(ToolStateTest, JsonShape) {
  ToolState state;
  state.id = "call_1";
  state.status = ToolStatus::InputAvailable;

  nlohmann::json j = state;
  EXPECT_EQ(j["id"], "call_1");
  EXPECT_EQ(j["status"], "input-available");
  EXPECT_TRUE(j["name"].is_null());
  EXPECT_TRUE(j["outputIndex"].is_null());
  EXPECT_TRUE(j["errorText"].is_null());
  EXPECT_FALSE(j.contains("input"));
  EXPECT_FALSE(j.contains("output"));

  state.output = nlohmann::json{{"ok", true}};
  state.output_index = 2;
  j = state;
  EXPECT_EQ(j["outputIndex"], 2);
  EXPECT_EQ(j["output"]["ok"], true);
}
