#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "agentstream/agent_tool_streams.hpp"
#include "agentstream/events.hpp"
#include "agentstream/tool_state.hpp"

namespace agentstream {

class ToolStateObserver {
public:
  virtual ~ToolStateObserver() = default;

  virtual void on_tool_states(std::vector<ToolState> states) = 0;

  virtual void on_agent_tool_streams(std::vector<AgentToolStream> /*streams*/) {}

  virtual void on_passthrough_event(const ProtocolEvent& /*event*/) {}
};

class CallbackObserver final : public ToolStateObserver {
public:
  using ToolStatesHandler = std::function<void(std::vector<ToolState>)>;
  using EventHandler = std::function<void(const ProtocolEvent&)>;
  using AgentToolStreamsHandler = std::function<void(std::vector<AgentToolStream>)>;

  explicit CallbackObserver(ToolStatesHandler on_states,
                            EventHandler on_event = nullptr,
                            AgentToolStreamsHandler on_agent_streams = nullptr)
      : on_states_(std::move(on_states)),
        on_event_(std::move(on_event)),
        on_agent_streams_(std::move(on_agent_streams)) {}

  void on_tool_states(std::vector<ToolState> states) override {
    if (on_states_) on_states_(std::move(states));
  }

  void on_agent_tool_streams(std::vector<AgentToolStream> streams) override {
    if (on_agent_streams_) on_agent_streams_(std::move(streams));
  }

  void on_passthrough_event(const ProtocolEvent& event) override {
    if (on_event_) on_event_(event);
  }

private:
  ToolStatesHandler on_states_;
  EventHandler on_event_;
  AgentToolStreamsHandler on_agent_streams_;
};

}  // namespace agentstream
