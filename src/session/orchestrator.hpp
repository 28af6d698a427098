#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "provider/api_client.hpp"
#include "session/conversation.hpp"
#include "tools/tool_host.hpp"

namespace warden::session {

enum class OrchestratorState {
    AwaitingInput,
    AwaitingModelResponse,
    DispatchingTools,
    Idle,
    Terminated
};

std::string to_string(OrchestratorState state);

struct OrchestratorConfig {
    std::uint32_t max_turns = 10;
    std::chrono::milliseconds turn_timeout{120000};
    std::size_t max_tool_calls_per_turn = 100;
    std::size_t history_cap = kMaxHistoryMessages;
    std::string model;
    std::string correlation_id;
};

struct TurnRecord {
    std::uint32_t turn = 0;
    bool success = false;
    std::string error_message;
    std::size_t tool_calls = 0;
};

// Returns nullopt at end of input.
using InputProvider = std::function<std::optional<std::string>()>;

// Receives assistant text and one line per tool call, in arrival order.
struct OutputSink {
    std::function<void(const std::string& text)> on_text;
    std::function<void(const std::string& tool_name)> on_tool;
};

using TurnObserver = std::function<void(const TurnRecord& record)>;

class Orchestrator {
public:
    Orchestrator(std::shared_ptr<provider::ModelClient> client,
                 std::shared_ptr<tools::ToolHost> tool_host, OrchestratorConfig config,
                 OutputSink sink = {});

    // One turn, then Terminated.
    core::errors::Status run_one_shot(const std::string& prompt);

    // Reads prompts until end of input or max_turns. Empty lines are skipped.
    // A failure on the first turn ends the run; later failures are reported
    // and the loop continues.
    core::errors::Status run_interactive(const InputProvider& input);

    // Appends the user message and drives the model/tool cycle until no tool
    // calls are pending.
    core::errors::Status run_turn(const std::string& user_input);

    void set_turn_observer(TurnObserver observer) { observer_ = std::move(observer); }

    OrchestratorState state() const { return state_; }
    const ConversationHistory& history() const { return history_; }
    std::uint32_t turns_completed() const { return turns_completed_; }

    // {metadata:{created_at, version, model, correlation_id}, messages:[...]}
    nlohmann::json transcript() const;

private:
    // A tool_use plus the assistant blocks that arrived with it. The segment
    // is appended to history right before the tool runs.
    struct PendingTool {
        protocol::ToolTask task;
        std::vector<protocol::ContentBlock> segment;
    };

    using Deadline = std::chrono::steady_clock::time_point;

    core::errors::Result<protocol::ModelResponse> call_model(
        Deadline deadline, const std::shared_ptr<std::atomic_bool>& cancel_token);
    void schedule(const protocol::ModelResponse& response, std::vector<PendingTool>& stack);
    core::errors::Status dispatch(PendingTool work, Deadline deadline,
                                  const std::shared_ptr<std::atomic_bool>& cancel_token);
    core::errors::Status finish_turn(core::errors::Status outcome, std::size_t tool_calls);
    void transition(OrchestratorState next);

    std::shared_ptr<provider::ModelClient> client_;
    std::shared_ptr<tools::ToolHost> tool_host_;
    OrchestratorConfig config_;
    OutputSink sink_;
    TurnObserver observer_;
    ConversationHistory history_;
    OrchestratorState state_ = OrchestratorState::AwaitingInput;
    std::uint32_t turns_completed_ = 0;
    std::string created_at_;
};

}  // namespace warden::session
