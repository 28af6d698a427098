#include "session/orchestrator.hpp"

#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/message_json.hpp"

namespace warden::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr const char* kTranscriptVersion = "0.1.0";

std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    std::ostringstream out;
    out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

AgentError turn_timeout(const std::chrono::milliseconds timeout) {
    return AgentError{ErrorCategory::Execution,
                      "Turn timed out after " + std::to_string(timeout.count()) + " ms",
                      "turn_timeout"};
}

// These abort the turn after their tool_result has been recorded.
bool aborts_turn(const AgentError& error) {
    return error.code == "unknown_tool" || error.code == "invalid_utf8";
}

}  // namespace

std::string to_string(const OrchestratorState state) {
    switch (state) {
        case OrchestratorState::AwaitingInput:         return "awaiting_input";
        case OrchestratorState::AwaitingModelResponse: return "awaiting_model_response";
        case OrchestratorState::DispatchingTools:      return "dispatching_tools";
        case OrchestratorState::Idle:                  return "idle";
        case OrchestratorState::Terminated:            return "terminated";
        default: return "unknown";
    }
}

Orchestrator::Orchestrator(std::shared_ptr<provider::ModelClient> client,
                           std::shared_ptr<tools::ToolHost> tool_host,
                           OrchestratorConfig config, OutputSink sink)
    : client_(std::move(client)),
      tool_host_(std::move(tool_host)),
      config_(std::move(config)),
      sink_(std::move(sink)),
      created_at_(utc_timestamp()) {}

void Orchestrator::transition(const OrchestratorState next) {
    if (state_ == next) {
        return;
    }
    WARDEN_LOG_DEBUG("State: " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

core::errors::Status Orchestrator::run_one_shot(const std::string& prompt) {
    auto outcome = run_turn(prompt);
    transition(OrchestratorState::Terminated);
    return outcome;
}

core::errors::Status Orchestrator::run_interactive(const InputProvider& input) {
    while (turns_completed_ < config_.max_turns) {
        transition(OrchestratorState::AwaitingInput);
        const auto line = input();
        if (!line.has_value()) {
            break;
        }
        if (line->empty()) {
            continue;
        }
        if (*line == "exit" || *line == "quit") {
            break;
        }

        auto outcome = run_turn(*line);
        if (outcome.has_value()) {
            if (turns_completed_ == 1) {
                transition(OrchestratorState::Terminated);
                return outcome;
            }
            WARDEN_LOG_ERROR("Turn " + std::to_string(turns_completed_) + " failed: " +
                             core::errors::describe(*outcome));
        }
    }

    if (turns_completed_ >= config_.max_turns) {
        WARDEN_LOG_INFO("Maximum turns reached (" + std::to_string(config_.max_turns) + ")");
    }
    transition(OrchestratorState::Terminated);
    return std::nullopt;
}

core::errors::Result<protocol::ModelResponse> Orchestrator::call_model(
    const Deadline deadline, const std::shared_ptr<std::atomic_bool>& cancel_token) {
    transition(OrchestratorState::AwaitingModelResponse);
    history_.trim(config_.history_cap);

    if (std::chrono::steady_clock::now() >= deadline) {
        return turn_timeout(config_.turn_timeout);
    }

    auto client = client_;
    auto messages = history_.messages();
    auto pending = std::async(std::launch::async, [client, messages, cancel_token]() {
        return client->send(messages, true, cancel_token);
    });

    if (pending.wait_until(deadline) == std::future_status::timeout) {
        cancel_token->store(true);
        // The client observes the token; wait for it to unwind.
        pending.wait();
        return turn_timeout(config_.turn_timeout);
    }
    return pending.get();
}

void Orchestrator::schedule(const protocol::ModelResponse& response,
                            std::vector<PendingTool>& stack) {
    std::vector<PendingTool> found;
    std::vector<protocol::ContentBlock> segment;

    for (const auto& block : response.content) {
        if (const auto* text = std::get_if<protocol::TextBlock>(&block)) {
            if (sink_.on_text) {
                sink_.on_text(text->text);
            }
            segment.push_back(block);
            continue;
        }
        if (const auto* tool_use = std::get_if<protocol::ToolUseBlock>(&block)) {
            segment.push_back(block);
            found.push_back(PendingTool{
                protocol::ToolTask{tool_use->id, tool_use->name, tool_use->input},
                std::move(segment)});
            segment.clear();
        }
    }

    if (found.empty()) {
        if (!segment.empty()) {
            history_.append(protocol::Message{protocol::Role::Assistant, std::move(segment)});
        }
        return;
    }

    // Trailing text rides with the last tool call.
    for (auto& block : segment) {
        found.back().segment.push_back(std::move(block));
    }

    // Reverse push: siblings pop in arrival order, and anything a tool's
    // follow-up response adds lands on top of the remaining siblings.
    for (auto it = found.rbegin(); it != found.rend(); ++it) {
        stack.push_back(std::move(*it));
    }
}

core::errors::Status Orchestrator::dispatch(
    PendingTool work, const Deadline deadline,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    transition(OrchestratorState::DispatchingTools);
    history_.append(protocol::Message{protocol::Role::Assistant, std::move(work.segment)});

    if (sink_.on_tool) {
        sink_.on_tool(work.task.tool_name);
    }

    tools::ExecutionContext context;
    context.deadline = deadline;
    context.cancel_token = cancel_token;
    auto result = tool_host_->execute(work.task.tool_name, work.task.tool_input, context);

    protocol::ToolResultBlock block;
    block.tool_use_id = work.task.tool_use_id;
    core::errors::Status failure;
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        WARDEN_LOG_WARN("Tool " + work.task.tool_name + " failed: " +
                        core::errors::describe(error));
        block.content = "Error: " + error.message;
        block.is_error = true;
        if (aborts_turn(error)) {
            failure = error;
        }
    } else {
        block.content = core::errors::get_value(result);
    }
    history_.append(protocol::make_tool_result_message(std::move(block)));
    return failure;
}

core::errors::Status Orchestrator::run_turn(const std::string& user_input) {
    const Deadline deadline = std::chrono::steady_clock::now() + config_.turn_timeout;
    auto cancel_token = std::make_shared<std::atomic_bool>(false);

    history_.append(protocol::make_text_message(protocol::Role::User, user_input));

    auto response = call_model(deadline, cancel_token);
    if (core::errors::is_error(response)) {
        return finish_turn(core::errors::get_error(response), 0);
    }

    std::vector<PendingTool> stack;
    schedule(core::errors::get_value(response), stack);

    std::size_t tool_calls = 0;
    while (!stack.empty()) {
        if (tool_calls >= config_.max_tool_calls_per_turn) {
            return finish_turn(
                AgentError{ErrorCategory::Execution,
                           "Tool call limit reached (" +
                               std::to_string(config_.max_tool_calls_per_turn) +
                               " calls in one turn)",
                           "tool_chain_limit"},
                tool_calls);
        }

        PendingTool work = std::move(stack.back());
        stack.pop_back();
        ++tool_calls;

        auto failure = dispatch(std::move(work), deadline, cancel_token);
        if (failure.has_value()) {
            return finish_turn(failure, tool_calls);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return finish_turn(turn_timeout(config_.turn_timeout), tool_calls);
        }

        auto follow_up = call_model(deadline, cancel_token);
        if (core::errors::is_error(follow_up)) {
            return finish_turn(core::errors::get_error(follow_up), tool_calls);
        }
        schedule(core::errors::get_value(follow_up), stack);
    }

    return finish_turn(std::nullopt, tool_calls);
}

core::errors::Status Orchestrator::finish_turn(core::errors::Status outcome,
                                               const std::size_t tool_calls) {
    history_.trim(config_.history_cap);
    ++turns_completed_;
    transition(OrchestratorState::Idle);

    TurnRecord record;
    record.turn = turns_completed_;
    record.success = !outcome.has_value();
    record.error_message = outcome.has_value() ? outcome->message : "";
    record.tool_calls = tool_calls;
    if (observer_) {
        observer_(record);
    }

    WARDEN_LOG_INFO("Turn " + std::to_string(turns_completed_) +
                    (record.success ? " completed" : " failed") + " with " +
                    std::to_string(tool_calls) + " tool calls");
    return outcome;
}

nlohmann::json Orchestrator::transcript() const {
    nlohmann::json metadata{{"created_at", created_at_},
                            {"version", kTranscriptVersion},
                            {"model", config_.model},
                            {"correlation_id", config_.correlation_id}};
    return nlohmann::json{{"metadata", std::move(metadata)},
                          {"messages", protocol::messages_to_json(history_.messages())}};
}

}  // namespace warden::session
