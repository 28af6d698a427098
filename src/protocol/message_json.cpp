#include "protocol/message_json.hpp"

#include <string>
#include <utility>

namespace warden::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError decode_error(const std::string& message) {
    return AgentError{ErrorCategory::Execution, message, "message_decode_failed"};
}

}  // namespace

json block_to_json(const ContentBlock& block) {
    if (const auto* text = std::get_if<TextBlock>(&block)) {
        return json{{"type", "text"}, {"text", text->text}};
    }
    if (const auto* tool_use = std::get_if<ToolUseBlock>(&block)) {
        return json{{"type", "tool_use"},
                    {"id", tool_use->id},
                    {"name", tool_use->name},
                    {"input", tool_use->input.is_null() ? json::object() : tool_use->input}};
    }
    const auto& result = std::get<ToolResultBlock>(block);
    json payload{{"type", "tool_result"},
                 {"tool_use_id", result.tool_use_id},
                 {"content", result.content}};
    if (result.is_error) {
        payload["is_error"] = true;
    }
    return payload;
}

json message_to_json(const Message& message) {
    json content = json::array();
    for (const auto& block : message.content) {
        content.push_back(block_to_json(block));
    }
    return json{{"role", to_string(message.role)}, {"content", std::move(content)}};
}

json messages_to_json(const std::vector<Message>& messages) {
    json out = json::array();
    for (const auto& message : messages) {
        out.push_back(message_to_json(message));
    }
    return out;
}

core::errors::Result<std::optional<ContentBlock>> block_from_json(const json& value) {
    if (!value.is_object() || !value.contains("type") || !value["type"].is_string()) {
        return decode_error("Content block without a type discriminator");
    }

    const std::string type = value["type"].get<std::string>();
    if (type == "text") {
        if (!value.contains("text") || !value["text"].is_string()) {
            return decode_error("Text block without text");
        }
        return std::optional<ContentBlock>(TextBlock{value["text"].get<std::string>()});
    }
    if (type == "tool_use") {
        if (!value.contains("id") || !value["id"].is_string()) {
            return decode_error("tool_use block missing id");
        }
        if (!value.contains("name") || !value["name"].is_string()) {
            return decode_error("tool_use block missing name");
        }
        if (!value.contains("input")) {
            return decode_error("tool_use block missing input");
        }
        return std::optional<ContentBlock>(ToolUseBlock{value["id"].get<std::string>(),
                                                        value["name"].get<std::string>(),
                                                        value["input"]});
    }
    if (type == "tool_result") {
        if (!value.contains("tool_use_id") || !value["tool_use_id"].is_string()) {
            return decode_error("tool_result block missing tool_use_id");
        }
        ToolResultBlock result;
        result.tool_use_id = value["tool_use_id"].get<std::string>();
        if (value.contains("content") && value["content"].is_string()) {
            result.content = value["content"].get<std::string>();
        }
        result.is_error = value.value("is_error", false);
        return std::optional<ContentBlock>(std::move(result));
    }
    return std::optional<ContentBlock>();
}

core::errors::Result<Message> message_from_json(const json& value) {
    if (!value.is_object() || !value.contains("role") || !value["role"].is_string()) {
        return decode_error("Message without a role");
    }

    Message message{Role::User, {}};
    const std::string role = value["role"].get<std::string>();
    if (role == "user") {
        message.role = Role::User;
    } else if (role == "assistant") {
        message.role = Role::Assistant;
    } else if (role == "system") {
        message.role = Role::System;
    } else {
        return decode_error("Unknown message role: " + role);
    }

    if (!value.contains("content")) {
        return decode_error("Message without content");
    }
    const json& content = value["content"];
    if (content.is_string()) {
        message.content.emplace_back(TextBlock{content.get<std::string>()});
        return message;
    }
    if (!content.is_array()) {
        return decode_error("Message content must be a string or an array");
    }
    for (const auto& block_json : content) {
        auto decoded = block_from_json(block_json);
        if (core::errors::is_error(decoded)) {
            return core::errors::get_error(decoded);
        }
        const auto& block = core::errors::get_value(decoded);
        if (block.has_value()) {
            message.content.push_back(*block);
        }
    }
    return message;
}

}  // namespace warden::protocol
