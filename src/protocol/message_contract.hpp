#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden::protocol {

    enum class Role {
        User,
        Assistant,
        System
    };

    struct TextBlock {
        std::string text;
    };

    // The model asks for a local operation.
    struct ToolUseBlock {
        std::string id;
        std::string name;
        nlohmann::json input;
    };

    // Our answer to a ToolUseBlock with the same id.
    struct ToolResultBlock {
        std::string tool_use_id;
        std::string content;
        bool is_error = false;
    };

    using ContentBlock = std::variant<TextBlock, ToolUseBlock, ToolResultBlock>;

    struct Message {
        Role role;
        std::vector<ContentBlock> content;
    };

    // One whole reply from the model endpoint.
    struct ModelResponse {
        std::string id;
        std::vector<ContentBlock> content;
        std::optional<std::string> stop_reason;
    };

    inline Message make_text_message(Role role, std::string text) {
        return Message{role, {TextBlock{std::move(text)}}};
    }

    inline Message make_tool_result_message(ToolResultBlock result) {
        return Message{Role::User, {std::move(result)}};
    }

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User:      return "user";
            case Role::Assistant: return "assistant";
            case Role::System:    return "system";
            default: return "unknown";
        }
    }

    inline bool has_tool_result(const Message& message) {
        for (const auto& block : message.content) {
            if (std::holds_alternative<ToolResultBlock>(block)) {
                return true;
            }
        }
        return false;
    }

} // namespace warden::protocol
