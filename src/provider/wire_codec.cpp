#include "provider/wire_codec.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/message_json.hpp"
#include "protocol/tool_contract.hpp"

namespace warden::provider {

using nlohmann::json;

namespace {

ApiError parse_error(std::string cause) {
    return ApiError{ApiErrorKind::ParseError, std::move(cause)};
}

std::string join_system_text(const protocol::Message& message) {
    std::string text;
    for (const auto& block : message.content) {
        if (const auto* text_block = std::get_if<protocol::TextBlock>(&block)) {
            if (!text.empty()) {
                text += "\n";
            }
            text += text_block->text;
        }
    }
    return text;
}

}  // namespace

std::string messages_url(const std::string& api_base_url) {
    std::string base = api_base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    const std::string path = kMessagesPath;
    if (base.size() >= path.size() &&
        base.compare(base.size() - path.size(), path.size(), path) == 0) {
        return base;
    }
    return base + path;
}

std::string encode_request(const std::vector<protocol::Message>& history,
                           const RequestOptions& options, const bool tools_enabled) {
    json body;
    body["model"] = options.model;
    body["max_tokens"] = options.max_tokens;

    std::string system_text;
    json messages = json::array();
    for (const auto& message : history) {
        if (message.role == protocol::Role::System) {
            // Later system messages have no place in "messages" either.
            if (!system_text.empty()) {
                system_text += "\n\n";
            }
            system_text += join_system_text(message);
            continue;
        }
        messages.push_back(protocol::message_to_json(message));
    }

    body["messages"] = std::move(messages);
    if (!system_text.empty()) {
        body["system"] = system_text;
    }
    if (tools_enabled) {
        body["tools"] = protocol::tool_manifest();
    }
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

ApiResult<protocol::ModelResponse> decode_response(const std::string& body) {
    const json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return parse_error("response body is not valid JSON");
    }
    if (!parsed.is_object()) {
        return parse_error("response body is not a JSON object");
    }
    if (!parsed.contains("content") || !parsed["content"].is_array()) {
        return parse_error("response has no content array");
    }

    protocol::ModelResponse response;
    if (parsed.contains("id") && parsed["id"].is_string()) {
        response.id = parsed["id"].get<std::string>();
    }
    if (parsed.contains("stop_reason") && parsed["stop_reason"].is_string()) {
        response.stop_reason = parsed["stop_reason"].get<std::string>();
    }

    for (const auto& block_json : parsed["content"]) {
        auto decoded = protocol::block_from_json(block_json);
        if (core::errors::is_error(decoded)) {
            return parse_error(core::errors::get_error(decoded).message);
        }
        const auto& block = core::errors::get_value(decoded);
        if (!block.has_value()) {
            continue;
        }
        // The model never sends tool results.
        if (std::holds_alternative<protocol::ToolResultBlock>(*block)) {
            continue;
        }
        response.content.push_back(*block);
    }
    return response;
}

}  // namespace warden::provider
