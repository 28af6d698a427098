#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "protocol/message_contract.hpp"
#include "provider/api_error.hpp"

namespace warden::provider {

inline constexpr const char* kAnthropicVersion = "2023-06-01";
inline constexpr const char* kMessagesPath = "/v1/messages";

struct RequestOptions {
    std::string model = "claude-3-haiku-20240307";
    std::uint32_t max_tokens = 8192;
};

// "<base>/v1/messages", unless the base already names the endpoint.
std::string messages_url(const std::string& api_base_url);

// System messages become the top-level "system" string. Invalid
// UTF-8 anywhere in the history is replaced with U+FFFD.
std::string encode_request(const std::vector<protocol::Message>& history,
                           const RequestOptions& options, bool tools_enabled);

// Unknown block types are skipped. Anything else malformed is a ParseError.
ApiResult<protocol::ModelResponse> decode_response(const std::string& body);

}  // namespace warden::provider
