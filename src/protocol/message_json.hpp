#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"

namespace warden::protocol {

nlohmann::json block_to_json(const ContentBlock& block);

// {"role": ..., "content": [blocks]}. System messages keep role "system";
// the wire codec folds them into the request's top-level "system" field.
nlohmann::json message_to_json(const Message& message);

nlohmann::json messages_to_json(const std::vector<Message>& messages);

// Inverse of message_to_json; used when reloading saved transcripts.
core::errors::Result<Message> message_from_json(const nlohmann::json& value);

// Decodes one content block from a model response. Unknown block types
// yield an empty optional.
core::errors::Result<std::optional<ContentBlock>> block_from_json(
    const nlohmann::json& value);

}  // namespace warden::protocol
