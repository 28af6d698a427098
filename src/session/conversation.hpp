#pragma once

#include <cstddef>
#include <vector>
#include "protocol/message_contract.hpp"

namespace warden::session {

inline constexpr std::size_t kMaxHistoryMessages = 50;

// Append-only apart from trim(). Owned by one orchestrator for one run.
class ConversationHistory {
public:
    void append(protocol::Message message);

    // Returns the number of messages removed.
    std::size_t trim(std::size_t cap = kMaxHistoryMessages);

    const std::vector<protocol::Message>& messages() const { return messages_; }
    std::size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

private:
    std::vector<protocol::Message> messages_;
};

// Drops messages from the middle: leading system messages and the most
// recent ones survive. The first kept non-system message is always a plain
// user message so no tool_result is separated from its tool_use. A history
// of at most `cap` messages, or one with no such cut point, is returned
// unchanged.
std::vector<protocol::Message> trim_history(std::vector<protocol::Message> messages,
                                            std::size_t cap = kMaxHistoryMessages);

}  // namespace warden::session
