#include "session/conversation.hpp"

#include <cstddef>
#include <iterator>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::session {

namespace {

bool is_plain_user_message(const protocol::Message& message) {
    return message.role == protocol::Role::User && !protocol::has_tool_result(message);
}

}  // namespace

void ConversationHistory::append(protocol::Message message) {
    messages_.push_back(std::move(message));
}

std::size_t ConversationHistory::trim(const std::size_t cap) {
    const std::size_t before = messages_.size();
    messages_ = trim_history(std::move(messages_), cap);
    const std::size_t removed = before - messages_.size();
    if (removed > 0) {
        WARDEN_LOG_DEBUG("Trimmed " + std::to_string(removed) + " messages from history");
    }
    return removed;
}

std::vector<protocol::Message> trim_history(std::vector<protocol::Message> messages,
                                            const std::size_t cap) {
    const std::size_t count = messages.size();
    if (count <= cap) {
        return messages;
    }

    std::size_t leading_system = 0;
    while (leading_system < count &&
           messages[leading_system].role == protocol::Role::System) {
        ++leading_system;
    }
    if (leading_system == count) {
        return messages;
    }

    const std::size_t keep_recent = cap > leading_system ? cap - leading_system : 1;
    std::size_t cut = count - keep_recent;
    if (cut < leading_system) {
        cut = leading_system;
    }
    while (cut < count && !is_plain_user_message(messages[cut])) {
        ++cut;
    }
    if (cut == count) {
        // Mid tool chain: no cut point keeps every tool_use with its result.
        return messages;
    }

    std::vector<protocol::Message> trimmed;
    trimmed.reserve(leading_system + (count - cut));
    std::move(messages.begin(),
              messages.begin() + static_cast<std::ptrdiff_t>(leading_system),
              std::back_inserter(trimmed));
    std::move(messages.begin() + static_cast<std::ptrdiff_t>(cut), messages.end(),
              std::back_inserter(trimmed));
    return trimmed;
}

}  // namespace warden::session
