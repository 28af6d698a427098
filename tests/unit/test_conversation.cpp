#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "protocol/message_contract.hpp"
#include "session/conversation.hpp"

namespace {

using namespace warden::protocol;
using warden::session::ConversationHistory;
using warden::session::trim_history;

std::string text_of(const Message& message) {
    return std::get<TextBlock>(message.content.at(0)).text;
}

// user/assistant pairs: "u0", "a0", "u1", "a1", ...
std::vector<Message> exchanges(int pairs) {
    std::vector<Message> messages;
    for (int i = 0; i < pairs; ++i) {
        messages.push_back(make_text_message(Role::User, "u" + std::to_string(i)));
        messages.push_back(make_text_message(Role::Assistant, "a" + std::to_string(i)));
    }
    return messages;
}

TEST(ConversationTest, ShortHistoryIsUnchanged) {
    const auto messages = exchanges(25);
    const auto trimmed = trim_history(messages);
    ASSERT_EQ(trimmed.size(), 50u);
    EXPECT_EQ(text_of(trimmed.front()), "u0");
}

TEST(ConversationTest, KeepsMostRecentMessages) {
    const auto trimmed = trim_history(exchanges(30));
    ASSERT_EQ(trimmed.size(), 50u);
    EXPECT_EQ(text_of(trimmed.front()), "u5");
    EXPECT_EQ(text_of(trimmed.back()), "a29");
}

TEST(ConversationTest, PreservesLeadingSystemMessages) {
    std::vector<Message> messages = {make_text_message(Role::System, "rules")};
    for (auto& message : exchanges(30)) {
        messages.push_back(std::move(message));
    }
    const auto trimmed = trim_history(messages);

    ASSERT_LE(trimmed.size(), 50u);
    EXPECT_EQ(trimmed[0].role, Role::System);
    EXPECT_EQ(text_of(trimmed[0]), "rules");
    EXPECT_EQ(trimmed[1].role, Role::User);
    EXPECT_EQ(text_of(trimmed.back()), "a29");
}

TEST(ConversationTest, CutNeverSeparatesToolResultFromItsCall) {
    std::vector<Message> messages;
    for (int i = 0; i < 20; ++i) {
        const std::string id = "toolu_" + std::to_string(i);
        messages.push_back(make_text_message(Role::User, "u" + std::to_string(i)));
        messages.push_back(Message{Role::Assistant, {ToolUseBlock{id, "list_files", {}}}});
        messages.push_back(make_tool_result_message(ToolResultBlock{id, "none", false}));
    }
    const auto trimmed = trim_history(messages, 10);

    ASSERT_FALSE(trimmed.empty());
    EXPECT_LE(trimmed.size(), 10u);
    EXPECT_EQ(trimmed.front().role, Role::User);
    EXPECT_FALSE(has_tool_result(trimmed.front()));
    EXPECT_EQ(text_of(trimmed.front()), "u17");
}

TEST(ConversationTest, NoCutPointLeavesHistoryAlone) {
    std::vector<Message> messages = {make_text_message(Role::User, "start")};
    for (int i = 0; i < 30; ++i) {
        const std::string id = "toolu_" + std::to_string(i);
        messages.push_back(Message{Role::Assistant, {ToolUseBlock{id, "list_files", {}}}});
        messages.push_back(make_tool_result_message(ToolResultBlock{id, "none", false}));
    }
    EXPECT_EQ(trim_history(messages).size(), messages.size());

    std::vector<Message> only_system(60, make_text_message(Role::System, "s"));
    EXPECT_EQ(trim_history(only_system).size(), 60u);
}

TEST(ConversationTest, TrimIsIdempotent) {
    const auto once = trim_history(exchanges(40));
    const auto twice = trim_history(once);
    ASSERT_EQ(once.size(), twice.size());
    EXPECT_EQ(text_of(once.front()), text_of(twice.front()));
}

TEST(ConversationTest, HistoryTrimReportsRemovedCount) {
    ConversationHistory history;
    for (auto& message : exchanges(26)) {
        history.append(std::move(message));
    }
    EXPECT_EQ(history.size(), 52u);
    EXPECT_EQ(history.trim(), 2u);
    EXPECT_EQ(history.size(), 50u);
    EXPECT_EQ(history.trim(), 0u);
}

}  // namespace
