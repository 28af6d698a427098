#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "session/artifact_writer.hpp"
#include "session/orchestrator.hpp"
#include "temp_workspace.hpp"

namespace {

using nlohmann::json;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::session::ArtifactWriter;
using warden::session::TurnRecord;
using warden::testing::TempWorkspace;

std::vector<json> read_jsonl(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<json> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(json::parse(line));
        }
    }
    return lines;
}

TEST(ArtifactWriterTest, WritesTranscriptUnderSessionsDir) {
    TempWorkspace workspace("artifact_writer");
    ArtifactWriter writer(workspace.root());

    const json transcript{{"metadata", {{"correlation_id", "run-1"}}},
                          {"messages", json::array()}};
    auto result = writer.write_transcript("run-1", transcript);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto path = get_value(result);
    EXPECT_EQ(path, workspace.root() / ".warden/sessions/run-1.json");
    std::ifstream in(path);
    EXPECT_EQ(json::parse(in), transcript);
}

TEST(ArtifactWriterTest, TranscriptIsOverwritten) {
    TempWorkspace workspace("artifact_writer");
    ArtifactWriter writer(workspace.root());
    ASSERT_FALSE(is_error(writer.write_transcript("run-1", json{{"v", 1}})));
    auto second = writer.write_transcript("run-1", json{{"v", 2}});
    ASSERT_FALSE(is_error(second));

    std::ifstream in(get_value(second));
    EXPECT_EQ(json::parse(in)["v"], 2);
}

TEST(ArtifactWriterTest, AppendsOneLinePerTurn) {
    TempWorkspace workspace("artifact_writer");
    ArtifactWriter writer(workspace.root());

    TurnRecord ok;
    ok.turn = 1;
    ok.success = true;
    ok.tool_calls = 2;
    TurnRecord failed;
    failed.turn = 2;
    failed.error_message = "Turn timed out after 100 ms";

    ASSERT_FALSE(is_error(writer.write_turn_event("run_2", ok)));
    auto result = writer.write_turn_event("run_2", failed);
    ASSERT_FALSE(is_error(result));

    const auto events = read_jsonl(get_value(result));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["event"], "turn");
    EXPECT_EQ(events[0]["correlation_id"], "run_2");
    EXPECT_EQ(events[0]["status"], "completed");
    EXPECT_EQ(events[0]["tool_calls"], 2);
    EXPECT_TRUE(events[0]["ts_unix_ms"].is_number_integer());
    EXPECT_EQ(events[1]["turn"], 2);
    EXPECT_EQ(events[1]["status"], "failed");
    EXPECT_EQ(events[1]["error_message"], "Turn timed out after 100 ms");
}

TEST(ArtifactWriterTest, RejectsUnsafeCorrelationIds) {
    TempWorkspace workspace("artifact_writer");
    ArtifactWriter writer(workspace.root());
    for (const std::string id : {"", "../escape", "a/b", "id with space"}) {
        auto result = writer.write_transcript(id, json::object());
        ASSERT_TRUE(is_error(result)) << id;
        EXPECT_EQ(get_error(result).code, "invalid_correlation_id") << id;
    }
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / ".warden"));
}

TEST(ArtifactWriterTest, RejectsMissingWorkspace) {
    TempWorkspace workspace("artifact_writer");
    ArtifactWriter writer(workspace.root() / "missing");
    auto result = writer.write_turn_event("run-1", TurnRecord{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

}  // namespace
