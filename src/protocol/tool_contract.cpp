#include "protocol/tool_contract.hpp"

namespace warden::protocol {

using nlohmann::json;

namespace {

json string_property(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

json tool_entry(const std::string& name, const std::string& description,
                json properties, json required) {
    return json{{"name", name},
                {"description", description},
                {"input_schema",
                 {{"type", "object"},
                  {"properties", std::move(properties)},
                  {"required", std::move(required)}}}};
}

}  // namespace

json tool_manifest() {
    json tools = json::array();
    tools.push_back(tool_entry(
        kReadFileTool,
        "Read a file from the filesystem. Returns the file contents as a string.",
        {{"file_path", string_property("Absolute path to the file to read")}},
        json::array({"file_path"})));
    tools.push_back(tool_entry(
        kWriteFileTool,
        "Write content to a file, overwriting if it exists. Returns confirmation message.",
        {{"file_path", string_property("Absolute path to the file to write")},
         {"content", string_property("Content to write to the file")}},
        json::array({"file_path", "content"})));
    tools.push_back(tool_entry(
        kExecuteCommandTool,
        "Execute a shell command and return its output. Use for terminal operations "
        "like git, make, cmake, etc.",
        {{"command", string_property("The shell command to execute")}},
        json::array({"command"})));
    tools.push_back(tool_entry(
        kListFilesTool, "List files in a directory using glob patterns",
        {{"pattern", string_property("Glob pattern (e.g., '*.cpp', 'src/**/*.hpp')")},
         {"path", string_property("Base directory path (defaults to current directory)")}},
        json::array({"pattern"})));
    return tools;
}

}  // namespace warden::protocol
