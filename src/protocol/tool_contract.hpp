#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace warden::protocol {

    inline constexpr const char* kReadFileTool = "read_file";
    inline constexpr const char* kWriteFileTool = "write_file";
    inline constexpr const char* kExecuteCommandTool = "execute_command";
    inline constexpr const char* kListFilesTool = "list_files";

    // A pending tool call taken from a tool_use block. Executed exactly once.
    struct ToolTask {
        const std::string tool_use_id;
        const std::string tool_name;
        const nlohmann::json tool_input;
    };

    // The fixed manifest sent with every request that has tools enabled:
    // read_file{file_path}, write_file{file_path,content},
    // execute_command{command}, list_files{pattern,path?}.
    nlohmann::json tool_manifest();

} // namespace warden::protocol
