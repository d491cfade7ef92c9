#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace helm::protocol {

    // How the model asks the runtime to do something
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "read_file", "shell"
        nlohmann::json input = nlohmann::json::object();
    };

    // What the runtime recorded back for that call
    struct ToolResultRecord {
        std::string tool_call_id;
        std::string name;
        std::string result;
    };

} // namespace helm::protocol
