#pragma once
#include <string>

namespace memvault::protocol {

    // How the agent loop asks for a memory operation
    struct ToolCall {
        std::string id;
        std::string name;       // expected to be "memory"
        std::string arguments;  // Raw JSON object with the command fields
    };

    // How the memory tool replies back
    struct ToolResult {
        std::string tool_use_id;
        bool success = false;
        std::string output;      // listing, file view, confirmation or error text
        std::string error_code;  // empty on success, else to_string(ErrorKind)
        double duration_ms = 0.0;
    };

} // namespace memvault::protocol
