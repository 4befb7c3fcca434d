#include "tools/memory_tool.hpp"

#include <chrono>
#include "protocol/command_codec.hpp"

namespace memvault::tools {

using core::errors::ErrorKind;
using core::errors::MemoryError;
using protocol::ToolCall;
using protocol::ToolResult;

namespace {

ToolResult failure(const ToolCall& call, const MemoryError& error) {
    ToolResult result;
    result.tool_use_id = call.id;
    result.success = false;
    result.output = format_error(error);
    result.error_code = core::errors::to_string(error.kind);
    return result;
}

}  // namespace

std::string format_error(const MemoryError& error) {
    std::string text = "Error [" + core::errors::to_string(error.kind) + "]: " + error.message;
    if (!error.hint.empty()) {
        text += "\nHint: " + error.hint;
    }
    return text;
}

MemoryTool::MemoryTool(const MemoryInterpreter& interpreter)
    : interpreter_(interpreter) {}

ToolResult MemoryTool::handle(const ToolCall& call) const {
    const auto started = std::chrono::steady_clock::now();

    ToolResult result;
    if (call.name != kMemoryToolName) {
        result = failure(call, MemoryError{ErrorKind::InvalidArgument,
                                           "Unknown tool: " + call.name, "unknown_tool"});
    } else {
        auto decoded = protocol::decode_command_text(call.arguments);
        if (core::errors::is_error(decoded)) {
            result = failure(call, core::errors::get_error(decoded));
        } else {
            auto executed = interpreter_.execute(core::errors::get_value(decoded));
            if (core::errors::is_error(executed)) {
                result = failure(call, core::errors::get_error(executed));
            } else {
                result.tool_use_id = call.id;
                result.success = true;
                result.output = core::errors::get_value(executed);
            }
        }
    }

    const auto ended = std::chrono::steady_clock::now();
    result.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return result;
}

}  // namespace memvault::tools
