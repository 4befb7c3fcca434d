#pragma once

#include <string>
#include "core/errors/memory_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/memory_interpreter.hpp"

namespace memvault::tools {

inline constexpr const char* kMemoryToolName = "memory";

// "Error [<kind>]: <message>" plus an optional hint line.
std::string format_error(const core::errors::MemoryError& error);

// Front door for the agent loop: decodes a tool call, runs it through the
// interpreter and folds every outcome into a ToolResult.
class MemoryTool {
public:
    explicit MemoryTool(const MemoryInterpreter& interpreter);

    protocol::ToolResult handle(const protocol::ToolCall& call) const;

private:
    const MemoryInterpreter& interpreter_;
};

}  // namespace memvault::tools
