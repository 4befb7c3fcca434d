#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/memory_errors.hpp"
#include "protocol/memory_command.hpp"
#include "protocol/tool_contract.hpp"

namespace memvault::protocol {

// Decodes the memory tool's input object ({"command": "view", "path": ...}).
core::errors::Result<MemoryCommand> decode_command(const nlohmann::json& input);

core::errors::Result<MemoryCommand> decode_command_text(const std::string& text);

// Parses one serve-loop line: {"id": ..., "name": "memory", "input": {...}}.
core::errors::Result<ToolCall> decode_tool_call(const std::string& line);

nlohmann::json encode_tool_result(const ToolResult& result);

}  // namespace memvault::protocol
