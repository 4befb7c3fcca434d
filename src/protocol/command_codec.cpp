#include "protocol/command_codec.hpp"

#include <cstdint>
#include <limits>
#include <optional>

namespace memvault::protocol {

using core::errors::ErrorKind;
using core::errors::MemoryError;
using core::errors::Result;
using nlohmann::json;

namespace {

MemoryError missing_field(const std::string& command, const char* field) {
    return MemoryError{ErrorKind::InvalidArgument,
                       "Command '" + command + "' requires string field '" +
                           field + "'.",
                       "missing_field"};
}

std::optional<std::string> string_field(const json& input, const char* field) {
    const auto it = input.find(field);
    if (it == input.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Integers that get<std::int64_t>() can represent without wrapping.
bool is_int64(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }
    return value.is_number_integer();
}

Result<std::optional<ViewRange>> decode_view_range(const json& input) {
    const auto it = input.find("view_range");
    if (it == input.end() || it->is_null()) {
        return std::optional<ViewRange>{};
    }
    if (!it->is_array() || it->size() != 2 || !is_int64((*it)[0]) ||
        !is_int64((*it)[1])) {
        return MemoryError{ErrorKind::InvalidArgument,
                           "view_range must be an array of two integers [start, end].",
                           "invalid_view_range"};
    }
    ViewRange range;
    range.start = (*it)[0].get<std::int64_t>();
    range.end = (*it)[1].get<std::int64_t>();
    return std::optional<ViewRange>{range};
}

}  // namespace

Result<MemoryCommand> decode_command(const json& input) {
    if (!input.is_object()) {
        return MemoryError{ErrorKind::InvalidArgument,
                           "Command input must be a JSON object.",
                           "invalid_command_input"};
    }
    const auto name = string_field(input, "command");
    if (!name) {
        return MemoryError{ErrorKind::InvalidArgument,
                           "Missing required field 'command'.", "missing_field"};
    }
    const std::string& command = *name;

    if (command == "rename") {
        auto old_path = string_field(input, "old_path");
        if (!old_path) return missing_field(command, "old_path");
        auto new_path = string_field(input, "new_path");
        if (!new_path) return missing_field(command, "new_path");
        return MemoryCommand{RenameCommand{std::move(*old_path), std::move(*new_path)}};
    }

    auto path = string_field(input, "path");
    if (!path) {
        if (command == "view" || command == "create" || command == "str_replace" ||
            command == "insert" || command == "delete") {
            return missing_field(command, "path");
        }
        return MemoryError{ErrorKind::InvalidArgument,
                           "Unknown memory command: " + command, "unknown_command",
                           "Use one of view, create, str_replace, insert, delete, rename."};
    }

    if (command == "view") {
        auto range = decode_view_range(input);
        if (core::errors::is_error(range)) {
            return core::errors::get_error(range);
        }
        return MemoryCommand{ViewCommand{std::move(*path), core::errors::get_value(range)}};
    }

    if (command == "create") {
        auto file_text = string_field(input, "file_text");
        if (!file_text) return missing_field(command, "file_text");
        return MemoryCommand{CreateCommand{std::move(*path), std::move(*file_text)}};
    }

    if (command == "str_replace") {
        auto old_str = string_field(input, "old_str");
        if (!old_str) return missing_field(command, "old_str");
        // An absent new_str deletes the matched text.
        auto new_str = string_field(input, "new_str");
        return MemoryCommand{StrReplaceCommand{std::move(*path), std::move(*old_str),
                                               new_str.value_or("")}};
    }

    if (command == "insert") {
        const auto line_it = input.find("insert_line");
        if (line_it == input.end() || !is_int64(*line_it)) {
            return MemoryError{ErrorKind::InvalidArgument,
                               "Command 'insert' requires integer field 'insert_line'.",
                               "missing_field"};
        }
        const auto line = line_it->get<std::int64_t>();
        if (line < 0) {
            return MemoryError{ErrorKind::LineOutOfRange,
                               "Invalid line number: " + std::to_string(line),
                               "negative_insert_line"};
        }
        auto text = string_field(input, "insert_text");
        if (!text) {
            text = string_field(input, "new_str");
        }
        if (!text) return missing_field(command, "insert_text");
        return MemoryCommand{InsertCommand{std::move(*path),
                                           static_cast<std::size_t>(line),
                                           std::move(*text)}};
    }

    if (command == "delete") {
        return MemoryCommand{DeleteCommand{std::move(*path)}};
    }

    return MemoryError{ErrorKind::InvalidArgument,
                       "Unknown memory command: " + command, "unknown_command",
                       "Use one of view, create, str_replace, insert, delete, rename."};
}

Result<MemoryCommand> decode_command_text(const std::string& text) {
    const json input = json::parse(text, nullptr, false);
    if (input.is_discarded()) {
        return MemoryError{ErrorKind::InvalidArgument,
                           "Command input is not valid JSON.", "invalid_json"};
    }
    return decode_command(input);
}

Result<ToolCall> decode_tool_call(const std::string& line) {
    const json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return MemoryError{ErrorKind::InvalidArgument,
                           "Tool call is not a valid JSON object.", "invalid_json"};
    }

    ToolCall call;
    call.id = string_field(payload, "id").value_or("");
    call.name = string_field(payload, "name").value_or("memory");
    const auto input_it = payload.find("input");
    if (input_it == payload.end()) {
        return MemoryError{ErrorKind::InvalidArgument,
                           "Tool call is missing its 'input' object.", "missing_field"};
    }
    call.arguments = input_it->dump();
    return call;
}

json encode_tool_result(const ToolResult& result) {
    json payload;
    payload["tool_use_id"] = result.tool_use_id;
    payload["is_error"] = !result.success;
    payload["content"] = result.output;
    if (!result.error_code.empty()) {
        payload["error_code"] = result.error_code;
    }
    return payload;
}

}  // namespace memvault::protocol
