#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace memvault::protocol {

    // 1-based inclusive line range. end == -1 means "through the last line".
    struct ViewRange {
        std::int64_t start = 1;
        std::int64_t end = -1;
    };

    // One struct per operation kind, each carrying only its own fields.
    struct ViewCommand {
        std::string path;
        std::optional<ViewRange> view_range;
    };

    struct CreateCommand {
        std::string path;
        std::string file_text;
    };

    struct StrReplaceCommand {
        std::string path;
        std::string old_str;
        std::string new_str;
    };

    struct InsertCommand {
        std::string path;
        std::size_t insert_line = 0; // 0 = before the first line
        std::string insert_text;
    };

    struct DeleteCommand {
        std::string path;
    };

    struct RenameCommand {
        std::string old_path;
        std::string new_path;
    };

    // A MemoryCommand is exactly ONE of the kinds below. Dispatch sites use
    // std::visit, so a missing handler is a compile error.
    using MemoryCommand = std::variant<
        ViewCommand,
        CreateCommand,
        StrReplaceCommand,
        InsertCommand,
        DeleteCommand,
        RenameCommand
    >;

    struct CommandNameVisitor {
        std::string operator()(const ViewCommand&) const { return "view"; }
        std::string operator()(const CreateCommand&) const { return "create"; }
        std::string operator()(const StrReplaceCommand&) const { return "str_replace"; }
        std::string operator()(const InsertCommand&) const { return "insert"; }
        std::string operator()(const DeleteCommand&) const { return "delete"; }
        std::string operator()(const RenameCommand&) const { return "rename"; }
    };

    inline std::string command_name(const MemoryCommand& command) {
        return std::visit(CommandNameVisitor{}, command);
    }

} // namespace memvault::protocol
