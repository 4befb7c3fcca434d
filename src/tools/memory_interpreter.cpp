#include "tools/memory_interpreter.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "tools/text_edit.hpp"

namespace memvault::tools {

using core::errors::ErrorKind;
using core::errors::MemoryError;
using core::errors::Result;
using protocol::AuditRecord;

namespace {

MemoryError io_error(const std::string& action, const std::string& virtual_path,
                     const std::error_code& ec) {
    return MemoryError{ErrorKind::Io,
                       "Failed to " + action + " '" + virtual_path + "': " + ec.message(),
                       "io_error"};
}

MemoryError not_found(const std::string& what, const std::string& virtual_path) {
    return MemoryError{ErrorKind::NotFound, what + " does not exist: " + virtual_path,
                       "not_found"};
}

MemoryError is_a_directory(const std::string& virtual_path) {
    return MemoryError{ErrorKind::IsADirectory,
                       "Path is a directory, not a file: " + virtual_path,
                       "is_a_directory"};
}

bool is_missing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory ||
           ec == std::errc::not_a_directory;
}

// Follows symlinks; used for content operations.
Result<std::filesystem::file_status> entry_status(const std::filesystem::path& path,
                                                  const std::string& virtual_path) {
    std::error_code ec;
    const auto st = std::filesystem::status(path, ec);
    if (ec && !is_missing(ec)) {
        return io_error("inspect", virtual_path, ec);
    }
    if (ec) {
        return std::filesystem::file_status(std::filesystem::file_type::not_found);
    }
    return st;
}

// Does not follow symlinks; used for delete and rename, which act on the entry itself.
Result<std::filesystem::file_status> link_status(const std::filesystem::path& path,
                                                 const std::string& virtual_path) {
    std::error_code ec;
    const auto st = std::filesystem::symlink_status(path, ec);
    if (ec && !is_missing(ec)) {
        return io_error("inspect", virtual_path, ec);
    }
    if (ec) {
        return std::filesystem::file_status(std::filesystem::file_type::not_found);
    }
    return st;
}

Result<std::string> read_text(const std::filesystem::path& path,
                              const std::string& virtual_path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("open", virtual_path,
                        std::error_code(errno, std::generic_category()));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return MemoryError{ErrorKind::Io,
                           "I/O error while reading file: " + virtual_path,
                           "io_error"};
    }
    return buffer.str();
}

std::string temp_suffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    std::stringstream ss;
    ss << ".memvault-tmp-";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

// Writes to a sibling temp file and renames it over the target, so a crash
// leaves either the old content or the new one. The temp name has a fixed
// length so that any legal target name also leaves room for it. An existing
// target's permission bits carry over to the new file.
Result<std::size_t> write_atomic(const std::filesystem::path& path,
                                 const std::string& content,
                                 const std::string& virtual_path) {
    const auto temp_path =
        path.parent_path() / temp_suffix();
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return io_error("open for writing", virtual_path,
                            std::error_code(errno, std::generic_category()));
        }
        out << content;
        out.flush();
        if (!out.good()) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return MemoryError{ErrorKind::Io, "Failed to write file: " + virtual_path,
                               "io_error"};
        }
    }

    std::error_code ec;
    const auto existing = std::filesystem::status(path, ec);
    if (!ec && std::filesystem::is_regular_file(existing)) {
        std::filesystem::permissions(temp_path, existing.permissions(),
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return io_error("preserve permissions of", virtual_path, ec);
        }
    }
    ec.clear();
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return io_error("replace", virtual_path, ec);
    }
    return content.size();
}

Result<std::filesystem::path> ensure_parent(const std::filesystem::path& path,
                                            const std::string& virtual_path) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec == std::errc::not_a_directory || ec == std::errc::file_exists) {
        return MemoryError{ErrorKind::NotADirectory,
                           "A parent of '" + virtual_path + "' is a file, not a directory.",
                           "parent_not_directory"};
    }
    if (ec) {
        return io_error("create parent directories for", virtual_path, ec);
    }
    return path.parent_path();
}

// Existing regular file the content operations can read and rewrite.
Result<std::string> load_existing_file(const std::filesystem::path& path,
                                       const std::string& virtual_path) {
    auto st = entry_status(path, virtual_path);
    if (core::errors::is_error(st)) {
        return core::errors::get_error(st);
    }
    const auto type = core::errors::get_value(st).type();
    if (type == std::filesystem::file_type::not_found) {
        return not_found("File", virtual_path);
    }
    if (type == std::filesystem::file_type::directory) {
        return is_a_directory(virtual_path);
    }
    return read_text(path, virtual_path);
}

std::string summarize(const std::string& text) {
    constexpr std::size_t kMaxSummaryLength = 240;
    const std::size_t newline = text.find('\n');
    std::string first_line = text.substr(0, newline);
    if (first_line.size() > kMaxSummaryLength) {
        first_line = first_line.substr(0, kMaxSummaryLength) + "...";
    } else if (newline != std::string::npos) {
        first_line += " ...";
    }
    return first_line;
}

struct AuditPaths {
    std::string path;
    std::optional<std::string> new_path;
};

struct AuditPathsVisitor {
    AuditPaths operator()(const protocol::ViewCommand& c) const { return {c.path, std::nullopt}; }
    AuditPaths operator()(const protocol::CreateCommand& c) const { return {c.path, std::nullopt}; }
    AuditPaths operator()(const protocol::StrReplaceCommand& c) const { return {c.path, std::nullopt}; }
    AuditPaths operator()(const protocol::InsertCommand& c) const { return {c.path, std::nullopt}; }
    AuditPaths operator()(const protocol::DeleteCommand& c) const { return {c.path, std::nullopt}; }
    AuditPaths operator()(const protocol::RenameCommand& c) const { return {c.old_path, c.new_path}; }
};

}  // namespace

struct CommandDispatcher {
    const MemoryInterpreter& self;

    Result<std::string> operator()(const protocol::ViewCommand& c) const { return self.view(c); }
    Result<std::string> operator()(const protocol::CreateCommand& c) const { return self.create(c); }
    Result<std::string> operator()(const protocol::StrReplaceCommand& c) const { return self.str_replace(c); }
    Result<std::string> operator()(const protocol::InsertCommand& c) const { return self.insert(c); }
    Result<std::string> operator()(const protocol::DeleteCommand& c) const { return self.remove(c); }
    Result<std::string> operator()(const protocol::RenameCommand& c) const { return self.rename(c); }
};

MemoryInterpreter::MemoryInterpreter(std::filesystem::path sandbox_root,
                                     std::string virtual_prefix,
                                     protocol::AuditObserver observer)
    : resolver_(std::move(sandbox_root), std::move(virtual_prefix)),
      observer_(std::move(observer)) {}

Result<std::filesystem::path> MemoryInterpreter::ensure_root() const {
    const auto& root = resolver_.sandbox_root();
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return MemoryError{ErrorKind::Io,
                           "Failed to create memory directory " +
                               resolver_.virtual_prefix() + ": " + ec.message(),
                           "root_create_failed"};
    }
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return MemoryError{ErrorKind::Io,
                           "Memory directory " + resolver_.virtual_prefix() +
                               " is not a directory.",
                           "invalid_sandbox_root"};
    }
    return root;
}

Result<std::string> MemoryInterpreter::execute(
    const protocol::MemoryCommand& command) const {
    const auto started = std::chrono::steady_clock::now();

    Result<std::string> result = std::string{};
    auto root = ensure_root();
    if (core::errors::is_error(root)) {
        result = core::errors::get_error(root);
    } else {
        result = std::visit(CommandDispatcher{*this}, command);
    }

    if (observer_) {
        const auto ended = std::chrono::steady_clock::now();
        const auto paths = std::visit(AuditPathsVisitor{}, command);

        AuditRecord record;
        record.command = protocol::command_name(command);
        record.path = paths.path;
        record.new_path = paths.new_path;
        record.success = !core::errors::is_error(result);
        if (record.success) {
            record.message = summarize(core::errors::get_value(result));
        } else {
            const auto& err = core::errors::get_error(result);
            record.error_kind = core::errors::to_string(err.kind);
            record.message = err.message;
        }
        record.duration_ms =
            std::chrono::duration<double, std::milli>(ended - started).count();
        observer_(record);
    }
    return result;
}

Result<std::string> MemoryInterpreter::view(const protocol::ViewCommand& command) const {
    auto resolved = resolver_.resolve(command.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path target = core::errors::get_value(resolved);

    auto st = entry_status(target, command.path);
    if (core::errors::is_error(st)) {
        return core::errors::get_error(st);
    }
    const auto type = core::errors::get_value(st).type();
    if (type == std::filesystem::file_type::not_found) {
        return not_found("Path", command.path);
    }

    if (type == std::filesystem::file_type::directory) {
        if (command.view_range.has_value()) {
            return MemoryError{ErrorKind::IsADirectory,
                               "view_range cannot be used on a directory: " + command.path,
                               "range_on_directory"};
        }

        std::vector<std::pair<std::string, bool>> entries;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(target, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::error_code type_ec;
            const bool is_dir = it->is_directory(type_ec);
            entries.emplace_back(it->path().filename().string(), is_dir && !type_ec);
        }
        if (ec) {
            return io_error("list", command.path, ec);
        }
        if (entries.empty()) {
            return "Directory is empty: " + command.path;
        }

        std::sort(entries.begin(), entries.end());
        std::ostringstream out;
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (i != 0) {
                out << "\n";
            }
            out << (entries[i].second ? "DIR: " : "FILE: ")
                << resolver_.to_virtual(target / entries[i].first);
        }
        return out.str();
    }

    auto content = read_text(target, command.path);
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }
    const auto lines = text::split_lines(core::errors::get_value(content));
    if (!command.view_range.has_value()) {
        return text::render_numbered(lines, 1, lines.size());
    }

    const auto& range = command.view_range.value();
    const auto line_count = static_cast<std::int64_t>(lines.size());
    if (range.start < 1 || (range.end != -1 && range.end < range.start)) {
        return MemoryError{ErrorKind::LineOutOfRange,
                           "Invalid view_range [" + std::to_string(range.start) + ", " +
                               std::to_string(range.end) + "] for " + command.path,
                           "invalid_view_range",
                           "Lines are 1-based; use -1 as end to read to the last line."};
    }
    if (range.start > line_count) {
        return MemoryError{ErrorKind::LineOutOfRange,
                           "view_range start " + std::to_string(range.start) +
                               " is beyond the end of " + command.path + " (" +
                               std::to_string(line_count) + " lines)",
                           "line_out_of_range"};
    }
    const std::int64_t last =
        range.end == -1 ? line_count : std::min(range.end, line_count);
    return text::render_numbered(lines, static_cast<std::size_t>(range.start),
                                 static_cast<std::size_t>(last));
}

Result<std::string> MemoryInterpreter::create(const protocol::CreateCommand& command) const {
    auto resolved = resolver_.resolve(command.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path target = core::errors::get_value(resolved);

    auto st = entry_status(target, command.path);
    if (core::errors::is_error(st)) {
        return core::errors::get_error(st);
    }
    if (core::errors::get_value(st).type() == std::filesystem::file_type::directory) {
        return is_a_directory(command.path);
    }

    auto parent = ensure_parent(target, command.path);
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }
    auto written = write_atomic(target, command.file_text, command.path);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return "Created file: " + command.path;
}

Result<std::string> MemoryInterpreter::str_replace(
    const protocol::StrReplaceCommand& command) const {
    auto resolved = resolver_.resolve(command.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path target = core::errors::get_value(resolved);

    auto loaded = load_existing_file(target, command.path);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    if (command.old_str.empty()) {
        return MemoryError{ErrorKind::InvalidArgument, "old_str must not be empty.",
                           "empty_old_str"};
    }

    std::string content = core::errors::get_value(loaded);
    const std::size_t occurrences = text::count_occurrences(content, command.old_str, 2);
    if (occurrences == 0) {
        return MemoryError{ErrorKind::NoMatch,
                           "String not found in " + command.path + "; file unchanged.",
                           "no_match", "View the file to copy the exact text."};
    }
    if (occurrences > 1) {
        return MemoryError{ErrorKind::AmbiguousMatch,
                           "String occurs more than once in " + command.path +
                               "; file unchanged.",
                           "ambiguous_match",
                           "Include more surrounding text so old_str is unique."};
    }

    content.replace(content.find(command.old_str), command.old_str.size(),
                    command.new_str);
    auto written = write_atomic(target, content, command.path);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return "Replaced string in " + command.path;
}

Result<std::string> MemoryInterpreter::insert(const protocol::InsertCommand& command) const {
    auto resolved = resolver_.resolve(command.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path target = core::errors::get_value(resolved);

    auto loaded = load_existing_file(target, command.path);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const std::string& content = core::errors::get_value(loaded);

    const std::size_t line_count = text::split_lines(content).size();
    if (command.insert_line > line_count) {
        return MemoryError{ErrorKind::LineOutOfRange,
                           "Invalid line number: " + std::to_string(command.insert_line) +
                               " (" + command.path + " has " +
                               std::to_string(line_count) + " lines)",
                           "line_out_of_range",
                           "Use a line between 0 and " + std::to_string(line_count) + "."};
    }

    const std::string updated =
        text::insert_at_line(content, command.insert_line, command.insert_text);
    auto written = write_atomic(target, updated, command.path);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return "Inserted text at line " + std::to_string(command.insert_line) + " in " +
           command.path;
}

Result<std::string> MemoryInterpreter::remove(const protocol::DeleteCommand& command) const {
    auto resolved =
        resolver_.resolve(command.path, policy::PathResolver::FinalLink::NoFollow);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path target = core::errors::get_value(resolved);
    if (resolver_.is_root(target)) {
        return MemoryError{ErrorKind::InvalidPath,
                           "Refusing to delete the memory root: " + command.path,
                           "root_not_deletable"};
    }

    auto st = link_status(target, command.path);
    if (core::errors::is_error(st)) {
        return core::errors::get_error(st);
    }
    const auto type = core::errors::get_value(st).type();
    if (type == std::filesystem::file_type::not_found) {
        return not_found("Path", command.path);
    }

    std::error_code ec;
    if (type == std::filesystem::file_type::directory) {
        std::filesystem::remove_all(target, ec);
        if (ec) {
            return io_error("delete directory", command.path, ec);
        }
        return "Deleted directory: " + command.path;
    }

    std::filesystem::remove(target, ec);
    if (ec) {
        return io_error("delete", command.path, ec);
    }
    return "Deleted file: " + command.path;
}

Result<std::string> MemoryInterpreter::rename(const protocol::RenameCommand& command) const {
    // Both sides go through the resolver independently.
    auto resolved_old =
        resolver_.resolve(command.old_path, policy::PathResolver::FinalLink::NoFollow);
    if (core::errors::is_error(resolved_old)) {
        return core::errors::get_error(resolved_old);
    }
    auto resolved_new =
        resolver_.resolve(command.new_path, policy::PathResolver::FinalLink::NoFollow);
    if (core::errors::is_error(resolved_new)) {
        return core::errors::get_error(resolved_new);
    }
    const std::filesystem::path source = core::errors::get_value(resolved_old);
    const std::filesystem::path destination = core::errors::get_value(resolved_new);

    if (resolver_.is_root(source) || resolver_.is_root(destination)) {
        return MemoryError{ErrorKind::InvalidPath,
                           "The memory root cannot be renamed or replaced: " +
                               command.old_path + " -> " + command.new_path,
                           "root_not_renamable"};
    }

    auto source_st = link_status(source, command.old_path);
    if (core::errors::is_error(source_st)) {
        return core::errors::get_error(source_st);
    }
    const auto source_type = core::errors::get_value(source_st).type();
    if (source_type == std::filesystem::file_type::not_found) {
        return not_found("Source path", command.old_path);
    }

    auto destination_st = link_status(destination, command.new_path);
    if (core::errors::is_error(destination_st)) {
        return core::errors::get_error(destination_st);
    }
    if (core::errors::get_value(destination_st).type() !=
        std::filesystem::file_type::not_found) {
        return MemoryError{ErrorKind::AlreadyExists,
                           "Destination already exists: " + command.new_path,
                           "destination_exists",
                           "Delete the destination first or choose another name."};
    }

    if (source_type == std::filesystem::file_type::directory &&
        policy::PathResolver::is_within_root(source, destination)) {
        return MemoryError{ErrorKind::InvalidPath,
                           "Cannot move " + command.old_path + " into itself (" +
                               command.new_path + ")",
                           "rename_into_self"};
    }

    auto parent = ensure_parent(destination, command.new_path);
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }

    std::error_code ec;
    std::filesystem::rename(source, destination, ec);
    if (ec) {
        return io_error("rename " + command.old_path + " to", command.new_path, ec);
    }
    return "Renamed " + command.old_path + " to " + command.new_path;
}

}  // namespace memvault::tools
