#include "cli_parser.hpp"
#include <cstdlib>
#include <system_error>
#include <vector>

namespace memvault::app::cli {

    using namespace memvault::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> memory_dir;
        std::optional<std::string> log_level;
        std::optional<std::string> audit_log;
        std::optional<std::string> input;
    };

    std::optional<std::string> process_env(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    Result<AppOptions> parse_and_validate(int argc, char* argv[], const EnvLookup& env) {
        const std::string usage = "Usage: memvault serve|exec [--memory-dir DIR] [--log-level LEVEL] [--audit-log FILE] [--input JSON]";
        if (argc < 2) {
            return MemoryError{ErrorKind::InvalidArgument, "No command provided.", "missing_command", usage};
        }

        AppOptions options;
        std::string command = argv[1];
        if (command == "serve") {
            options.mode = AppMode::Serve;
        } else if (command == "exec") {
            options.mode = AppMode::Exec;
        } else {
            return MemoryError{ErrorKind::InvalidArgument, "Unknown command: " + command, "unknown_command", usage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--memory-dir") {
                if (i + 1 < args.size()) raw.memory_dir = args[++i];
                else return MemoryError{ErrorKind::InvalidArgument, "Missing value for --memory-dir", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return MemoryError{ErrorKind::InvalidArgument, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--audit-log") {
                if (i + 1 < args.size()) raw.audit_log = args[++i];
                else return MemoryError{ErrorKind::InvalidArgument, "Missing value for --audit-log", "missing_value"};
            } else if (args[i] == "--input") {
                if (i + 1 < args.size()) raw.input = args[++i];
                else return MemoryError{ErrorKind::InvalidArgument, "Missing value for --input", "missing_value"};
            } else {
                return MemoryError{ErrorKind::InvalidArgument, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Environment fallbacks
        if (!raw.memory_dir) raw.memory_dir = env("MEMORY_DIR");
        if (!raw.log_level) raw.log_level = env("LOG_LEVEL");

        // 4. Validator Phase
        if (options.mode == AppMode::Exec && !raw.input) {
            return MemoryError{ErrorKind::InvalidArgument, "exec requires --input", "missing_input", "Pass the command as a JSON object, e.g. --input '{\"command\":\"view\",\"path\":\"/memories\"}'"};
        }
        if (options.mode == AppMode::Serve && raw.input) {
            return MemoryError{ErrorKind::InvalidArgument, "--input is only valid with exec", "conflicting_flags"};
        }
        options.input = raw.input;

        if (raw.log_level) {
            auto level = core::logging::parse_log_level(raw.log_level.value());
            if (!level) {
                return MemoryError{ErrorKind::InvalidArgument, "Invalid log level: " + raw.log_level.value(), "invalid_log_level", "Use debug, info, warn or error."};
            }
            options.log_level = level.value();
        }

        if (raw.audit_log) {
            if (raw.audit_log->empty()) {
                return MemoryError{ErrorKind::InvalidArgument, "--audit-log cannot be empty", "missing_value"};
            }
            options.audit_log = std::filesystem::path(raw.audit_log.value());
        }

        // The memory directory may not exist yet; the interpreter creates it on first use.
        std::filesystem::path dir = raw.memory_dir ? std::filesystem::path(raw.memory_dir.value()) : options.memory_dir;
        std::error_code path_ec;
        std::filesystem::path absolute_dir = std::filesystem::absolute(dir, path_ec);
        if (path_ec) {
            return MemoryError{ErrorKind::InvalidPath, "Failed to resolve memory directory", "invalid_memory_dir"};
        }
        const bool exists = std::filesystem::exists(absolute_dir, path_ec);
        if (!path_ec && exists && !std::filesystem::is_directory(absolute_dir, path_ec)) {
            return MemoryError{ErrorKind::NotADirectory, "Memory directory exists but is not a directory", "invalid_memory_dir"};
        }
        options.memory_dir = absolute_dir.lexically_normal();

        return options;
    }

} // namespace memvault::app::cli
