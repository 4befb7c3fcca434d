#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/memory_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/audit_record.hpp"
#include "protocol/command_codec.hpp"
#include "session/audit_log.hpp"
#include "tools/memory_interpreter.hpp"
#include "tools/memory_tool.hpp"

namespace {

using memvault::core::errors::ErrorKind;

std::string dump_line(const nlohmann::json& payload) {
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

memvault::protocol::AuditObserver make_observer(
    std::shared_ptr<memvault::session::AuditLogWriter> audit_writer) {
    return [audit_writer](const memvault::protocol::AuditRecord& record) {
        const std::string where =
            record.path + (record.new_path ? " -> " + record.new_path.value() : "");
        if (record.success) {
            MEMVAULT_LOG_INFO(record.command + " " + where + ": " + record.message);
        } else if (record.error_kind == memvault::core::errors::to_string(ErrorKind::NoMatch)) {
            MEMVAULT_LOG_WARN(record.command + " " + where + " [" + record.error_kind +
                              "]: " + record.message);
        } else {
            MEMVAULT_LOG_ERROR(record.command + " " + where + " [" + record.error_kind +
                               "]: " + record.message);
        }

        if (!audit_writer) {
            return;
        }
        auto appended = audit_writer->append(record);
        if (memvault::core::errors::is_error(appended)) {
            const auto& err = memvault::core::errors::get_error(appended);
            MEMVAULT_LOG_ERROR("Failed to write audit record [" + err.code + "]: " +
                               err.message);
        }
    };
}

int run_exec(const memvault::tools::MemoryInterpreter& interpreter,
             const std::string& input) {
    auto decoded = memvault::protocol::decode_command_text(input);
    if (memvault::core::errors::is_error(decoded)) {
        const auto& err = memvault::core::errors::get_error(decoded);
        MEMVAULT_LOG_ERROR("Invalid command [" + err.code + "]: " + err.message);
        std::cout << memvault::tools::format_error(err) << std::endl;
        return 2;
    }

    auto executed = interpreter.execute(memvault::core::errors::get_value(decoded));
    if (memvault::core::errors::is_error(executed)) {
        std::cout << memvault::tools::format_error(
                         memvault::core::errors::get_error(executed))
                  << std::endl;
        return 1;
    }
    std::cout << memvault::core::errors::get_value(executed) << std::endl;
    return 0;
}

int run_serve(const memvault::tools::MemoryTool& tool) {
    MEMVAULT_LOG_INFO("Serving memory tool calls on stdin");
    std::string line;
    std::size_t handled = 0;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        memvault::protocol::ToolResult result;
        auto call = memvault::protocol::decode_tool_call(line);
        if (memvault::core::errors::is_error(call)) {
            const auto& err = memvault::core::errors::get_error(call);
            MEMVAULT_LOG_ERROR("Rejected tool call [" + err.code + "]: " + err.message);
            result.success = false;
            result.output = memvault::tools::format_error(err);
            result.error_code = memvault::core::errors::to_string(err.kind);
        } else {
            result = tool.handle(memvault::core::errors::get_value(call));
        }

        std::cout << dump_line(memvault::protocol::encode_tool_result(result)) << std::endl;
        ++handled;
    }
    MEMVAULT_LOG_INFO("Input closed after " + std::to_string(handled) + " tool calls");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process with one session id
    const std::string session_id = memvault::core::config::generate_session_id();
    memvault::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input and environment; return normalized input errors
    auto parsed = memvault::app::cli::parse_and_validate(argc, argv);
    if (memvault::core::errors::is_error(parsed)) {
        const auto& err = memvault::core::errors::get_error(parsed);
        MEMVAULT_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            MEMVAULT_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = memvault::core::errors::get_value(parsed);
    memvault::core::logging::Logger::get().set_min_level(options.log_level);
    MEMVAULT_LOG_DEBUG("Memory directory: " + options.memory_dir.string());

    // 3. Wire the audit observer and the interpreter
    std::shared_ptr<memvault::session::AuditLogWriter> audit_writer;
    if (options.audit_log.has_value()) {
        audit_writer = std::make_shared<memvault::session::AuditLogWriter>(
            options.audit_log.value(), session_id);
        MEMVAULT_LOG_DEBUG("Audit log: " + options.audit_log->string());
    }

    memvault::tools::MemoryInterpreter interpreter(
        options.memory_dir, memvault::policy::kDefaultVirtualPrefix,
        make_observer(audit_writer));

    if (options.mode == memvault::app::AppMode::Exec) {
        return run_exec(interpreter, options.input.value_or(""));
    }

    memvault::tools::MemoryTool tool(interpreter);
    return run_serve(tool);
}
