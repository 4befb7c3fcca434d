#include "session/audit_log.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

namespace memvault::session {

using core::errors::ErrorKind;
using core::errors::MemoryError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

json audit_record_to_json(const protocol::AuditRecord& record) {
    json payload;
    payload["command"] = record.command;
    payload["path"] = record.path;
    if (record.new_path.has_value()) {
        payload["new_path"] = record.new_path.value();
    }
    payload["success"] = record.success;
    payload["error_kind"] = record.error_kind;
    payload["message"] = record.message;
    payload["duration_ms"] = record.duration_ms;
    return payload;
}

AuditLogWriter::AuditLogWriter(std::filesystem::path log_path, std::string session_id)
    : log_path_(std::move(log_path)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> AuditLogWriter::prepare_log_path() const {
    if (log_path_.empty()) {
        return MemoryError{ErrorKind::InvalidArgument, "Audit log path cannot be empty.",
                           "invalid_audit_log"};
    }

    std::error_code ec;
    const auto parent = log_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return MemoryError{ErrorKind::Io,
                               "Unable to create audit log directory: " + parent.string(),
                               "audit_dir_create_failed"};
        }
    }
    if (std::filesystem::is_directory(log_path_, ec)) {
        return MemoryError{ErrorKind::IsADirectory,
                           "Audit log path is a directory: " + log_path_.string(),
                           "invalid_audit_log"};
    }
    return log_path_;
}

core::errors::Result<std::filesystem::path> AuditLogWriter::append(
    const protocol::AuditRecord& record) const {
    auto path_result = prepare_log_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "memory_command";
    event["session_id"] = session_id_;
    event["payload"] = audit_record_to_json(record);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return MemoryError{ErrorKind::Io,
                           "Unable to open audit log: " + path.string(),
                           "audit_open_failed"};
    }

    out << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return MemoryError{ErrorKind::Io,
                           "Unable to write audit event: " + path.string(),
                           "audit_write_failed"};
    }
    return path;
}

}  // namespace memvault::session
