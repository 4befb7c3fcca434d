#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/memory_errors.hpp"
#include "protocol/audit_record.hpp"

namespace memvault::session {

nlohmann::json audit_record_to_json(const protocol::AuditRecord& record);

// Appends one JSON object per executed command to a JSONL file.
class AuditLogWriter {
public:
    AuditLogWriter(std::filesystem::path log_path, std::string session_id);

    core::errors::Result<std::filesystem::path> append(
        const protocol::AuditRecord& record) const;

    const std::filesystem::path& log_path() const { return log_path_; }

private:
    core::errors::Result<std::filesystem::path> prepare_log_path() const;

    std::filesystem::path log_path_;
    std::string session_id_;
};

}  // namespace memvault::session
