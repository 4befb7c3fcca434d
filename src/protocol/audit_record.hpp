#pragma once
#include <functional>
#include <optional>
#include <string>

namespace memvault::protocol {

    // One record per executed command, success or failure. Paths are the
    // caller's virtual paths; real sandbox locations never appear here.
    struct AuditRecord {
        std::string command;                  // "view", "create", ...
        std::string path;                     // old_path for rename
        std::optional<std::string> new_path;  // rename only
        bool success = false;
        std::string error_kind;               // empty on success
        std::string message;                  // result text or error message
        double duration_ms = 0.0;
    };

    // Injected into the interpreter instead of logging from inside it.
    using AuditObserver = std::function<void(const AuditRecord&)>;

} // namespace memvault::protocol
