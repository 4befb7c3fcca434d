#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/logging/logger.hpp"

namespace memvault::app {

    enum class AppMode {
        Serve,  // one JSON tool call per stdin line
        Exec    // a single command from --input
    };

    // Validated process configuration. The interpreter itself only ever sees memory_dir.
    struct AppOptions {
        AppMode mode = AppMode::Serve;
        std::filesystem::path memory_dir = "./memories";
        core::logging::LogLevel log_level = core::logging::LogLevel::INFO;
        std::optional<std::filesystem::path> audit_log;
        std::optional<std::string> input;
    };

} // namespace memvault::app
