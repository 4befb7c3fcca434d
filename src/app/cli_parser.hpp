#pragma once
#include <functional>
#include <optional>
#include <string>
#include "app/app_options.hpp"
#include "core/errors/memory_errors.hpp"

namespace memvault::app::cli {
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    std::optional<std::string> process_env(const std::string& name);

    // Flags win over MEMORY_DIR / LOG_LEVEL, which win over defaults.
    memvault::core::errors::Result<AppOptions> parse_and_validate(
        int argc, char* argv[], const EnvLookup& env = process_env);
}
