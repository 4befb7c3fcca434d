#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/memory_errors.hpp"

namespace {

using memvault::app::AppMode;
using memvault::app::AppOptions;
using memvault::app::cli::parse_and_validate;
using memvault::core::errors::ErrorKind;
using memvault::core::errors::get_error;
using memvault::core::errors::get_value;
using memvault::core::errors::is_error;
using memvault::core::logging::LogLevel;

memvault::core::errors::Result<AppOptions> parse_tokens(
    const std::vector<std::string>& tokens,
    const std::map<std::string, std::string>& env = {}) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("memvault");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    auto lookup = [&env](const std::string& name) -> std::optional<std::string> {
        const auto it = env.find(name);
        if (it == env.end()) {
            return std::nullopt;
        }
        return it->second;
    };
    return parse_and_validate(static_cast<int>(argv.size()), argv.data(), lookup);
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"serve", "--memory-dir"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"serve", "--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, ExecRequiresInput) {
    auto result = parse_tokens({"exec"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_input");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, ServeRejectsInput) {
    auto result = parse_tokens({"serve", "--input", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsOnInvalidLogLevel) {
    auto result = parse_tokens({"serve", "--log-level", "chatty"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, FailsWhenMemoryDirIsAFile) {
    const auto file = std::filesystem::current_path() /
                      (".tmp_cli_file_" + memvault::core::config::generate_session_id());
    {
        std::ofstream out(file);
        out << "x";
    }

    auto result = parse_tokens({"serve", "--memory-dir", file.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_memory_dir");

    std::error_code ec;
    std::filesystem::remove(file, ec);
}

TEST(CliParserTest, AppliesDefaults) {
    auto result = parse_tokens({"serve"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.mode, AppMode::Serve);
    EXPECT_EQ(options.log_level, LogLevel::INFO);
    EXPECT_TRUE(options.memory_dir.is_absolute());
    EXPECT_EQ(options.memory_dir.filename().string(), "memories");
    EXPECT_FALSE(options.audit_log.has_value());
    EXPECT_FALSE(options.input.has_value());
}

TEST(CliParserTest, ReadsEnvironmentFallbacks) {
    auto result = parse_tokens({"serve"}, {{"MEMORY_DIR", "/tmp/memvault_env_dir"},
                                           {"LOG_LEVEL", "DEBUG"}});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.memory_dir, std::filesystem::path("/tmp/memvault_env_dir"));
    EXPECT_EQ(options.log_level, LogLevel::DEBUG);
}

TEST(CliParserTest, FlagsOverrideEnvironment) {
    auto result = parse_tokens(
        {"exec", "--memory-dir", "/tmp/memvault_flag_dir", "--log-level", "warn",
         "--audit-log", "audit.jsonl", "--input", R"({"command":"view","path":"/memories"})"},
        {{"MEMORY_DIR", "/tmp/memvault_env_dir"}, {"LOG_LEVEL", "debug"}});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.mode, AppMode::Exec);
    EXPECT_EQ(options.memory_dir, std::filesystem::path("/tmp/memvault_flag_dir"));
    EXPECT_EQ(options.log_level, LogLevel::WARN);
    ASSERT_TRUE(options.audit_log.has_value());
    EXPECT_EQ(options.audit_log->string(), "audit.jsonl");
    ASSERT_TRUE(options.input.has_value());
}

}  // namespace
