#pragma once

#include <filesystem>
#include <string>
#include "core/errors/memory_errors.hpp"
#include "policy/path_resolver.hpp"
#include "protocol/audit_record.hpp"
#include "protocol/memory_command.hpp"

namespace memvault::tools {

// Executes memory commands against a directory tree rooted at the sandbox
// root. Holds no state between calls beyond its configuration: every
// command re-resolves its paths and re-reads what it needs.
class MemoryInterpreter {
public:
    explicit MemoryInterpreter(std::filesystem::path sandbox_root,
                               std::string virtual_prefix = policy::kDefaultVirtualPrefix,
                               protocol::AuditObserver observer = nullptr);

    // Success yields the text relayed to the agent; failures carry an ErrorKind.
    core::errors::Result<std::string> execute(
        const protocol::MemoryCommand& command) const;

    const policy::PathResolver& resolver() const { return resolver_; }

private:
    friend struct CommandDispatcher;

    core::errors::Result<std::string> view(const protocol::ViewCommand& command) const;
    core::errors::Result<std::string> create(const protocol::CreateCommand& command) const;
    core::errors::Result<std::string> str_replace(
        const protocol::StrReplaceCommand& command) const;
    core::errors::Result<std::string> insert(const protocol::InsertCommand& command) const;
    core::errors::Result<std::string> remove(const protocol::DeleteCommand& command) const;
    core::errors::Result<std::string> rename(const protocol::RenameCommand& command) const;

    core::errors::Result<std::filesystem::path> ensure_root() const;

    policy::PathResolver resolver_;
    protocol::AuditObserver observer_;
};

}  // namespace memvault::tools
