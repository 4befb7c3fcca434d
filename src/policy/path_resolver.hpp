#pragma once

#include <filesystem>
#include <string>
#include "core/errors/memory_errors.hpp"

namespace memvault::policy {

inline constexpr const char* kDefaultVirtualPrefix = "/memories";

// Maps caller-facing virtual paths ("/memories/notes.txt") onto real paths
// under a single sandbox root. Every filesystem access goes through
// resolve() first. Resolution never touches the filesystem beyond reading
// symlink targets.
class PathResolver {
public:
    // Whether a symlink in the last path component is followed for the
    // containment check. Operations that act on the entry itself (delete,
    // rename) use NoFollow so that an escaping link can still be removed.
    enum class FinalLink { Follow, NoFollow };

    explicit PathResolver(std::filesystem::path sandbox_root,
                          std::string virtual_prefix = kDefaultVirtualPrefix);

    // Returns an absolute path at or below the sandbox root, or InvalidPath.
    core::errors::Result<std::filesystem::path> resolve(
        const std::string& virtual_path,
        FinalLink final_link = FinalLink::Follow) const;

    // Inverse of resolve() for paths already known to be inside the root.
    std::string to_virtual(const std::filesystem::path& real_path) const;

    bool is_root(const std::filesystem::path& real_path) const;

    const std::filesystem::path& sandbox_root() const { return sandbox_root_; }
    const std::string& virtual_prefix() const { return virtual_prefix_; }

    // Component-wise prefix test on already-normalized paths.
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

private:
    std::filesystem::path sandbox_root_;
    std::string virtual_prefix_;
};

}  // namespace memvault::policy
