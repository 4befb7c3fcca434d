#include "policy/path_resolver.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace memvault::policy {

using core::errors::ErrorKind;
using core::errors::MemoryError;

namespace {

std::filesystem::path normalize_root(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(root, ec);
    if (ec) {
        absolute = root;
    }
    absolute = absolute.lexically_normal();
    // "/sbx/" normalizes to "/sbx/" with an empty filename; drop it so that
    // component-wise comparisons line up.
    if (!absolute.has_filename() && absolute.has_relative_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

MemoryError invalid_path(const std::string& virtual_path, const std::string& reason,
                         const std::string& code) {
    return MemoryError{ErrorKind::InvalidPath,
                       "Invalid path '" + virtual_path + "': " + reason, code};
}

}  // namespace

PathResolver::PathResolver(std::filesystem::path sandbox_root,
                           std::string virtual_prefix)
    : sandbox_root_(normalize_root(sandbox_root)),
      virtual_prefix_(std::move(virtual_prefix)) {
    while (virtual_prefix_.size() > 1 && virtual_prefix_.back() == '/') {
        virtual_prefix_.pop_back();
    }
}

bool PathResolver::is_within_root(const std::filesystem::path& root,
                                  const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

bool PathResolver::is_root(const std::filesystem::path& real_path) const {
    return real_path.lexically_normal() == sandbox_root_;
}

std::string PathResolver::to_virtual(const std::filesystem::path& real_path) const {
    const auto relative = real_path.lexically_relative(sandbox_root_);
    if (relative.empty() || relative == ".") {
        return virtual_prefix_;
    }
    return virtual_prefix_ + "/" + relative.generic_string();
}

core::errors::Result<std::filesystem::path> PathResolver::resolve(
    const std::string& virtual_path, FinalLink final_link) const {
    if (virtual_path.find('\0') != std::string::npos) {
        return invalid_path(virtual_path, "contains a NUL byte", "invalid_character");
    }
    if (virtual_path.find('\\') != std::string::npos) {
        return invalid_path(virtual_path, "backslash separators are not allowed",
                            "invalid_character");
    }

    const bool has_prefix =
        virtual_path.compare(0, virtual_prefix_.size(), virtual_prefix_) == 0 &&
        (virtual_path.size() == virtual_prefix_.size() ||
         virtual_path[virtual_prefix_.size()] == '/');
    if (!has_prefix) {
        auto error = invalid_path(virtual_path,
                                  "must start with " + virtual_prefix_,
                                  "missing_virtual_prefix");
        error.hint = "Use paths like " + virtual_prefix_ + "/notes.txt";
        return error;
    }

    // Segment-wise walk: empty segments (from "//") and "." vanish, ".."
    // pops, and popping past the root is rejected instead of clamped.
    std::vector<std::string> segments;
    const std::string remainder = virtual_path.substr(virtual_prefix_.size());
    std::size_t begin = 0;
    while (begin <= remainder.size()) {
        std::size_t end = remainder.find('/', begin);
        if (end == std::string::npos) {
            end = remainder.size();
        }
        const std::string segment = remainder.substr(begin, end - begin);
        begin = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return invalid_path(virtual_path, "escapes the memory directory",
                                    "path_outside_sandbox");
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::filesystem::path candidate = sandbox_root_;
    for (const auto& segment : segments) {
        candidate /= segment;
    }

    // Symlinks inside the tree may still point elsewhere; compare physical
    // locations as well.
    std::error_code ec;
    const auto canonical_root = std::filesystem::weakly_canonical(sandbox_root_, ec);
    if (ec) {
        return MemoryError{ErrorKind::Io,
                           "Unable to resolve memory directory for '" + virtual_path +
                               "': " + ec.message(),
                           "root_unresolvable"};
    }
    // In NoFollow mode only the parent chain is canonicalized; the last
    // component is taken as-is.
    const bool keep_final = final_link == FinalLink::NoFollow && !segments.empty();
    auto canonical_candidate = std::filesystem::weakly_canonical(
        keep_final ? candidate.parent_path() : candidate, ec);
    if (!ec && keep_final) {
        canonical_candidate /= candidate.filename();
    }
    if (ec) {
        return MemoryError{ErrorKind::Io,
                           "Unable to resolve path '" + virtual_path + "': " +
                               ec.message(),
                           "path_unresolvable"};
    }
    if (!is_within_root(canonical_root, canonical_candidate)) {
        return invalid_path(virtual_path, "escapes the memory directory",
                            "path_outside_sandbox");
    }

    return candidate;
}

}  // namespace memvault::policy
