#pragma once

#include <filesystem>
#include <string>
#include "core/errors/guard_errors.hpp"

namespace trustgate::policy {

// The directory a project session is confined to. The root is canonical
// (symlink-resolved) and fixed for the lifetime of the policy.
class PathPolicy {
public:
    static core::errors::Result<PathPolicy> create(
        const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

private:
    explicit PathPolicy(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path root_;
};

class PathGuard {
public:
    // Canonicalizes `candidate` (relative paths are taken from the root) and
    // checks containment. Callers must do their I/O on the returned path.
    core::errors::Result<std::filesystem::path> validate(
        const std::filesystem::path& candidate, const PathPolicy& policy) const;

    core::errors::Result<std::filesystem::path> validate_directory(
        const std::filesystem::path& candidate, const PathPolicy& policy,
        bool must_exist = true) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

private:
    static core::errors::Result<std::filesystem::path> canonicalize(
        const std::filesystem::path& candidate, const std::string& input);
};

}  // namespace trustgate::policy
