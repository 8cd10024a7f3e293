#include "policy/path_guard.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace trustgate::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;

namespace {

// Matches the kernel's SYMLOOP_MAX on Linux.
constexpr int kMaxSymlinkHops = 40;

void push_components(std::vector<std::filesystem::path>& pending,
                     const std::filesystem::path& relative) {
    std::vector<std::filesystem::path> components(relative.begin(), relative.end());
    pending.insert(pending.end(), components.rbegin(), components.rend());
}

GuardError invalid_path(const std::string& input) {
    return GuardError{ErrorCategory::Input,
                      "Unable to resolve path: " + input, "invalid_path"};
}

}  // namespace

core::errors::Result<PathPolicy> PathPolicy::create(
    const std::filesystem::path& root) {
    std::error_code ec;
    if (root.empty() || !std::filesystem::exists(root, ec) || ec) {
        return GuardError{ErrorCategory::Input,
                          "Project root does not exist: " + root.string(),
                          "invalid_project_root"};
    }
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return GuardError{ErrorCategory::Input,
                          "Project root is not a directory: " + root.string(),
                          "invalid_project_root"};
    }

    const std::filesystem::path canonical_root = std::filesystem::canonical(root, ec);
    if (ec) {
        return GuardError{ErrorCategory::Input,
                          "Unable to resolve project root: " + root.string(),
                          "invalid_project_root"};
    }
    return PathPolicy(canonical_root);
}

bool PathGuard::is_within_root(const std::filesystem::path& root,
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

core::errors::Result<std::filesystem::path> PathGuard::canonicalize(
    const std::filesystem::path& candidate, const std::string& input) {
    // Components still to walk; back() is the next one.
    std::vector<std::filesystem::path> pending;
    push_components(pending, candidate.relative_path());

    std::filesystem::path resolved = candidate.root_path();
    int hops = 0;
    while (!pending.empty()) {
        const std::filesystem::path component = pending.back();
        pending.pop_back();
        if (component.empty() || component == ".") {
            continue;
        }
        // `resolved` never contains a symlink, so its parent is the real parent.
        if (component == "..") {
            resolved = resolved.parent_path();
            continue;
        }

        const std::filesystem::path next = resolved / component;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(next, ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            resolved = next;
            continue;
        }
        if (ec) {
            return invalid_path(input);
        }
        if (!std::filesystem::is_symlink(status)) {
            resolved = next;
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            return GuardError{ErrorCategory::Input,
                              "Too many levels of symbolic links: " + input,
                              "invalid_path"};
        }
        const std::filesystem::path target = std::filesystem::read_symlink(next, ec);
        if (ec) {
            return invalid_path(input);
        }
        if (target.is_absolute()) {
            resolved = target.root_path();
        }
        push_components(pending, target.relative_path());
    }
    return resolved;
}

core::errors::Result<std::filesystem::path> PathGuard::validate(
    const std::filesystem::path& candidate, const PathPolicy& policy) const {
    const std::string input = candidate.string();
    if (input.find('\0') != std::string::npos) {
        return GuardError{ErrorCategory::Input, "Path contains a NUL byte.",
                          "invalid_path"};
    }

    std::filesystem::path absolute = candidate;
    if (absolute.empty()) {
        absolute = policy.root();
    } else if (absolute.is_relative()) {
        absolute = policy.root() / absolute;
    }

    auto resolved = canonicalize(absolute, input);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path& canonical_candidate = core::errors::get_value(resolved);

    if (!is_within_root(policy.root(), canonical_candidate)) {
        // Report the caller's input, never the resolved form.
        return GuardError{ErrorCategory::Policy,
                          "Path escapes project root: " + input,
                          "path_outside_root",
                          "All paths must stay inside the project directory."};
    }

    return canonical_candidate;
}

core::errors::Result<std::filesystem::path> PathGuard::validate_directory(
    const std::filesystem::path& candidate, const PathPolicy& policy,
    const bool must_exist) const {
    auto validated = validate(candidate, policy);
    if (core::errors::is_error(validated) || !must_exist) {
        return validated;
    }

    const std::filesystem::path& directory = core::errors::get_value(validated);
    std::error_code ec;
    if (!std::filesystem::exists(directory, ec) || ec) {
        return GuardError{ErrorCategory::Input,
                          "Directory not found: " + candidate.string(),
                          "directory_not_found"};
    }
    if (!std::filesystem::is_directory(directory, ec) || ec) {
        return GuardError{ErrorCategory::Input,
                          "Not a directory: " + candidate.string(),
                          "not_a_directory"};
    }
    return validated;
}

}  // namespace trustgate::policy
