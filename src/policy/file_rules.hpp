#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "core/errors/guard_errors.hpp"
#include "policy/path_guard.hpp"

namespace trustgate::policy {

enum class FileCategory {
    Image,
    Model,
    Config,
    Label,
    Script
};

struct FileRule {
    std::string name;
    std::set<std::string> extensions;  // lower case, with leading dot
    std::uintmax_t max_bytes = 0;
};

const FileRule& rule_for(FileCategory category);

// Containment, then extension, then size (size only once the file exists).
core::errors::Result<std::filesystem::path> validate_file(
    const PathGuard& guard, const PathPolicy& policy,
    const std::filesystem::path& candidate, FileCategory category);

// Replaces separators, NUL, reserved characters and ".." so the result is a
// single harmless path component.
std::string sanitize_filename(const std::string& filename);

// Joins sanitized components onto `base` and re-validates the result.
core::errors::Result<std::filesystem::path> safe_join(
    const PathGuard& guard, const PathPolicy& policy,
    const std::filesystem::path& base, const std::vector<std::string>& parts);

}  // namespace trustgate::policy
