#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/guard_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/command_policy.hpp"

namespace trustgate::session {

struct SessionConfig {
    std::filesystem::path project_root = std::filesystem::current_path();
    std::chrono::milliseconds default_timeout = std::chrono::minutes(5);
    std::chrono::milliseconds max_timeout = std::chrono::hours(4);
    std::vector<std::string> secret_env_vars;
    std::shared_ptr<const policy::CommandPolicy> command_policy;
    std::optional<std::filesystem::path> audit_log;  // relative to project_root
    core::logging::LogLevel log_level = core::logging::LogLevel::INFO;

    // Built-in whitelist and secret variable names.
    static SessionConfig defaults();
};

// A relative "project_root" in the document resolves against `base_dir`.
core::errors::Result<SessionConfig> parse_session_config(
    const std::string& json_text, const std::filesystem::path& base_dir);

core::errors::Result<SessionConfig> load_session_config(const std::filesystem::path& file);

}  // namespace trustgate::session
