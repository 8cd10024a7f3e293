#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/guard_errors.hpp"
#include "policy/path_guard.hpp"
#include "secrets/secret_guard.hpp"
#include "secrets/secret_registry.hpp"
#include "session/security_audit_log.hpp"
#include "session/session_config.hpp"
#include "tools/command_guard.hpp"
#include "tools/process_launcher.hpp"

namespace trustgate::session {

// Everything one project session needs to cross the trust boundary: the
// confined root, the command whitelist and the current secret snapshot.
class GuardSession {
public:
    static core::errors::Result<GuardSession> create(
        const SessionConfig& config,
        secrets::EnvLookup lookup = secrets::process_environment,
        std::shared_ptr<tools::ProcessLauncher> launcher = nullptr);

    const std::string& session_id() const { return session_id_; }
    const policy::PathPolicy& path_policy() const { return commands_.path_policy(); }
    const tools::CommandGuard& commands() const { return commands_; }
    tools::CommandGuard& commands() { return commands_; }
    std::shared_ptr<SecurityAuditLog> audit_log() const { return audit_log_; }

    core::errors::Result<std::filesystem::path> validate_path(
        const std::filesystem::path& candidate) const;

    std::string redact(const std::string& text) const;

    // Re-reads the configured secret variables and swaps the snapshot.
    void refresh_secrets();

private:
    GuardSession(std::string session_id, SessionConfig config, secrets::EnvLookup lookup,
                 tools::CommandGuard commands, std::shared_ptr<SecurityAuditLog> audit_log);

    std::string session_id_;
    SessionConfig config_;
    secrets::EnvLookup lookup_;
    tools::CommandGuard commands_;
    std::shared_ptr<SecurityAuditLog> audit_log_;
    policy::PathGuard path_guard_;
    secrets::SecretGuard secret_guard_;
};

}  // namespace trustgate::session
