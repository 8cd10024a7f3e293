#include "session/guard_session.hpp"

#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace trustgate::session {

using core::errors::ErrorCategory;
using core::errors::GuardError;

GuardSession::GuardSession(std::string session_id, SessionConfig config,
                           secrets::EnvLookup lookup, tools::CommandGuard commands,
                           std::shared_ptr<SecurityAuditLog> audit_log)
    : session_id_(std::move(session_id)),
      config_(std::move(config)),
      lookup_(std::move(lookup)),
      commands_(std::move(commands)),
      audit_log_(std::move(audit_log)) {}

core::errors::Result<GuardSession> GuardSession::create(
    const SessionConfig& config, secrets::EnvLookup lookup,
    std::shared_ptr<tools::ProcessLauncher> launcher) {
    if (!config.command_policy) {
        return GuardError{ErrorCategory::Config, "Session has no command policy.",
                          "missing_command_policy"};
    }
    if (!lookup) {
        lookup = secrets::process_environment;
    }

    auto path_policy = policy::PathPolicy::create(config.project_root);
    if (core::errors::is_error(path_policy)) {
        return core::errors::get_error(path_policy);
    }
    const policy::PathPolicy& root = core::errors::get_value(path_policy);

    const std::string session_id = core::config::generate_session_id();
    auto& logger = core::logging::Logger::get();
    logger.set_session_id(session_id);
    logger.set_min_level(config.log_level);

    std::shared_ptr<SecurityAuditLog> audit_log;
    if (config.audit_log.has_value()) {
        auto audit_path = policy::PathGuard().validate(*config.audit_log, root);
        if (core::errors::is_error(audit_path)) {
            const auto& error = core::errors::get_error(audit_path);
            return GuardError{ErrorCategory::Config,
                              "Audit log must live inside the project root: " +
                                  config.audit_log->string(),
                              "invalid_audit_log", error.message};
        }
        audit_log = std::make_shared<SecurityAuditLog>(core::errors::get_value(audit_path),
                                                       session_id);
    }

    auto secrets = secrets::SecretRegistry::from_environment(config.secret_env_vars, lookup);

    tools::ExecutionLimits limits;
    limits.default_timeout = config.default_timeout;
    limits.max_timeout = config.max_timeout;

    tools::CommandGuard commands(config.command_policy, root, std::move(secrets),
                                 std::move(launcher), limits, audit_log);

    LOG_INFO("Guard session started for " + root.root().string() + " (" +
             std::to_string(config.command_policy->size()) + " programs allowed)");

    return GuardSession(session_id, config, std::move(lookup), std::move(commands),
                        std::move(audit_log));
}

core::errors::Result<std::filesystem::path> GuardSession::validate_path(
    const std::filesystem::path& candidate) const {
    auto validated = path_guard_.validate(candidate, path_policy());
    if (core::errors::is_error(validated)) {
        const auto& error = core::errors::get_error(validated);
        LOG_WARN("Security violation: " + redact(error.message));
        if (audit_log_) {
            auto recorded = audit_log_->record(
                "path_rejected", {{"code", error.code}, {"message", redact(error.message)}});
            if (core::errors::is_error(recorded)) {
                LOG_ERROR("Audit log write failed: " +
                          core::errors::get_error(recorded).message);
            }
        }
    }
    return validated;
}

std::string GuardSession::redact(const std::string& text) const {
    const auto snapshot = commands_.secrets();
    return secret_guard_.redact(text, *snapshot);
}

void GuardSession::refresh_secrets() {
    commands_.refresh_secrets(
        secrets::SecretRegistry::from_environment(config_.secret_env_vars, lookup_));
    LOG_DEBUG("Secret snapshot refreshed");
}

}  // namespace trustgate::session
