#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "policy/command_policy.hpp"
#include "policy/path_guard.hpp"
#include "protocol/execution_contract.hpp"
#include "secrets/secret_guard.hpp"
#include "secrets/secret_registry.hpp"
#include "tools/process_launcher.hpp"

namespace trustgate::session {
class SecurityAuditLog;
}

namespace trustgate::tools {

struct ExecutionLimits {
    std::chrono::milliseconds default_timeout = std::chrono::minutes(5);
    std::chrono::milliseconds max_timeout = std::chrono::hours(4);
};

// Mediates every subprocess the orchestration layer starts. Expected failure
// modes come back as ExecutionResult data; nothing here throws for them.
class CommandGuard {
public:
    CommandGuard(std::shared_ptr<const policy::CommandPolicy> command_policy,
                 policy::PathPolicy path_policy,
                 std::shared_ptr<const secrets::SecretRegistry> secrets,
                 std::shared_ptr<ProcessLauncher> launcher = nullptr,
                 ExecutionLimits limits = {},
                 std::shared_ptr<session::SecurityAuditLog> audit_log = nullptr);

    protocol::ExecutionResult execute(const protocol::ExecutionRequest& request) const;

    // Runs a project script with the policy's python entry.
    protocol::ExecutionResult run_python(
        const std::filesystem::path& script, const std::vector<std::string>& args = {},
        const std::filesystem::path& working_directory = ".",
        std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) const;

    // Whitelist decision only: no process, no filesystem access beyond
    // the argument hooks. Arguments are checked against the project root.
    bool is_allowed(const std::vector<std::string>& argv) const;

    // PATH lookup with the environment a child would receive.
    bool is_program_available(const std::string& program) const;

    // Swaps in a new registry snapshot; calls already in flight keep theirs.
    void refresh_secrets(std::shared_ptr<const secrets::SecretRegistry> secrets);
    std::shared_ptr<const secrets::SecretRegistry> secrets() const;

    const policy::PathPolicy& path_policy() const { return path_policy_; }
    const policy::CommandPolicy& command_policy() const { return *command_policy_; }

    // The environment handed to every child: a fixed base set plus the
    // shape's passthrough names plus the request's overrides.
    std::vector<std::string> child_environment(
        const policy::AllowedShape& shape,
        const protocol::ExecutionRequest& request) const;

private:
    std::chrono::milliseconds effective_timeout(std::chrono::milliseconds requested) const;
    protocol::ExecutionResult reject(const std::string& event, const std::string& message,
                                     const secrets::SecretRegistry& registry) const;

    std::shared_ptr<const policy::CommandPolicy> command_policy_;
    policy::PathPolicy path_policy_;
    std::shared_ptr<const secrets::SecretRegistry> secrets_;
    std::shared_ptr<ProcessLauncher> launcher_;
    ExecutionLimits limits_;
    std::shared_ptr<session::SecurityAuditLog> audit_log_;
    policy::PathGuard path_guard_;
    secrets::SecretGuard secret_guard_;
};

}  // namespace trustgate::tools
