#include "tools/command_guard.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "session/security_audit_log.hpp"

namespace trustgate::tools {

using protocol::ExecutionRequest;
using protocol::ExecutionResult;
using protocol::FailureKind;

namespace {

constexpr std::size_t kLogExcerptBytes = 500;
constexpr const char* kDefaultChildPath = "/usr/local/bin:/usr/bin:/bin";

const std::vector<std::string>& base_environment_names() {
    static const std::vector<std::string> kNames = {"PATH", "HOME",   "LANG", "LC_ALL",
                                                    "TZ",   "TMPDIR", "USER"};
    return kNames;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string joined;
    for (const auto& token : tokens) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += token;
    }
    return joined;
}

void write_audit(const std::shared_ptr<session::SecurityAuditLog>& audit_log,
                 const std::string& event, const nlohmann::json& payload) {
    if (!audit_log) {
        return;
    }
    auto recorded = audit_log->record(event, payload);
    if (core::errors::is_error(recorded)) {
        const auto& err = core::errors::get_error(recorded);
        LOG_ERROR("Failed to write audit event [" + err.code + "]: " + err.message);
    }
}

std::string excerpt(const std::string& text) {
    if (text.size() <= kLogExcerptBytes) {
        return text;
    }
    return text.substr(0, kLogExcerptBytes) + "...";
}

}  // namespace

CommandGuard::CommandGuard(std::shared_ptr<const policy::CommandPolicy> command_policy,
                           policy::PathPolicy path_policy,
                           std::shared_ptr<const secrets::SecretRegistry> secrets,
                           std::shared_ptr<ProcessLauncher> launcher,
                           const ExecutionLimits limits,
                           std::shared_ptr<session::SecurityAuditLog> audit_log)
    : command_policy_(std::move(command_policy)),
      path_policy_(std::move(path_policy)),
      secrets_(std::move(secrets)),
      launcher_(std::move(launcher)),
      limits_(limits),
      audit_log_(std::move(audit_log)) {
    if (!command_policy_) {
        command_policy_ = policy::CommandPolicy::Builder().build();
    }
    if (!secrets_) {
        secrets_ = std::make_shared<const secrets::SecretRegistry>();
    }
    if (!launcher_) {
        launcher_ = std::make_shared<PosixProcessLauncher>();
    }
}

void CommandGuard::refresh_secrets(std::shared_ptr<const secrets::SecretRegistry> secrets) {
    if (!secrets) {
        secrets = std::make_shared<const secrets::SecretRegistry>();
    }
    std::atomic_store(&secrets_, std::move(secrets));
}

std::shared_ptr<const secrets::SecretRegistry> CommandGuard::secrets() const {
    return std::atomic_load(&secrets_);
}

std::chrono::milliseconds CommandGuard::effective_timeout(
    const std::chrono::milliseconds requested) const {
    if (requested <= std::chrono::milliseconds::zero()) {
        return limits_.default_timeout;
    }
    return std::min(requested, limits_.max_timeout);
}

std::vector<std::string> CommandGuard::child_environment(
    const policy::AllowedShape& shape, const ExecutionRequest& request) const {
    std::map<std::string, std::string> values;
    for (const auto& name : base_environment_names()) {
        if (auto value = secrets::process_environment(name)) {
            values[name] = *value;
        }
    }
    if (values.count("PATH") == 0) {
        values["PATH"] = kDefaultChildPath;
    }

    for (const auto& name : shape.passthrough_env) {
        if (auto value = secrets::process_environment(name)) {
            values[name] = *value;
        }
    }

    for (const auto& entry : request.environment()) {
        // Program resolution must not be steerable by the request.
        if (entry.first == "PATH" || entry.first.empty() ||
            entry.first.find('=') != std::string::npos) {
            LOG_WARN("Ignoring environment override: " + entry.first);
            continue;
        }
        values[entry.first] = entry.second;
    }

    std::vector<std::string> environment;
    environment.reserve(values.size());
    for (const auto& entry : values) {
        environment.push_back(entry.first + "=" + entry.second);
    }
    return environment;
}

ExecutionResult CommandGuard::reject(const std::string& event, const std::string& message,
                                     const secrets::SecretRegistry& registry) const {
    const std::string redacted = secret_guard_.redact(message, registry);
    LOG_WARN("Security violation: " + redacted);
    write_audit(audit_log_, event, nlohmann::json{{"message", redacted}});
    return ExecutionResult::failed(FailureKind::NotAllowed, redacted);
}

ExecutionResult CommandGuard::execute(const ExecutionRequest& request) const {
    // One registry snapshot for the whole call.
    const std::shared_ptr<const secrets::SecretRegistry> registry = secrets();
    const auto& argv = request.argv();

    const policy::AllowedShape* shape = command_policy_->find(request.program());
    if (shape == nullptr) {
        return reject("command_rejected", "Command not allowed: '" + request.program() + "'",
                      *registry);
    }

    auto validated_cwd =
        path_guard_.validate_directory(request.working_directory(), path_policy_);
    if (core::errors::is_error(validated_cwd)) {
        return reject("path_rejected",
                      "Working directory rejected for '" + request.program() +
                          "': " + core::errors::get_error(validated_cwd).message,
                      *registry);
    }
    const std::filesystem::path& working_directory = core::errors::get_value(validated_cwd);

    const policy::ArgumentContext context{path_guard_, path_policy_, working_directory};
    const policy::CommandCheck check = command_policy_->check(argv, context);
    if (!check.allowed) {
        return reject("command_rejected", check.describe(), *registry);
    }

    LaunchSpec spec;
    spec.argv = argv;
    spec.working_directory = working_directory;
    spec.environment = child_environment(*shape, request);
    spec.timeout = effective_timeout(request.timeout());
    spec.capture_output = request.capture_output();

    const std::string command_line = secret_guard_.redact(join_tokens(argv), *registry);
    LOG_INFO("Running: " + command_line);

    const ProcessOutcome outcome = launcher_->launch(spec);
    std::string stdout_text = secret_guard_.redact(outcome.stdout_text, *registry);
    std::string stderr_text = secret_guard_.redact(outcome.stderr_text, *registry);
    if (!stdout_text.empty()) {
        LOG_DEBUG("stdout: " + excerpt(stdout_text));
    }
    if (!stderr_text.empty()) {
        LOG_DEBUG("stderr: " + excerpt(stderr_text));
    }

    switch (outcome.state) {
        case ProcessOutcome::State::SpawnFailed: {
            const std::string message = secret_guard_.redact(outcome.spawn_error, *registry);
            LOG_INFO("Spawn failed for '" + request.program() + "': " + message);
            write_audit(audit_log_, "spawn_failed",
                        nlohmann::json{{"command", command_line}, {"message", message}});
            return ExecutionResult::failed(FailureKind::SpawnFailed, message,
                                           std::move(stdout_text), std::move(stderr_text),
                                           outcome.duration, outcome.output_truncated);
        }
        case ProcessOutcome::State::TimedOut: {
            const std::string message = "Command timed out after " +
                                        std::to_string(spec.timeout.count()) +
                                        "ms: " + request.program();
            LOG_INFO(message);
            write_audit(audit_log_, "command_timed_out",
                        nlohmann::json{{"command", command_line},
                                       {"timeout_ms", spec.timeout.count()}});
            return ExecutionResult::failed(FailureKind::TimedOut, message,
                                           std::move(stdout_text), std::move(stderr_text),
                                           outcome.duration, outcome.output_truncated);
        }
        case ProcessOutcome::State::Exited:
            break;
    }

    if (outcome.exit_code != 0) {
        LOG_INFO("Command exited with code " + std::to_string(outcome.exit_code) + ": " +
                 request.program());
    }
    return ExecutionResult::completed(outcome.exit_code, std::move(stdout_text),
                                      std::move(stderr_text), outcome.duration,
                                      outcome.output_truncated);
}

ExecutionResult CommandGuard::run_python(const std::filesystem::path& script,
                                         const std::vector<std::string>& args,
                                         const std::filesystem::path& working_directory,
                                         const std::chrono::milliseconds timeout) const {
    const auto registry = secrets();
    auto validated = path_guard_.validate(script, path_policy_);
    if (core::errors::is_error(validated)) {
        return reject("path_rejected", core::errors::get_error(validated).message, *registry);
    }
    const std::filesystem::path& script_path = core::errors::get_value(validated);

    if (script.extension() != ".py") {
        return reject("command_rejected", "Script must be a .py file: " + script.string(),
                      *registry);
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(script_path, ec) || ec) {
        return ExecutionResult::failed(
            FailureKind::SpawnFailed,
            secret_guard_.redact("Script not found: " + script.string(), *registry));
    }

    std::vector<std::string> argv = {"python", script_path.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    return execute(ExecutionRequest(std::move(argv), working_directory, timeout));
}

bool CommandGuard::is_allowed(const std::vector<std::string>& argv) const {
    const policy::ArgumentContext context{path_guard_, path_policy_, path_policy_.root()};
    return command_policy_->check(argv, context).allowed;
}

bool CommandGuard::is_program_available(const std::string& program) const {
    const auto path = secrets::process_environment("PATH");
    return PosixProcessLauncher::resolve_executable(program, path.value_or(kDefaultChildPath))
        .has_value();
}

}  // namespace trustgate::tools
