#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace trustgate::protocol {

enum class FailureKind {
    NotAllowed,
    TimedOut,
    NonZeroExit,
    SpawnFailed
};

inline std::string to_string(const FailureKind kind) {
    switch (kind) {
        case FailureKind::NotAllowed:
            return "not_allowed";
        case FailureKind::TimedOut:
            return "timed_out";
        case FailureKind::NonZeroExit:
            return "non_zero_exit";
        case FailureKind::SpawnFailed:
            return "spawn_failed";
        default:
            return "unknown";
    }
}

// A zero timeout means "use the session default".
class ExecutionRequest {
public:
    explicit ExecutionRequest(std::vector<std::string> argv,
                              std::filesystem::path working_directory = ".",
                              std::chrono::milliseconds timeout = std::chrono::milliseconds(0),
                              bool capture_output = true)
        : argv_(std::move(argv)),
          working_directory_(std::move(working_directory)),
          timeout_(timeout),
          capture_output_(capture_output) {
        if (argv_.empty() || argv_.front().empty()) {
            throw std::invalid_argument("ExecutionRequest requires a non-empty argv");
        }
    }

    const std::vector<std::string>& argv() const { return argv_; }
    const std::string& program() const { return argv_.front(); }
    const std::filesystem::path& working_directory() const { return working_directory_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    bool capture_output() const { return capture_output_; }

    // Extra, non-secret variables for the child. Applied after the base set.
    const std::map<std::string, std::string>& environment() const { return environment_; }
    ExecutionRequest& with_env(const std::string& name, const std::string& value) {
        environment_[name] = value;
        return *this;
    }

private:
    std::vector<std::string> argv_;
    std::filesystem::path working_directory_;
    std::chrono::milliseconds timeout_;
    bool capture_output_;
    std::map<std::string, std::string> environment_;
};

// Outcome of one guarded execution. stdout/stderr/message are always redacted.
class ExecutionResult {
public:
    static ExecutionResult completed(int exit_code, std::string stdout_text,
                                     std::string stderr_text,
                                     std::chrono::milliseconds duration,
                                     bool output_truncated = false) {
        ExecutionResult result;
        result.exit_code_ = exit_code;
        result.succeeded_ = exit_code == 0;
        if (!result.succeeded_) {
            result.failure_kind_ = FailureKind::NonZeroExit;
            result.message_ = "Command failed with exit code " + std::to_string(exit_code);
        }
        result.stdout_ = std::move(stdout_text);
        result.stderr_ = std::move(stderr_text);
        result.duration_ = duration;
        result.output_truncated_ = output_truncated;
        return result;
    }

    static ExecutionResult failed(FailureKind kind, std::string message,
                                  std::string stdout_text = "", std::string stderr_text = "",
                                  std::chrono::milliseconds duration = std::chrono::milliseconds(0),
                                  bool output_truncated = false) {
        ExecutionResult result;
        result.failure_kind_ = kind;
        result.message_ = std::move(message);
        result.stdout_ = std::move(stdout_text);
        result.stderr_ = std::move(stderr_text);
        result.duration_ = duration;
        result.output_truncated_ = output_truncated;
        return result;
    }

    bool succeeded() const { return succeeded_; }
    const std::optional<int>& exit_code() const { return exit_code_; }
    const std::optional<FailureKind>& failure_kind() const { return failure_kind_; }
    const std::string& stdout_text() const { return stdout_; }
    const std::string& stderr_text() const { return stderr_; }
    const std::string& message() const { return message_; }
    std::chrono::milliseconds duration() const { return duration_; }
    bool output_truncated() const { return output_truncated_; }

private:
    ExecutionResult() = default;

    bool succeeded_ = false;
    std::optional<int> exit_code_;
    std::optional<FailureKind> failure_kind_;
    std::string stdout_;
    std::string stderr_;
    std::string message_;
    std::chrono::milliseconds duration_{0};
    bool output_truncated_ = false;
};

}  // namespace trustgate::protocol
