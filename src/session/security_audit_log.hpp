#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/guard_errors.hpp"

namespace trustgate::session {

// Append-only JSON-lines record of security violations and execution
// failures. Payload strings must already be redacted.
class SecurityAuditLog {
public:
    explicit SecurityAuditLog(std::filesystem::path log_file, std::string session_id = "");

    core::errors::Result<std::filesystem::path> record(const std::string& event,
                                                       const nlohmann::json& payload);

    const std::filesystem::path& log_file() const { return log_file_; }

private:
    std::filesystem::path log_file_;
    std::string session_id_;
    std::mutex mutex_;
};

}  // namespace trustgate::session
