#include "session/security_audit_log.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

namespace trustgate::session {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

SecurityAuditLog::SecurityAuditLog(std::filesystem::path log_file, std::string session_id)
    : log_file_(std::move(log_file)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> SecurityAuditLog::record(
    const std::string& event, const json& payload) {
    if (event.empty()) {
        return GuardError{ErrorCategory::Input, "Audit event name cannot be empty.",
                          "invalid_audit_event"};
    }

    json line;
    line["ts_unix_ms"] = now_unix_ms();
    line["event"] = event;
    line["session_id"] = session_id_;
    line["payload"] = payload;
    // Invalid UTF-8 in command output must not make the dump throw.
    const std::string serialized = line.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (log_file_.has_parent_path()) {
        std::filesystem::create_directories(log_file_.parent_path(), ec);
        if (ec) {
            return GuardError{ErrorCategory::Internal,
                              "Unable to create audit directory: " +
                                  log_file_.parent_path().string(),
                              "audit_dir_create_failed"};
        }
    }

    std::ofstream out(log_file_, std::ios::app);
    if (!out.is_open()) {
        return GuardError{ErrorCategory::Internal,
                          "Unable to open audit log: " + log_file_.string(),
                          "audit_open_failed"};
    }

    out << serialized << "\n";
    if (!out.good()) {
        return GuardError{ErrorCategory::Internal,
                          "Unable to write audit event: " + log_file_.string(),
                          "audit_write_failed"};
    }
    return log_file_;
}

}  // namespace trustgate::session
