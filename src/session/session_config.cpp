#include "session/session_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "policy/policy_loader.hpp"
#include "secrets/secret_store.hpp"

namespace trustgate::session {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using nlohmann::json;

namespace {

GuardError config_error(const std::string& message, const std::string& code,
                        const std::string& hint = "") {
    return GuardError{ErrorCategory::Config, message, code, hint};
}

core::errors::Result<std::chrono::milliseconds> read_timeout(const json& document,
                                                             const std::string& key,
                                                             std::chrono::milliseconds fallback) {
    if (!document.contains(key)) {
        return fallback;
    }
    const auto& value = document.at(key);
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        return config_error(key + " must be a positive integer.", "invalid_timeout");
    }
    return std::chrono::milliseconds(value.get<long long>());
}

core::errors::Result<std::string> read_string(const json& document, const std::string& key) {
    const auto& value = document.at(key);
    if (!value.is_string()) {
        return config_error(key + " must be a string.", "invalid_config_value");
    }
    return value.get<std::string>();
}

}  // namespace

SessionConfig SessionConfig::defaults() {
    SessionConfig config;
    config.secret_env_vars = secrets::SecretStore::default_secret_env_vars();
    config.command_policy = policy::default_command_policy();
    return config;
}

core::errors::Result<SessionConfig> parse_session_config(
    const std::string& json_text, const std::filesystem::path& base_dir) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Session configuration is not valid JSON.", "invalid_json");
    }
    if (!document.is_object()) {
        return config_error("Session configuration must be a JSON object.", "invalid_json");
    }

    SessionConfig config = SessionConfig::defaults();

    if (document.contains("project_root")) {
        auto root = read_string(document, "project_root");
        if (core::errors::is_error(root)) {
            return core::errors::get_error(root);
        }
        std::filesystem::path root_path(core::errors::get_value(root));
        config.project_root = root_path.is_relative() ? base_dir / root_path : root_path;
    } else {
        config.project_root = base_dir;
    }

    auto default_timeout = read_timeout(document, "default_timeout_ms", config.default_timeout);
    if (core::errors::is_error(default_timeout)) {
        return core::errors::get_error(default_timeout);
    }
    config.default_timeout = core::errors::get_value(default_timeout);

    auto max_timeout = read_timeout(document, "max_timeout_ms", config.max_timeout);
    if (core::errors::is_error(max_timeout)) {
        return core::errors::get_error(max_timeout);
    }
    config.max_timeout = core::errors::get_value(max_timeout);

    if (config.default_timeout > config.max_timeout) {
        return config_error("default_timeout_ms cannot exceed max_timeout_ms.",
                            "invalid_timeout");
    }

    if (document.contains("secret_env_vars")) {
        const auto& names = document.at("secret_env_vars");
        if (!names.is_array()) {
            return config_error("secret_env_vars must be an array of strings.",
                                "invalid_config_value");
        }
        config.secret_env_vars.clear();
        for (const auto& name : names) {
            if (!name.is_string() || name.get<std::string>().empty()) {
                return config_error("secret_env_vars must be an array of strings.",
                                    "invalid_config_value");
            }
            config.secret_env_vars.push_back(name.get<std::string>());
        }
    }

    if (document.contains("commands")) {
        auto policy = policy::command_policy_from_json(document.at("commands"));
        if (core::errors::is_error(policy)) {
            return core::errors::get_error(policy);
        }
        config.command_policy = core::errors::get_value(policy);
    }

    if (document.contains("audit_log")) {
        auto audit_log = read_string(document, "audit_log");
        if (core::errors::is_error(audit_log)) {
            return core::errors::get_error(audit_log);
        }
        config.audit_log = std::filesystem::path(core::errors::get_value(audit_log));
    }

    if (document.contains("log_level")) {
        auto level = read_string(document, "log_level");
        if (core::errors::is_error(level)) {
            return core::errors::get_error(level);
        }
        if (!core::logging::Logger::parse_level(core::errors::get_value(level),
                                                config.log_level)) {
            return config_error("Unknown log_level: " + core::errors::get_value(level),
                                "invalid_log_level", "Use debug, info, warn or error.");
        }
    }

    return config;
}

core::errors::Result<SessionConfig> load_session_config(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return config_error("Unable to open session configuration: " + file.string(),
                            "config_open_failed");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return config_error("I/O error while reading session configuration: " + file.string(),
                            "config_read_failed");
    }

    std::filesystem::path base_dir = file.parent_path();
    if (base_dir.empty()) {
        base_dir = std::filesystem::current_path();
    }
    return parse_session_config(buffer.str(), base_dir);
}

}  // namespace trustgate::session
