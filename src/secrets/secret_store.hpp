#pragma once

#include <map>
#include <optional>
#include <string>
#include "core/errors/guard_errors.hpp"
#include "secrets/secret_registry.hpp"

namespace trustgate::secrets {

// Credentials are only ever read from the environment, never from files.
class SecretStore {
public:
    explicit SecretStore(EnvLookup lookup = process_environment);

    // Known services map to their variable ("modal" -> MODAL_TOKEN_ID);
    // anything else is upper-cased and used as the variable name.
    static std::string env_var_for(const std::string& service);
    static std::string setup_instructions(const std::string& service);
    static core::errors::Result<bool> validate_vfrog_key(const std::string& key);

    std::optional<std::string> get(const std::string& service) const;
    core::errors::Result<std::string> require(const std::string& service,
                                              const std::string& purpose = "") const;
    core::errors::Result<std::optional<std::string>> vfrog_key() const;

    // service -> whether its variable is set and non-empty
    std::map<std::string, bool> environment_status() const;

    // Variable names that populate a SecretRegistry by default.
    static std::vector<std::string> default_secret_env_vars();

private:
    EnvLookup lookup_;
};

}  // namespace trustgate::secrets
