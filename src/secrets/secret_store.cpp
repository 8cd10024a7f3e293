#include "secrets/secret_store.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace trustgate::secrets {

using core::errors::ErrorCategory;
using core::errors::GuardError;

namespace {

constexpr std::size_t kMinVfrogKeyLength = 20;

const std::map<std::string, std::string>& service_env_map() {
    static const std::map<std::string, std::string> kServices = {
        {"vfrog", "VFROG_API_KEY"},       {"modal", "MODAL_TOKEN_ID"},
        {"wandb", "WANDB_API_KEY"},       {"openai", "OPENAI_API_KEY"},
        {"anthropic", "ANTHROPIC_API_KEY"},
    };
    return kServices;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string uppercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

}  // namespace

SecretStore::SecretStore(EnvLookup lookup) : lookup_(std::move(lookup)) {}

std::string SecretStore::env_var_for(const std::string& service) {
    const auto& services = service_env_map();
    const auto it = services.find(lowercase(service));
    if (it != services.end()) {
        return it->second;
    }
    return uppercase(service);
}

std::string SecretStore::setup_instructions(const std::string& service) {
    const std::string key = lowercase(service);
    if (key == "vfrog") {
        return "To set up vfrog.ai:\n"
               "1. Sign up at https://vfrog.ai\n"
               "2. Go to Settings > API Keys\n"
               "3. Create a new API key\n"
               "4. Run: export VFROG_API_KEY=your_key_here";
    }
    if (key == "modal") {
        return "To set up Modal.com:\n"
               "1. Sign up at https://modal.com\n"
               "2. Install: pip install modal\n"
               "3. Run: modal token new\n"
               "This will automatically configure your token.";
    }
    if (key == "wandb") {
        return "To set up Weights & Biases:\n"
               "1. Sign up at https://wandb.ai\n"
               "2. Go to Settings > API Keys\n"
               "3. Copy your API key\n"
               "4. Run: export WANDB_API_KEY=your_key_here\n"
               "   Or: wandb login";
    }
    return "Unknown service: " + service;
}

core::errors::Result<bool> SecretStore::validate_vfrog_key(const std::string& key) {
    if (key.empty()) {
        return GuardError{ErrorCategory::Input, "VFROG_API_KEY cannot be empty.",
                          "empty_secret"};
    }
    if (key.size() < kMinVfrogKeyLength) {
        return GuardError{ErrorCategory::Input,
                          "Invalid VFROG_API_KEY format: key too short.",
                          "invalid_secret_format",
                          "Get your key at https://vfrog.ai/settings/api"};
    }
    if (key.rfind("sk-", 0) == 0) {
        return GuardError{ErrorCategory::Input,
                          "This looks like an OpenAI key, not a vfrog key.",
                          "invalid_secret_format",
                          "Get your vfrog key at https://vfrog.ai/settings/api"};
    }
    return true;
}

std::optional<std::string> SecretStore::get(const std::string& service) const {
    auto value = lookup_(env_var_for(service));
    if (value.has_value() && value->empty()) {
        return std::nullopt;
    }
    return value;
}

core::errors::Result<std::string> SecretStore::require(const std::string& service,
                                                       const std::string& purpose) const {
    auto value = get(service);
    if (!value.has_value()) {
        return GuardError{ErrorCategory::Config,
                          env_var_for(service) + " is required" +
                              (purpose.empty() ? std::string() : " for " + purpose) + ".",
                          "missing_secret", setup_instructions(service)};
    }
    return *value;
}

core::errors::Result<std::optional<std::string>> SecretStore::vfrog_key() const {
    auto key = get("vfrog");
    if (key.has_value()) {
        auto valid = validate_vfrog_key(*key);
        if (core::errors::is_error(valid)) {
            return core::errors::get_error(valid);
        }
    }
    return key;
}

std::map<std::string, bool> SecretStore::environment_status() const {
    return {
        {"vfrog", get("vfrog").has_value()},
        {"modal", get("modal").has_value()},
        {"wandb", get("wandb").has_value()},
    };
}

std::vector<std::string> SecretStore::default_secret_env_vars() {
    return {"VFROG_API_KEY", "MODAL_TOKEN_ID", "MODAL_TOKEN_SECRET",
            "WANDB_API_KEY", "OPENAI_API_KEY", "ANTHROPIC_API_KEY"};
}

}  // namespace trustgate::secrets
