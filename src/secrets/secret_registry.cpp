#include "secrets/secret_registry.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace trustgate::secrets {

std::optional<std::string> process_environment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

SecretPattern make_secret_pattern(const std::string& label, const std::string& expression) {
    return SecretPattern{
        label, expression,
        std::make_shared<const std::regex>(expression,
                                           std::regex::ECMAScript | std::regex::icase)};
}

std::vector<SecretPattern> default_secret_patterns() {
    return {
        make_secret_pattern("VFROG_API_KEY", R"(vfrog_[a-z0-9]{20,})"),
        make_secret_pattern("MODAL_TOKEN", R"(sk-[a-z0-9_\-]{20,})"),
        make_secret_pattern("WANDB_API_KEY", R"(wandb_[a-z0-9]{32,})"),
        make_secret_pattern("BEARER_TOKEN", R"(bearer\s+[a-z0-9._~+/\-]{20,}=*)"),
        make_secret_pattern("GENERIC_KEY", R"(\b[a-z0-9]{32,}\b)"),
    };
}

SecretRegistry::SecretRegistry(std::vector<std::string> known_values,
                               std::vector<SecretPattern> patterns)
    : known_values_(std::move(known_values)), patterns_(std::move(patterns)) {
    known_values_.erase(std::remove(known_values_.begin(), known_values_.end(), std::string()),
                        known_values_.end());
    // Longest first so a secret that contains another is masked whole.
    std::sort(known_values_.begin(), known_values_.end(),
              [](const std::string& lhs, const std::string& rhs) {
                  if (lhs.size() != rhs.size()) {
                      return lhs.size() > rhs.size();
                  }
                  return lhs < rhs;
              });
    known_values_.erase(std::unique(known_values_.begin(), known_values_.end()),
                        known_values_.end());
}

std::shared_ptr<const SecretRegistry> SecretRegistry::from_environment(
    const std::vector<std::string>& names, const EnvLookup& lookup,
    std::vector<SecretPattern> patterns) {
    std::vector<std::string> values;
    for (const auto& name : names) {
        const auto value = lookup(name);
        if (!value.has_value() || value->size() < kMinEnvironmentSecretLength) {
            continue;
        }
        values.push_back(*value);
    }
    return std::make_shared<const SecretRegistry>(std::move(values), std::move(patterns));
}

}  // namespace trustgate::secrets
