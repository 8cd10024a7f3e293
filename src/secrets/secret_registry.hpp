#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace trustgate::secrets {

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the live process environment.
std::optional<std::string> process_environment(const std::string& name);

struct SecretPattern {
    std::string label;
    std::string expression;
    std::shared_ptr<const std::regex> regex;
};

// Case-insensitive ECMAScript pattern. Throws std::regex_error when invalid.
SecretPattern make_secret_pattern(const std::string& label, const std::string& expression);

std::vector<SecretPattern> default_secret_patterns();

// One consistent snapshot of what must never be surfaced. Never mutated
// after construction; build a new one when the environment changes.
class SecretRegistry {
public:
    SecretRegistry() = default;
    SecretRegistry(std::vector<std::string> known_values, std::vector<SecretPattern> patterns);

    // Values shorter than kMinEnvironmentSecretLength are skipped.
    static std::shared_ptr<const SecretRegistry> from_environment(
        const std::vector<std::string>& names, const EnvLookup& lookup = process_environment,
        std::vector<SecretPattern> patterns = default_secret_patterns());

    static constexpr std::size_t kMinEnvironmentSecretLength = 4;

    // Unique, non-empty, longest first.
    const std::vector<std::string>& known_values() const { return known_values_; }
    const std::vector<SecretPattern>& patterns() const { return patterns_; }
    bool empty() const { return known_values_.empty() && patterns_.empty(); }

private:
    std::vector<std::string> known_values_;
    std::vector<SecretPattern> patterns_;
};

}  // namespace trustgate::secrets
