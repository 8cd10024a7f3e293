#pragma once

#include <string>
#include "secrets/secret_registry.hpp"

namespace trustgate::secrets {

class SecretGuard {
public:
    static constexpr const char* kMask = "[REDACTED]";

    // Literal values first, then each pattern in order. Mask tokens this
    // registry could have produced are left alone, so redact(redact(t)) ==
    // redact(t). Never fails.
    std::string redact(const std::string& text, const SecretRegistry& registry) const;

    // Display form of a single key: first and last four characters.
    static std::string mask_key(const std::string& key);
};

}  // namespace trustgate::secrets
