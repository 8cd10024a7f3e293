#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include "core/errors/guard_errors.hpp"
#include "policy/command_policy.hpp"

namespace trustgate::policy {

// Builds a CommandPolicy from the "commands" object of a session document:
//   { "git": { "allow": ["status"], "arguments": "flags",
//              "pattern": "^-[0-9]+$", "pass_env": ["GIT_DIR"] } }
core::errors::Result<std::shared_ptr<const CommandPolicy>> command_policy_from_json(
    const nlohmann::json& commands);

}  // namespace trustgate::policy
