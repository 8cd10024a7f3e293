#include "policy/policy_loader.hpp"

#include <regex>
#include <string>
#include <utility>

namespace trustgate::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using nlohmann::json;

namespace {

GuardError config_error(const std::string& message, const std::string& code) {
    return GuardError{ErrorCategory::Config, message, code};
}

core::errors::Result<std::vector<std::string>> string_list(const json& value,
                                                           const std::string& where) {
    if (!value.is_array()) {
        return config_error(where + " must be an array of strings.", "invalid_policy_entry");
    }
    std::vector<std::string> items;
    items.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            return config_error(where + " must be an array of strings.",
                                "invalid_policy_entry");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

core::errors::Result<AllowedShape> shape_from_json(const std::string& program,
                                                   const json& entry) {
    if (!entry.is_object()) {
        return config_error("Policy entry for '" + program + "' must be an object.",
                            "invalid_policy_entry");
    }

    AllowedShape shape;
    if (entry.contains("allow")) {
        auto tokens = string_list(entry.at("allow"), "commands." + program + ".allow");
        if (core::errors::is_error(tokens)) {
            return core::errors::get_error(tokens);
        }
        const auto& values = core::errors::get_value(tokens);
        shape.tokens.insert(values.begin(), values.end());
    }

    if (entry.contains("pass_env")) {
        auto names = string_list(entry.at("pass_env"), "commands." + program + ".pass_env");
        if (core::errors::is_error(names)) {
            return core::errors::get_error(names);
        }
        shape.passthrough_env = core::errors::get_value(names);
    }

    const std::string arguments =
        entry.contains("arguments") && entry.at("arguments").is_string()
            ? entry.at("arguments").get<std::string>()
            : std::string("none");
    if (entry.contains("arguments") && !entry.at("arguments").is_string()) {
        return config_error("commands." + program + ".arguments must be a string.",
                            "invalid_policy_entry");
    }

    if (arguments == "any") {
        shape.argument_checks.push_back(any_argument());
    } else if (arguments == "flags") {
        shape.argument_checks.push_back(flag_argument());
    } else if (arguments == "paths") {
        shape.argument_checks.push_back(path_argument());
    } else if (arguments == "existing_files") {
        shape.argument_checks.push_back(existing_file_argument());
    } else if (arguments != "none") {
        return config_error("Unknown argument kind for '" + program + "': " + arguments,
                            "invalid_argument_kind");
    }

    if (entry.contains("pattern")) {
        const auto& pattern = entry.at("pattern");
        if (!pattern.is_string()) {
            return config_error("commands." + program + ".pattern must be a string.",
                                "invalid_policy_entry");
        }
        try {
            shape.argument_checks.push_back(pattern_argument(pattern.get<std::string>()));
        } catch (const std::regex_error& ex) {
            return config_error("Invalid pattern for '" + program + "': " + ex.what(),
                                "invalid_argument_pattern");
        }
    }

    return shape;
}

}  // namespace

core::errors::Result<std::shared_ptr<const CommandPolicy>> command_policy_from_json(
    const json& commands) {
    if (!commands.is_object()) {
        return config_error("\"commands\" must be an object keyed by program name.",
                            "invalid_command_table");
    }

    CommandPolicy::Builder builder;
    for (auto it = commands.begin(); it != commands.end(); ++it) {
        if (it.key().empty()) {
            return config_error("Program names cannot be empty.", "invalid_command_table");
        }
        auto shape = shape_from_json(it.key(), it.value());
        if (core::errors::is_error(shape)) {
            return core::errors::get_error(shape);
        }
        builder.allow(it.key(), std::move(core::errors::get_value(shape)));
    }
    return builder.build();
}

}  // namespace trustgate::policy
