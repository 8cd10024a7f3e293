#include "policy/command_policy.hpp"

#include <regex>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace trustgate::policy {

namespace {

constexpr const char* kPackageSpecPattern = R"(^[A-Za-z0-9][A-Za-z0-9_.\-\[\],=<>!~]*$)";

bool is_flag(const std::string& token) {
    return token.size() > 1 && token[0] == '-';
}

core::errors::Result<std::filesystem::path> resolve_argument_path(
    const std::string& token, const ArgumentContext& context) {
    std::filesystem::path candidate(token);
    if (candidate.is_relative()) {
        candidate = context.working_directory / candidate;
    }
    return context.path_guard.validate(candidate, context.path_policy);
}

}  // namespace

ArgumentCheck any_argument() {
    return ArgumentCheck{"any", [](const std::string&, const ArgumentContext&) {
                             return true;
                         }};
}

ArgumentCheck flag_argument() {
    return ArgumentCheck{"flags", [](const std::string& token, const ArgumentContext&) {
                             return is_flag(token);
                         }};
}

ArgumentCheck path_argument() {
    return ArgumentCheck{"paths",
                         [](const std::string& token, const ArgumentContext& context) {
                             if (token.empty() || is_flag(token)) {
                                 return false;
                             }
                             return !core::errors::is_error(
                                 resolve_argument_path(token, context));
                         }};
}

ArgumentCheck existing_file_argument() {
    return ArgumentCheck{"existing_files",
                         [](const std::string& token, const ArgumentContext& context) {
                             if (token.empty() || is_flag(token)) {
                                 return false;
                             }
                             auto resolved = resolve_argument_path(token, context);
                             if (core::errors::is_error(resolved)) {
                                 return false;
                             }
                             std::error_code ec;
                             return std::filesystem::is_regular_file(
                                        core::errors::get_value(resolved), ec) &&
                                    !ec;
                         }};
}

ArgumentCheck pattern_argument(const std::string& pattern) {
    auto compiled = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    return ArgumentCheck{"pattern:" + pattern,
                         [compiled](const std::string& token, const ArgumentContext&) {
                             return std::regex_match(token, *compiled);
                         }};
}

std::string CommandCheck::describe() const {
    if (allowed) {
        return "Command allowed: '" + program + "'";
    }
    if (code == "argument_not_allowed") {
        return "Argument not allowed for '" + program + "': '" + rejected_token + "'";
    }
    if (program.empty()) {
        return "Empty command.";
    }
    return "Command not allowed: '" + program + "'";
}

CommandPolicy::Builder& CommandPolicy::Builder::allow(const std::string& program,
                                                      AllowedShape shape) {
    if (program.empty()) {
        throw std::invalid_argument("CommandPolicy program name cannot be empty");
    }
    if (!shapes_.emplace(program, std::move(shape)).second) {
        throw std::invalid_argument("Duplicate CommandPolicy program: " + program);
    }
    return *this;
}

std::shared_ptr<const CommandPolicy> CommandPolicy::Builder::build() {
    std::shared_ptr<const CommandPolicy> policy(new CommandPolicy(std::move(shapes_)));
    shapes_.clear();
    return policy;
}

const AllowedShape* CommandPolicy::find(const std::string& program) const {
    const auto it = shapes_.find(program);
    return it == shapes_.end() ? nullptr : &it->second;
}

CommandCheck CommandPolicy::check(const std::vector<std::string>& argv,
                                  const ArgumentContext& context) const {
    CommandCheck result;
    if (argv.empty() || argv.front().empty()) {
        result.code = "empty_command";
        return result;
    }

    result.program = argv.front();
    const AllowedShape* shape = find(result.program);
    if (shape == nullptr) {
        result.code = "program_not_allowed";
        return result;
    }

    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string& token = argv[i];
        if (shape->tokens.count(token) != 0) {
            continue;
        }

        bool accepted = false;
        for (const auto& check : shape->argument_checks) {
            if (check.accepts(token, context)) {
                accepted = true;
                break;
            }
        }
        if (!accepted) {
            result.code = "argument_not_allowed";
            result.rejected_token = token;
            return result;
        }
    }

    result.allowed = true;
    return result;
}

std::vector<std::string> CommandPolicy::programs() const {
    std::vector<std::string> names;
    names.reserve(shapes_.size());
    for (const auto& entry : shapes_) {
        names.push_back(entry.first);
    }
    return names;
}

std::shared_ptr<const CommandPolicy> default_command_policy() {
    AllowedShape any_shape;
    any_shape.argument_checks = {any_argument()};

    AllowedShape modal;
    modal.tokens = {"run", "token", "volume", "app", "deploy", "--version", "--detach"};
    modal.argument_checks = {existing_file_argument()};
    modal.passthrough_env = {"MODAL_TOKEN_ID", "MODAL_TOKEN_SECRET"};

    AllowedShape pip;
    pip.tokens = {"install", "list", "show", "freeze", "--version"};
    pip.argument_checks = {flag_argument(), pattern_argument(kPackageSpecPattern)};

    AllowedShape uv;
    uv.tokens = {"pip", "venv", "run", "install", "list", "show", "freeze", "--version"};
    uv.argument_checks = {flag_argument(), pattern_argument(kPackageSpecPattern)};

    AllowedShape nvcc;
    nvcc.tokens = {"--version"};

    // No generic flag hook for git: "-c" style options can run arbitrary
    // programs through config keys such as core.fsmonitor.
    AllowedShape git;
    git.tokens = {"--version", "status", "log", "diff", "rev-parse", "--short",
                  "--porcelain", "--oneline", "--stat", "--name-only", "--cached",
                  "--abbrev-ref", "--show-toplevel", "HEAD"};
    git.argument_checks = {pattern_argument("^-[0-9]+$")};

    return CommandPolicy::Builder()
        .allow("modal", modal)
        .allow("python", any_shape)
        .allow("python3", any_shape)
        .allow("pip", pip)
        .allow("pip3", pip)
        .allow("uv", uv)
        .allow("nvidia-smi", any_shape)
        .allow("nvcc", nvcc)
        .allow("git", git)
        .allow("yolo", any_shape)
        .build();
}

}  // namespace trustgate::policy
