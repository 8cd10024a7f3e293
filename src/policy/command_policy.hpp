#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "policy/path_guard.hpp"

namespace trustgate::policy {

// What an argument hook may consult when deciding on a free-form token.
struct ArgumentContext {
    const PathGuard& path_guard;
    const PathPolicy& path_policy;
    const std::filesystem::path& working_directory;
};

struct ArgumentCheck {
    std::string name;
    std::function<bool(const std::string& token, const ArgumentContext& context)> accepts;
};

ArgumentCheck any_argument();
ArgumentCheck flag_argument();
// Relative tokens resolve against the working directory, then PathGuard.
ArgumentCheck path_argument();
ArgumentCheck existing_file_argument();
// Throws std::regex_error for an invalid expression.
ArgumentCheck pattern_argument(const std::string& pattern);

struct AllowedShape {
    std::set<std::string> tokens;
    std::vector<ArgumentCheck> argument_checks;
    // Environment variables the child may inherit for this program only.
    std::vector<std::string> passthrough_env;
};

struct CommandCheck {
    bool allowed = false;
    std::string code;
    std::string program;
    std::string rejected_token;

    std::string describe() const;
};

// Immutable after build(); share it as shared_ptr<const CommandPolicy>.
class CommandPolicy {
public:
    class Builder {
    public:
        // Throws std::invalid_argument on an empty or duplicate program.
        Builder& allow(const std::string& program, AllowedShape shape);
        std::shared_ptr<const CommandPolicy> build();

    private:
        std::map<std::string, AllowedShape> shapes_;
    };

    const AllowedShape* find(const std::string& program) const;

    // Token-wise match of argv against the program's shape. argv[0] is looked
    // up verbatim, so "/tmp/x/git" never borrows the shape of "git".
    CommandCheck check(const std::vector<std::string>& argv,
                       const ArgumentContext& context) const;

    std::vector<std::string> programs() const;
    std::size_t size() const { return shapes_.size(); }

private:
    explicit CommandPolicy(std::map<std::string, AllowedShape> shapes)
        : shapes_(std::move(shapes)) {}

    std::map<std::string, AllowedShape> shapes_;
};

std::shared_ptr<const CommandPolicy> default_command_policy();

}  // namespace trustgate::policy
