#include "policy/file_rules.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <system_error>

namespace trustgate::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;

namespace {

constexpr std::uintmax_t kMiB = 1024 * 1024;
constexpr std::size_t kMaxFilenameLength = 200;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string join_extensions(const std::set<std::string>& extensions) {
    std::string joined;
    for (const auto& extension : extensions) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += extension;
    }
    return joined;
}

std::string format_mib(const std::uintmax_t bytes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1fMB",
                  static_cast<double>(bytes) / static_cast<double>(kMiB));
    return buffer;
}

}  // namespace

const FileRule& rule_for(const FileCategory category) {
    static const FileRule kImage{
        "image", {".jpg", ".jpeg", ".png", ".webp", ".bmp", ".tiff", ".gif"}, 50 * kMiB};
    static const FileRule kModel{
        "model", {".pt", ".pth", ".onnx", ".engine", ".tflite", ".torchscript"},
        2048 * kMiB};
    static const FileRule kConfig{"config", {".yaml", ".yml", ".json", ".toml"}, kMiB};
    static const FileRule kLabel{"label", {".txt", ".json", ".xml"}, 10 * kMiB};
    static const FileRule kScript{"script", {".py", ".sh"}, kMiB};

    switch (category) {
        case FileCategory::Image:
            return kImage;
        case FileCategory::Model:
            return kModel;
        case FileCategory::Config:
            return kConfig;
        case FileCategory::Label:
            return kLabel;
        case FileCategory::Script:
        default:
            return kScript;
    }
}

core::errors::Result<std::filesystem::path> validate_file(
    const PathGuard& guard, const PathPolicy& policy,
    const std::filesystem::path& candidate, const FileCategory category) {
    auto validated = guard.validate(candidate, policy);
    if (core::errors::is_error(validated)) {
        return validated;
    }
    const std::filesystem::path& resolved = core::errors::get_value(validated);
    const FileRule& rule = rule_for(category);

    const std::string extension = lowercase(candidate.extension().string());
    if (rule.extensions.count(extension) == 0) {
        return GuardError{ErrorCategory::Policy,
                          "Invalid " + rule.name + " type: '" + extension + "'",
                          "file_type_not_allowed",
                          "Allowed: " + join_extensions(rule.extensions)};
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(resolved, ec) && !ec) {
        const auto size = std::filesystem::file_size(resolved, ec);
        if (ec) {
            return GuardError{ErrorCategory::Execution,
                              "Unable to read size of " + candidate.string(),
                              "file_size_unavailable"};
        }
        if (size > rule.max_bytes) {
            return GuardError{ErrorCategory::Policy,
                              "File too large: " + format_mib(size),
                              "file_too_large",
                              "Maximum for " + rule.name + ": " + format_mib(rule.max_bytes)};
        }
    }
    return validated;
}

std::string sanitize_filename(const std::string& filename) {
    static const std::string kDangerous = std::string("/\\:*?\"<>|") + '\0';

    std::string result;
    result.reserve(filename.size());
    for (const char c : filename) {
        result.push_back(kDangerous.find(c) == std::string::npos ? c : '_');
    }

    std::size_t pos = 0;
    while ((pos = result.find("..", pos)) != std::string::npos) {
        result.replace(pos, 2, "_");
    }

    const auto first = result.find_first_not_of('.');
    result = first == std::string::npos ? std::string() : result.substr(first);

    const auto begin = result.find_first_not_of(" \t\r\n");
    const auto end = result.find_last_not_of(" \t\r\n");
    result = begin == std::string::npos ? std::string() : result.substr(begin, end - begin + 1);

    if (result.size() > kMaxFilenameLength) {
        const std::string extension = std::filesystem::path(result).extension().string();
        if (extension.size() < kMaxFilenameLength) {
            result = result.substr(0, kMaxFilenameLength - extension.size()) + extension;
        } else {
            result = result.substr(0, kMaxFilenameLength);
        }
    }

    if (result.empty()) {
        result = "unnamed";
    }
    return result;
}

core::errors::Result<std::filesystem::path> safe_join(
    const PathGuard& guard, const PathPolicy& policy,
    const std::filesystem::path& base, const std::vector<std::string>& parts) {
    auto validated_base = guard.validate(base, policy);
    if (core::errors::is_error(validated_base)) {
        return validated_base;
    }

    const std::filesystem::path& canonical_base = core::errors::get_value(validated_base);
    std::filesystem::path joined = canonical_base;
    for (const auto& part : parts) {
        joined /= sanitize_filename(part);
    }

    auto validated = guard.validate(joined, policy);
    if (core::errors::is_error(validated) ||
        !PathGuard::is_within_root(canonical_base, core::errors::get_value(validated))) {
        return GuardError{ErrorCategory::Policy, "Path traversal attempt detected.",
                          "path_outside_root"};
    }
    return validated;
}

}  // namespace trustgate::policy
