#include "secrets/secret_guard.hpp"

#include <algorithm>
#include <cstddef>
#include <regex>
#include <set>
#include <utility>
#include <vector>

namespace trustgate::secrets {

namespace {

using Span = std::pair<std::size_t, std::size_t>;

// Spans of genuine mask tokens: the literal mask, or a pattern mask whose
// label belongs to the registry. Anything else in brackets is plain text.
std::vector<Span> mask_spans(const std::string& text, const std::set<std::string>& labels) {
    static const std::regex kMaskToken(R"(\[REDACTED(?::([A-Za-z0-9_]+))?\])");

    std::vector<Span> spans;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kMaskToken);
         it != std::sregex_iterator(); ++it) {
        if ((*it)[1].matched && labels.count((*it)[1].str()) == 0) {
            continue;
        }
        const auto begin = static_cast<std::size_t>(it->position(0));
        spans.emplace_back(begin, begin + static_cast<std::size_t>(it->length(0)));
    }
    return spans;
}

bool overlaps(const std::vector<Span>& spans, const std::size_t begin, const std::size_t end) {
    for (const auto& span : spans) {
        if (begin < span.second && span.first < end) {
            return true;
        }
    }
    return false;
}

bool contained(const std::vector<Span>& spans, const std::size_t begin, const std::size_t end) {
    for (const auto& span : spans) {
        if (span.first <= begin && end <= span.second) {
            return true;
        }
    }
    return false;
}

std::string mask_literals(const std::string& text, const std::vector<std::string>& values,
                          const std::set<std::string>& labels) {
    const auto guarded = mask_spans(text, labels);
    std::vector<bool> covered(text.size(), false);
    bool any = false;

    for (const auto& value : values) {
        std::size_t pos = text.find(value);
        while (pos != std::string::npos) {
            const std::size_t end = pos + value.size();
            // A value that only spells part of a mask token is not a leak.
            if (!contained(guarded, pos, end)) {
                std::fill(covered.begin() + static_cast<std::ptrdiff_t>(pos),
                          covered.begin() + static_cast<std::ptrdiff_t>(end), true);
                any = true;
            }
            pos = text.find(value, pos + 1);
        }
    }
    if (!any) {
        return text;
    }

    std::string masked;
    masked.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (!covered[i]) {
            masked.push_back(text[i++]);
            continue;
        }
        while (i < text.size() && covered[i]) {
            ++i;
        }
        masked += SecretGuard::kMask;
    }
    return masked;
}

std::string mask_pattern(const std::string& text, const SecretPattern& pattern,
                         const std::set<std::string>& labels) {
    if (!pattern.regex) {
        return text;
    }
    const auto guarded = mask_spans(text, labels);

    std::string masked;
    std::size_t last = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), *pattern.regex);
         it != std::sregex_iterator(); ++it) {
        const auto begin = static_cast<std::size_t>(it->position(0));
        const auto length = static_cast<std::size_t>(it->length(0));
        if (length == 0 || begin < last || overlaps(guarded, begin, begin + length)) {
            continue;
        }
        masked.append(text, last, begin - last);
        masked += "[REDACTED:" + pattern.label + "]";
        last = begin + length;
    }
    if (last == 0) {
        return text;
    }
    masked.append(text, last, std::string::npos);
    return masked;
}

}  // namespace

std::string SecretGuard::redact(const std::string& text, const SecretRegistry& registry) const {
    if (text.empty() || registry.empty()) {
        return text;
    }

    std::set<std::string> labels;
    for (const auto& pattern : registry.patterns()) {
        labels.insert(pattern.label);
    }

    std::string result = mask_literals(text, registry.known_values(), labels);
    for (const auto& pattern : registry.patterns()) {
        result = mask_pattern(result, pattern, labels);
    }
    return result;
}

std::string SecretGuard::mask_key(const std::string& key) {
    if (key.size() < 8) {
        return "***";
    }
    return key.substr(0, 4) + "..." + key.substr(key.size() - 4);
}

}  // namespace trustgate::secrets
