#pragma once
#include <cstddef>
#include <random>
#include <string>

namespace trustgate::core::config {

    constexpr std::size_t kSessionIdHexDigits = 8;

    // "<prefix>" followed by kSessionIdHexDigits lower-case hex digits.
    inline std::string generate_session_id(const std::string& prefix = "session-") {
        static constexpr char kHex[] = "0123456789abcdef";
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<int> dis(0, 15);

        std::string id = prefix;
        for (std::size_t i = 0; i < kSessionIdHexDigits; ++i) {
            id.push_back(kHex[dis(gen)]);
        }
        return id;
    }

    inline bool is_session_id(const std::string& text, const std::string& prefix = "session-") {
        if (text.size() != prefix.size() + kSessionIdHexDigits || text.rfind(prefix, 0) != 0) {
            return false;
        }
        for (std::size_t i = prefix.size(); i < text.size(); ++i) {
            const char c = text[i];
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
                return false;
            }
        }
        return true;
    }

} // namespace trustgate::core::config
