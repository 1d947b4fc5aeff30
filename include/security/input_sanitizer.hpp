#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace gatekeeper {

/**
 * @brief Strips markup/control characters from free-text fields
 *
 * Defense in depth only. This is not output encoding: anything rendered
 * into HTML must still be escaped for its context.
 */
class InputSanitizer {
public:
    static constexpr std::array<char, 8> kDenylist = {
        '<', '>', '"', '\'', '&', '\0', '\r', '\n',
    };

    /**
     * @brief Remove every denylisted character, then trim surrounding whitespace
     * @return "" for absent or empty input
     */
    [[nodiscard]] static std::string sanitize(std::optional<std::string_view> input);

    [[nodiscard]] static constexpr bool is_denied(char c) noexcept {
        for (const char d : kDenylist) {
            if (c == d) return true;
        }
        return false;
    }
};

} // namespace gatekeeper
