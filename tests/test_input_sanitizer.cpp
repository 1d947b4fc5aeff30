#include <catch2/catch_test_macros.hpp>
#include "security/input_sanitizer.hpp"

#include <string>

using namespace gatekeeper;

namespace {

bool contains_denied(const std::string& s) {
    for (const char c : s) {
        if (InputSanitizer::is_denied(c)) return true;
    }
    return false;
}

} // namespace

TEST_CASE("InputSanitizer: absent and empty input yield empty string", "[sanitizer]") {
    CHECK(InputSanitizer::sanitize(std::nullopt).empty());
    CHECK(InputSanitizer::sanitize("").empty());
}

TEST_CASE("InputSanitizer: strips markup characters", "[sanitizer]") {
    CHECK(InputSanitizer::sanitize("<script>alert('x')</script>") == "scriptalert(x)/script");
    CHECK(InputSanitizer::sanitize("Tom & \"Jerry\"") == "Tom  Jerry");
    CHECK(InputSanitizer::sanitize("plain text") == "plain text");
}

TEST_CASE("InputSanitizer: strips NUL, CR and LF", "[sanitizer]") {
    const std::string with_nul("ab\0cd", 5);
    CHECK(InputSanitizer::sanitize(with_nul) == "abcd");
    CHECK(InputSanitizer::sanitize("line1\r\nline2") == "line1line2");
}

TEST_CASE("InputSanitizer: trims surrounding whitespace after removal", "[sanitizer]") {
    CHECK(InputSanitizer::sanitize("  hello  ") == "hello");
    CHECK(InputSanitizer::sanitize("\n<b> bold </b>\t") == "b bold /b");
    CHECK(InputSanitizer::sanitize("<>\"'&") == "");
    CHECK(InputSanitizer::sanitize("   ") == "");
}

TEST_CASE("InputSanitizer: output never contains a denylisted character", "[sanitizer]") {
    std::string all;
    for (int c = 0; c < 128; ++c) {
        all += static_cast<char>(c);
    }
    const std::string inputs[] = {
        all,
        all + all,
        "<<<>>>&&&'''\"\"\"",
        std::string("\0\r\n", 3) + "x" + std::string("\0\r\n", 3),
    };
    for (const auto& input : inputs) {
        CHECK_FALSE(contains_denied(InputSanitizer::sanitize(input)));
    }
}
