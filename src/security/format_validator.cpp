#include "security/format_validator.hpp"

#include <algorithm>

namespace gatekeeper {

namespace {

constexpr bool is_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

constexpr bool is_local_char(char c) noexcept {
    return is_alpha(c) || is_digit(c) ||
           c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

constexpr bool is_domain_char(char c) noexcept {
    return is_alpha(c) || is_digit(c) || c == '.' || c == '-';
}

} // anonymous namespace

// Single linear scan instead of a backtracking regex: input is hostile and
// unbounded in length.
bool FormatValidator::is_valid_email(std::string_view email) noexcept {
    if (email.empty()) return false;

    const auto at = email.find('@');
    if (at == std::string_view::npos || at == 0) return false;

    const auto local = email.substr(0, at);
    if (!std::all_of(local.begin(), local.end(), is_local_char)) return false;

    // Domain charset excludes '@', so a second '@' fails here
    const auto domain = email.substr(at + 1);
    if (!std::all_of(domain.begin(), domain.end(), is_domain_char)) return false;

    // TLD is letters only, so it must follow the last dot
    const auto dot = domain.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return false;

    const auto tld = domain.substr(dot + 1);
    return tld.size() >= kMinTldLength &&
           std::all_of(tld.begin(), tld.end(), is_alpha);
}

bool FormatValidator::is_valid_procurement_code(std::string_view code) noexcept {
    return code.size() == kProcurementCodeLength &&
           std::all_of(code.begin(), code.end(), is_digit);
}

bool FormatValidator::is_valid_country_code(std::string_view code) noexcept {
    return code.size() == kCountryCodeLength &&
           std::all_of(code.begin(), code.end(),
                       [](char c) { return c >= 'A' && c <= 'Z'; });
}

} // namespace gatekeeper
