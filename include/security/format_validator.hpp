#pragma once

#include <cstddef>
#include <string_view>

namespace gatekeeper {

/**
 * @brief Syntactic checks for inbound field formats
 *
 * All checks are total: empty (absent) or malformed input yields false.
 * No normalization is applied; callers must e.g. uppercase a country code
 * themselves if they want case-insensitive matching.
 */
class FormatValidator {
public:
    /**
     * @brief local-part@domain.tld
     *
     * local-part: one or more of [A-Za-z0-9._%+-]
     * domain:     one or more of [A-Za-z0-9.-]
     * tld:        two or more ASCII letters
     * No DNS or mailbox verification.
     */
    [[nodiscard]] static bool is_valid_email(std::string_view email) noexcept;

    /// Exactly 8 ASCII digits (CPV code). No checksum.
    [[nodiscard]] static bool is_valid_procurement_code(std::string_view code) noexcept;

    /// Exactly 2 uppercase ASCII letters (ISO 3166-1 alpha-2 shape).
    [[nodiscard]] static bool is_valid_country_code(std::string_view code) noexcept;

    static constexpr size_t kProcurementCodeLength = 8;
    static constexpr size_t kCountryCodeLength = 2;
    static constexpr size_t kMinTldLength = 2;
};

} // namespace gatekeeper
