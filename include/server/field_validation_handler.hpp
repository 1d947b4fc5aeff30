#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace gatekeeper {

/**
 * @brief Field-level parser for submitted profile/filter fields
 *
 * Format fields ("email", "cpv_code", "country_code") are validated as
 * sent; they are never rewritten. Free-text fields ("name") are sanitized
 * and echoed back. Absent fields are skipped.
 *
 * Response body:
 *   {"valid":false,"fields":{"email":{"valid":false},"name":{"value":"Bob"}}}
 */
class FieldValidationHandler {
public:
    struct Result {
        bool valid = true;
        nlohmann::json report;
    };

    [[nodiscard]] static Result validate(const nlohmann::json& body);

    /// 200 when every supplied field is valid, 400 otherwise or on a non-object body
    [[nodiscard]] static GatewayResponse handle(std::string_view body);
};

} // namespace gatekeeper
