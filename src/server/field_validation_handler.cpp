#include "server/field_validation_handler.hpp"
#include "server/http_constants.hpp"
#include "security/format_validator.hpp"
#include "security/input_sanitizer.hpp"

namespace gatekeeper {

namespace {

using FormatCheck = bool (*)(std::string_view) noexcept;

struct FormatField {
    const char* name;
    FormatCheck check;
};

constexpr FormatField kFormatFields[] = {
    {"email",        &FormatValidator::is_valid_email},
    {"cpv_code",     &FormatValidator::is_valid_procurement_code},
    {"country_code", &FormatValidator::is_valid_country_code},
};

constexpr const char* kFreeTextFields[] = {"name"};

} // anonymous namespace

FieldValidationHandler::Result FieldValidationHandler::validate(const nlohmann::json& body) {
    Result result;
    auto fields = nlohmann::json::object();

    for (const auto& field : kFormatFields) {
        const auto it = body.find(field.name);
        if (it == body.end()) continue;
        const bool ok = it->is_string() && field.check(it->get_ref<const std::string&>());
        fields[field.name] = {{"valid", ok}};
        result.valid = result.valid && ok;
    }

    for (const char* name : kFreeTextFields) {
        const auto it = body.find(name);
        if (it == body.end()) continue;
        if (!it->is_string()) {
            fields[name] = {{"valid", false}};
            result.valid = false;
            continue;
        }
        fields[name] = {{"valid", true},
                        {"value", InputSanitizer::sanitize(it->get_ref<const std::string&>())}};
    }

    result.report = {{"valid", result.valid}, {"fields", std::move(fields)}};
    return result;
}

GatewayResponse FieldValidationHandler::handle(std::string_view body) {
    GatewayResponse response;
    response.content_type = http::kJsonContentType;

    const auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        response.status = 400;
        response.body = R"({"success":false,"error":"Request body must be a JSON object"})";
        return response;
    }

    const auto result = validate(parsed);
    response.status = result.valid ? 200 : 400;
    response.body = result.report.dump();
    return response;
}

} // namespace gatekeeper
