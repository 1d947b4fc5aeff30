#include "security/input_sanitizer.hpp"
#include "core/utils.hpp"

namespace gatekeeper {

std::string InputSanitizer::sanitize(std::optional<std::string_view> input) {
    if (!input || input->empty()) return "";

    std::string kept;
    kept.reserve(input->size());
    for (const char c : *input) {
        if (!is_denied(c)) kept += c;
    }
    return utils::trim(kept);
}

} // namespace gatekeeper
