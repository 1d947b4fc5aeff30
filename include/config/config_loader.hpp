#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace gatekeeper {

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * @brief Loads gatekeeper.toml
 *
 * Sections: [server], [server.tls], [logging], [cors], [headers],
 * [headers.csp]. Missing keys keep their defaults (the reference policy).
 * ${VAR} in any string value is replaced by the environment variable.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatekeeperConfig config;

        static LoadResult ok(GatekeeperConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gatekeeper.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// @return One message per violated constraint (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const GatekeeperConfig& config);

private:
    static LoadResult validate_and_return(GatekeeperConfig config);
};

} // namespace gatekeeper
