#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kvault {

/**
 * @brief Load kvault.toml into a ClientConfig
 *
 * Supported on top of plain TOML:
 * - ${ENV_VAR} expansion in every string value (unset expands to "")
 * - include = "other.toml" or include = ["a.toml", "b.toml"], resolved
 *   relative to the including file, deep-merged with the including file
 *   winning; cycles and depth > 10 are errors
 *
 * Sections: [auth] [vault] [http] [retry] [logging]. Every key is optional.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        ClientConfig config;

        static LoadResult ok(ClientConfig cfg) {
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

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check every constraint, collecting all violations
     * @return Empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ClientConfig& config);

    [[nodiscard]] static std::optional<AuthMethod> parse_auth_method(const std::string& name);

private:
    [[nodiscard]] static LoadResult validate_and_return(ClientConfig config);
};

} // namespace kvault
