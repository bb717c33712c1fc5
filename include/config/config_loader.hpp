#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace dpgw {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads gateway.toml into a GatewayConfig
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string. Every missing key keeps its default.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
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
     * @param config_path Path to gateway.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on an already-extracted config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

    /** @brief Expand ${VAR} references from the environment */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static GatewayConfig extract_all_sections(const toml::table& root);
    static BackendConfig extract_backend(const toml::table& root);
    static GatewaySettings extract_gateway(const toml::table& root);
    static SecurityConfig extract_security(const toml::table& root);
    static RegistryConfig extract_registry(const toml::table& root);
    static std::vector<DataSourceInfo> extract_data_sources(const toml::table& root);
    static std::vector<PrincipalConfig> extract_principals(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(GatewayConfig config);
};

} // namespace dpgw
