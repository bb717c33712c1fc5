#pragma once

#include "db/backend_adapter.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace dpgw {

// ============================================================================
// Configuration Types
// ============================================================================

struct BackendConfig {
    std::string type = "sqlite";      // factory key, case-insensitive
    ConnectionParams connection;
    BackendOptions options;
};

struct GatewaySettings {
    std::chrono::milliseconds query_timeout{30000};
    std::string source_name = "data_product_gateway";  // "source" in envelope metadata
};

struct SecurityConfig {
    bool validate_sql = true;
    bool allow_custom_sql = true;
};

struct RegistryConfig {
    std::string contract_path;        // TOML contract, tried first
    std::string registry_path;        // JSON registry, tried second
    std::vector<std::string> required_views;
};

struct PrincipalConfig {
    std::string id;
    std::string role;
    std::string governance_level;
    std::vector<std::string> business_processes;
};

struct ServerConfig {
    bool enabled = false;
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_pool_size = 4;
    std::string admin_token;          // Bearer token for /admin endpoints (empty = admin disabled)
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Complete parsed gateway configuration
 */
struct GatewayConfig {
    BackendConfig backend;
    GatewaySettings gateway;
    SecurityConfig security;
    RegistryConfig registry;
    std::vector<DataSourceInfo> data_sources;
    std::vector<PrincipalConfig> principals;
    ServerConfig server;
    LoggingConfig logging;
};

} // namespace dpgw
