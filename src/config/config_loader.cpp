#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <stdexcept>

using namespace std::string_literals;

namespace dpgw {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

uint16_t toml_port(const toml::table& tbl, const std::string_view key, int64_t default_value) {
    const int64_t port = tbl[key].value_or(default_value);
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("{} must be 1-65535, got {}", key, port));
    }
    return static_cast<uint16_t>(port);
}

size_t toml_count(const toml::table& tbl, const std::string_view key, int64_t default_value) {
    const int64_t value = tbl[key].value_or(default_value);
    if (value < 0) {
        throw std::runtime_error(std::format("{} must not be negative, got {}", key, value));
    }
    return static_cast<size_t>(value);
}

// "," ";" "|" or a tab, spelled "\t" or "tab"
std::optional<char> parse_delimiter(const std::string& text) {
    if (text.empty()) return std::nullopt;
    if (text == "\t" || utils::to_lower(text) == "tab") return '\t';
    if (text.size() != 1) {
        throw std::runtime_error(std::format("data_sources.delimiter must be one character, got '{}'", text));
    }
    return text[0];
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

BackendConfig ConfigLoader::extract_backend(const toml::table& root) {
    BackendConfig cfg;
    const auto* backend = root["backend"].as_table();
    if (!backend) return cfg;
    const auto& b = *backend;
    auto& conn = cfg.connection;

    cfg.type = utils::to_lower(b["type"].value_or("sqlite"s));

    conn.path = b["path"].value_or(conn.path);
    conn.read_only = b["read_only"].value_or(false);

    conn.dsn = b["dsn"].value_or(""s);
    conn.host = b["host"].value_or(conn.host);
    conn.port = toml_port(b, "port", conn.port);
    conn.user = b["user"].value_or(""s);
    conn.password = b["password"].value_or(""s);
    conn.database = b["database"].value_or(""s);
    conn.sslmode = b["sslmode"].value_or(conn.sslmode);
    conn.min_pool_size = toml_count(b, "min_pool_size", static_cast<int64_t>(conn.min_pool_size));
    conn.max_pool_size = toml_count(b, "max_pool_size", static_cast<int64_t>(conn.max_pool_size));
    conn.pool_acquire_timeout = std::chrono::milliseconds(
        b["pool_acquire_timeout_ms"].value_or(static_cast<int64_t>(conn.pool_acquire_timeout.count())));

    conn.project = b["project"].value_or(""s);
    conn.dataset = b["dataset"].value_or(""s);
    conn.location = b["location"].value_or(conn.location);
    conn.credentials_file = b["credentials_file"].value_or(""s);
    conn.access_token = b["access_token"].value_or(""s);
    conn.api_endpoint = b["api_endpoint"].value_or(conn.api_endpoint);

    cfg.options.max_result_rows = toml_count(b, "max_result_rows",
        static_cast<int64_t>(cfg.options.max_result_rows));
    cfg.options.statement_timeout = std::chrono::milliseconds(
        b["statement_timeout_ms"].value_or(static_cast<int64_t>(cfg.options.statement_timeout.count())));
    return cfg;
}

GatewaySettings ConfigLoader::extract_gateway(const toml::table& root) {
    GatewaySettings cfg;
    const auto* gateway = root["gateway"].as_table();
    if (!gateway) return cfg;
    const auto& g = *gateway;

    cfg.query_timeout = std::chrono::milliseconds(
        g["query_timeout_ms"].value_or(static_cast<int64_t>(cfg.query_timeout.count())));
    cfg.source_name = g["source_name"].value_or(cfg.source_name);
    return cfg;
}

SecurityConfig ConfigLoader::extract_security(const toml::table& root) {
    SecurityConfig cfg;
    const auto* security = root["security"].as_table();
    if (!security) return cfg;
    const auto& s = *security;

    cfg.validate_sql = s["validate_sql"].value_or(true);
    cfg.allow_custom_sql = s["allow_custom_sql"].value_or(true);
    return cfg;
}

RegistryConfig ConfigLoader::extract_registry(const toml::table& root) {
    RegistryConfig cfg;
    const auto* registry = root["registry"].as_table();
    if (!registry) return cfg;
    const auto& r = *registry;

    cfg.contract_path = r["contract_path"].value_or(""s);
    cfg.registry_path = r["registry_path"].value_or(""s);
    cfg.required_views = toml_string_array(r, "required_views");
    return cfg;
}

std::vector<DataSourceInfo> ConfigLoader::extract_data_sources(const toml::table& root) {
    std::vector<DataSourceInfo> result;
    const auto* arr = root["data_sources"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* ds = elem.as_table();
        if (!ds) continue;

        DataSourceInfo info;
        info.type = utils::to_lower((*ds)["type"].value_or("csv"s));
        info.path = (*ds)["path"].value_or(""s);
        info.table_name = (*ds)["table"].value_or(""s);
        info.delimiter = parse_delimiter((*ds)["delimiter"].value_or(""s));
        result.push_back(std::move(info));
    }
    return result;
}

std::vector<PrincipalConfig> ConfigLoader::extract_principals(const toml::table& root) {
    std::vector<PrincipalConfig> result;
    const auto* arr = root["principals"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* p = elem.as_table();
        if (!p) continue;

        PrincipalConfig principal;
        principal.id = (*p)["id"].value_or(""s);
        principal.role = (*p)["role"].value_or(""s);
        principal.governance_level = (*p)["governance_level"].value_or(""s);
        principal.business_processes = toml_string_array(*p, "business_processes");
        result.push_back(std::move(principal));
    }
    return result;
}

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.enabled = s["enabled"].value_or(false);
    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = toml_port(s, "port", cfg.port);
    cfg.thread_pool_size = toml_count(s, "threads", static_cast<int64_t>(cfg.thread_pool_size));
    cfg.admin_token = s["admin_token"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower((*logging)["level"].value_or("info"s));
    return cfg;
}

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    GatewayConfig config;
    config.backend = extract_backend(root);
    config.gateway = extract_gateway(root);
    config.security = extract_security(root);
    config.registry = extract_registry(root);
    config.data_sources = extract_data_sources(root);
    config.principals = extract_principals(root);
    config.server = extract_server(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.backend.type.empty()) {
        errors.emplace_back("backend.type must not be empty");
    }

    const auto& conn = config.backend.connection;
    if (conn.max_pool_size == 0) {
        errors.emplace_back("backend.max_pool_size must be > 0");
    }
    if (conn.min_pool_size > conn.max_pool_size) {
        errors.push_back(std::format(
            "backend.min_pool_size ({}) > max_pool_size ({})",
            conn.min_pool_size, conn.max_pool_size));
    }
    if (config.backend.options.max_result_rows == 0) {
        errors.emplace_back("backend.max_result_rows must be > 0");
    }
    if (config.backend.options.statement_timeout.count() < 0) {
        errors.emplace_back("backend.statement_timeout_ms must not be negative");
    }

    if (config.gateway.query_timeout.count() <= 0) {
        errors.push_back(std::format("gateway.query_timeout_ms must be > 0, got {}",
            config.gateway.query_timeout.count()));
    }

    for (size_t i = 0; i < config.data_sources.size(); ++i) {
        const auto& ds = config.data_sources[i];
        if (ds.path.empty()) {
            errors.push_back(std::format("data_sources[{}].path must not be empty", i));
        }
        if (ds.table_name.empty()) {
            errors.push_back(std::format("data_sources[{}].table must not be empty", i));
        }
    }

    for (size_t i = 0; i < config.principals.size(); ++i) {
        if (config.principals[i].id.empty()) {
            errors.push_back(std::format("principals[{}].id must not be empty", i));
        }
    }

    if (config.server.enabled && config.server.thread_pool_size == 0) {
        errors.emplace_back("server.threads must be > 0 when the server is enabled");
    }

    static constexpr std::string_view kLevels[] = {"debug", "info", "warn", "warning", "error"};
    bool known_level = false;
    for (const auto level : kLevels) {
        if (config.logging.level == level) known_level = true;
    }
    if (!known_level) {
        errors.push_back(std::format("logging.level must be debug/info/warn/error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace dpgw
