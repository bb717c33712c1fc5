#pragma once

#include "bootstrap/definition_source.hpp"
#include "config/config_types.hpp"
#include "db/backend_adapter.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief What a bootstrap pass actually did to the backend
 */
struct BootstrapReport {
    std::string origin;
    std::vector<std::string> views_created;
    std::vector<std::string> failed_views;
    std::vector<std::string> failed_sources;
    std::map<std::string, bool> fallback_results;

    /** @brief No declared view failed and every fallback materialized */
    [[nodiscard]] bool complete() const;
};

struct BootstrapResult {
    DefinitionSet definitions;
    BootstrapReport report;
};

/**
 * @brief Turns declarative definitions into backend views
 *
 * resolve() walks the source chain and keeps the first non-empty set; the
 * chain always ends in DefaultDefinitionSource. Materialization tolerates
 * partial failure: each failed view is logged and reported, and required
 * views that are still missing get deterministic fallback views.
 */
class ViewBootstrapper {
public:
    struct Config {
        std::vector<std::string> required_views;
        std::vector<DataSourceInfo> data_sources;
    };

    ViewBootstrapper(std::vector<std::unique_ptr<IDefinitionSource>> sources, Config config);

    /** @brief Contract -> registry -> defaults, as configured */
    [[nodiscard]] static ViewBootstrapper from_config(
        const RegistryConfig& registry, const std::vector<DataSourceInfo>& data_sources);

    [[nodiscard]] DefinitionSet resolve() const;

    /**
     * @brief Ingest configured files into the backend
     * @return Table names that failed to register
     */
    std::vector<std::string> register_sources(IBackendAdapter& adapter,
                                              const std::vector<DataSourceInfo>& sources) const;

    BootstrapReport materialize(IBackendAdapter& adapter,
                                const DefinitionSet& definitions,
                                const std::string& transaction_id) const;

    /** @brief resolve() + register_sources() + materialize() */
    BootstrapResult run(IBackendAdapter& adapter, const std::string& transaction_id) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    std::vector<std::unique_ptr<IDefinitionSource>> sources_;
    Config config_;
};

} // namespace dpgw
