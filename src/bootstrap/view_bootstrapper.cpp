#include "bootstrap/view_bootstrapper.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace dpgw {

bool BootstrapReport::complete() const {
    return failed_views.empty() &&
           std::all_of(fallback_results.begin(), fallback_results.end(),
                       [](const auto& entry) { return entry.second; });
}

ViewBootstrapper::ViewBootstrapper(std::vector<std::unique_ptr<IDefinitionSource>> sources, Config config)
    : sources_(std::move(sources)), config_(std::move(config)) {}

ViewBootstrapper ViewBootstrapper::from_config(
    const RegistryConfig& registry, const std::vector<DataSourceInfo>& data_sources) {

    std::vector<std::unique_ptr<IDefinitionSource>> chain;
    if (!registry.contract_path.empty()) {
        chain.push_back(std::make_unique<ContractFileSource>(registry.contract_path));
    }
    if (!registry.registry_path.empty()) {
        chain.push_back(std::make_unique<RegistryFileSource>(registry.registry_path));
    }
    chain.push_back(std::make_unique<DefaultDefinitionSource>());

    return ViewBootstrapper(std::move(chain), Config{registry.required_views, data_sources});
}

DefinitionSet ViewBootstrapper::resolve() const {
    for (const auto& source : sources_) {
        auto set = source->load();
        if (!set) {
            utils::log::debug(std::format("Bootstrap: source {} unavailable", source->name()));
            continue;
        }
        if (set->empty()) {
            utils::log::info(std::format("Bootstrap: source {} has no definitions, trying next", source->name()));
            continue;
        }
        utils::log::info(std::format("Bootstrap: using {} ({} data products, {} views)",
            set->origin, set->data_products.size(), set->views.size()));
        return std::move(*set);
    }

    // Custom chains may omit the defaults; the gateway still needs something to serve
    auto defaults = DefaultDefinitionSource().load();
    utils::log::warn("Bootstrap: no configured definition source produced data, using defaults");
    return defaults ? std::move(*defaults) : DefinitionSet{};
}

std::vector<std::string> ViewBootstrapper::register_sources(
    IBackendAdapter& adapter, const std::vector<DataSourceInfo>& sources) const {

    std::vector<std::string> failed;
    for (const auto& source : sources) {
        bool ok = false;
        try {
            ok = adapter.register_data_source(source);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Bootstrap: registering '{}' threw: {}", source.table_name, e.what()));
        }
        if (ok) {
            utils::log::info(std::format("Bootstrap: registered {} source '{}' as table '{}'",
                source.type, source.path, source.table_name));
        } else {
            utils::log::warn(std::format("Bootstrap: could not register {} source '{}' as '{}', skipping",
                source.type, source.path, source.table_name));
            failed.push_back(source.table_name);
        }
    }
    return failed;
}

BootstrapReport ViewBootstrapper::materialize(
    IBackendAdapter& adapter,
    const DefinitionSet& definitions,
    const std::string& transaction_id) const {

    BootstrapReport report;
    report.origin = definitions.origin;

    for (const auto& view : definitions.views) {
        utils::log::debug(std::format("[TXN:{}] Bootstrap: creating view '{}': {}",
            transaction_id, view.name, view.backing_sql));
        if (adapter.create_view(view.name, view.backing_sql, true)) {
            report.views_created.push_back(view.name);
        } else {
            utils::log::warn(std::format("[TXN:{}] Bootstrap: view '{}' could not be created",
                transaction_id, view.name));
            report.failed_views.push_back(view.name);
        }
    }

    std::vector<std::string> missing;
    for (const auto& required : config_.required_views) {
        if (!adapter.check_view_exists(required)) {
            missing.push_back(required);
        }
    }
    if (!missing.empty()) {
        utils::log::info(std::format("[TXN:{}] Bootstrap: {} required view(s) missing, creating fallbacks: {}",
            transaction_id, missing.size(), utils::join(missing, ", ")));
        report.fallback_results = adapter.create_fallback_views(missing);
    }

    utils::log::info(std::format("[TXN:{}] Bootstrap: {} view(s) created, {} failed, {} fallback(s) from {}",
        transaction_id, report.views_created.size(), report.failed_views.size(),
        report.fallback_results.size(), report.origin));
    return report;
}

BootstrapResult ViewBootstrapper::run(IBackendAdapter& adapter, const std::string& transaction_id) const {
    BootstrapResult result;
    result.definitions = resolve();
    const auto failed_sources = register_sources(adapter, config_.data_sources);
    result.report = materialize(adapter, result.definitions, transaction_id);
    result.report.failed_sources = failed_sources;
    return result;
}

} // namespace dpgw
