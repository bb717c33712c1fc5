#include "db/backend_factory.hpp"
#include "db/embedded/sqlite_adapter.hpp"
#include "core/utils.hpp"

#ifdef DPGW_ENABLE_POSTGRESQL
#include "db/postgresql/pg_adapter.hpp"
#endif
#ifdef DPGW_ENABLE_BIGQUERY
#include "db/bigquery/bigquery_adapter.hpp"
#endif

#include <format>
#include <mutex>
#include <stdexcept>

namespace dpgw {

BackendFactory::BackendFactory(const BackendFactory& other) {
    std::shared_lock lock(other.mutex_);
    constructors_ = other.constructors_;
}

BackendFactory& BackendFactory::operator=(const BackendFactory& other) {
    if (this == &other) {
        return *this;
    }
    std::map<std::string, Constructor> copy;
    {
        std::shared_lock lock(other.mutex_);
        copy = other.constructors_;
    }
    std::unique_lock lock(mutex_);
    constructors_ = std::move(copy);
    return *this;
}

BackendFactory BackendFactory::with_builtin_backends() {
    BackendFactory factory;

    const auto sqlite = [](const BackendOptions& options) -> std::shared_ptr<IBackendAdapter> {
        return std::make_shared<SqliteAdapter>(options);
    };
    factory.register_backend("sqlite", sqlite);
    factory.register_backend("embedded", sqlite);

#ifdef DPGW_ENABLE_POSTGRESQL
    const auto postgres = [](const BackendOptions& options) -> std::shared_ptr<IBackendAdapter> {
        return std::make_shared<PgAdapter>(options);
    };
    factory.register_backend("postgres", postgres);
    factory.register_backend("postgresql", postgres);
    factory.register_backend("supabase", postgres);
#endif

#ifdef DPGW_ENABLE_BIGQUERY
    factory.register_backend("bigquery", [](const BackendOptions& options) -> std::shared_ptr<IBackendAdapter> {
        return std::make_shared<BigQueryAdapter>(options);
    });
#endif

    return factory;
}

void BackendFactory::register_backend(const std::string& type, Constructor ctor) {
    const auto key = utils::to_lower(type);
    std::unique_lock lock(mutex_);
    if (constructors_.contains(key)) {
        utils::log::debug(std::format("BackendFactory: replacing constructor for '{}'", key));
    }
    constructors_[key] = std::move(ctor);
}

std::shared_ptr<IBackendAdapter> BackendFactory::create(
    const std::string& type, const BackendOptions& options) const {

    const auto key = utils::to_lower(type);
    Constructor ctor;
    {
        std::shared_lock lock(mutex_);
        const auto it = constructors_.find(key);
        if (it != constructors_.end()) {
            ctor = it->second;
        }
    }

    if (!ctor) {
        throw std::invalid_argument(std::format(
            "Unsupported database type: {}. Supported types: {}",
            type, utils::join(supported_types(), ", ")));
    }

    utils::log::info(std::format("BackendFactory: creating '{}' adapter", key));
    return ctor(options);
}

bool BackendFactory::has_backend(const std::string& type) const {
    std::shared_lock lock(mutex_);
    return constructors_.contains(utils::to_lower(type));
}

std::vector<std::string> BackendFactory::supported_types() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> types;
    types.reserve(constructors_.size());
    for (const auto& [key, _] : constructors_) {
        types.push_back(key);
    }
    return types;
}

} // namespace dpgw
