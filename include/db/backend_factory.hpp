#pragma once

#include "db/backend_adapter.hpp"

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief Maps engine keys to adapter constructors
 *
 * Keys are case-insensitive ("SQLite" and "sqlite" are the same backend).
 * Several keys may point at one adapter (postgres / postgresql / supabase).
 *
 * Usage:
 *   auto factory = BackendFactory::with_builtin_backends();
 *   auto adapter = factory.create("sqlite", options);
 *
 * Registration and lookup may race freely; the map is guarded by a
 * shared_mutex.
 */
class BackendFactory {
public:
    using Constructor = std::function<std::shared_ptr<IBackendAdapter>(const BackendOptions&)>;

    BackendFactory() = default;

    BackendFactory(const BackendFactory& other);
    BackendFactory& operator=(const BackendFactory& other);

    /**
     * @brief Factory with every engine compiled into this build
     *
     * sqlite, embedded, and (when enabled at configure time) postgres,
     * postgresql, supabase, bigquery.
     */
    [[nodiscard]] static BackendFactory with_builtin_backends();

    /** @brief Register (or replace) a constructor under @p type */
    void register_backend(const std::string& type, Constructor ctor);

    /**
     * @brief Instantiate the adapter registered under @p type
     * @throws std::invalid_argument naming the supported types when unknown
     */
    [[nodiscard]] std::shared_ptr<IBackendAdapter> create(
        const std::string& type, const BackendOptions& options = {}) const;

    [[nodiscard]] bool has_backend(const std::string& type) const;

    /** @brief Registered keys, sorted */
    [[nodiscard]] std::vector<std::string> supported_types() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Constructor> constructors_;
};

} // namespace dpgw
