#pragma once

#include "db/idb_connection.hpp"

#include <memory>
#include <string>

namespace dpgw {

/**
 * @brief Creates native connections for the pool
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new connection
     * @return nullptr on failure (already logged)
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace dpgw
