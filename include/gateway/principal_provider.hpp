#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dpgw {

struct PrincipalProfile {
    std::string id;
    std::string role;
    std::string governance_level;
    std::vector<std::string> business_processes;
};

/**
 * @brief Looks up who is asking, for envelope annotation only
 *
 * Nothing returned here changes which SQL runs.
 */
class IPrincipalProvider {
public:
    virtual ~IPrincipalProvider() = default;

    [[nodiscard]] virtual std::optional<PrincipalProfile> find(const std::string& principal_id) const = 0;
};

/**
 * @brief Principals from [[principals]] in the config file
 */
class StaticPrincipalProvider : public IPrincipalProvider {
public:
    explicit StaticPrincipalProvider(const std::vector<PrincipalConfig>& principals);

    [[nodiscard]] std::optional<PrincipalProfile> find(const std::string& principal_id) const override;

    [[nodiscard]] size_t size() const { return profiles_.size(); }

private:
    std::unordered_map<std::string, PrincipalProfile> profiles_;
};

} // namespace dpgw
