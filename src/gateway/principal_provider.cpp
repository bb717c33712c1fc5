#include "gateway/principal_provider.hpp"
#include "core/utils.hpp"

#include <format>

namespace dpgw {

StaticPrincipalProvider::StaticPrincipalProvider(const std::vector<PrincipalConfig>& principals) {
    for (const auto& p : principals) {
        PrincipalProfile profile{p.id, p.role, p.governance_level, p.business_processes};
        if (!profiles_.emplace(p.id, std::move(profile)).second) {
            utils::log::warn(std::format("Principals: duplicate id '{}' ignored", p.id));
        }
    }
}

std::optional<PrincipalProfile> StaticPrincipalProvider::find(const std::string& principal_id) const {
    const auto it = profiles_.find(principal_id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace dpgw
