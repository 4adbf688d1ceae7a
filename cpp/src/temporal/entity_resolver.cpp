#include "kairos/temporal/entity_resolver.hpp"

#include <utility>

namespace kairos::temporal {

using namespace kairos::core;

void CatalogEntityResolver::put(const OwnerRef& owner, EntityInfo info) {
    entries_[owner] = std::move(info);
}

bool CatalogEntityResolver::erase(const OwnerRef& owner) noexcept {
    return entries_.erase(owner) > 0;
}

Status CatalogEntityResolver::resolve(const OwnerRef& owner, EntityInfo* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::External, StatusCode::Invalid);
    }

    const auto it = entries_.find(owner);
    if (it == entries_.end()) {
        return with_owner(make_status(StatusDomain::External, StatusCode::NotFound), owner);
    }

    *out = it->second;
    return ok_status();
}

} // namespace kairos::temporal
