#include "capability_set.hpp"

#include <algorithm>

namespace scriptscene::resource {

bool CapabilitySet::permits(const ResourceRegistry& registry, ResourceId id) const {
    auto it = grants_.find(id);
    if (it == grants_.end()) return false;

    const Resource* r = registry.find(id);
    return r && r->serial == it->second;
}

std::vector<ResourceId> CapabilitySet::ids() const {
    std::vector<ResourceId> out;
    out.reserve(grants_.size());
    for (const auto& [id, serial] : grants_) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string CapabilitySet::describe_denial(const ResourceRegistry& registry, ResourceId id,
                                           ResourceType expected, AbiErrorKind error) {
    std::string msg = std::string(resource_type_name(expected)) + " " + std::to_string(id);

    switch (error) {
        case AbiErrorKind::NotAuthorized:
            msg += ": missing or unpermitted handle";
            break;
        case AbiErrorKind::NotFound:
            msg += ": no live resource";
            break;
        case AbiErrorKind::TypeMismatch: {
            const Resource* r = registry.find(id);
            msg += ": handle points to a ";
            msg += r ? resource_type_name(r->type()) : "?";
            break;
        }
        default:
            msg += ": access denied";
            break;
    }
    return msg;
}

} // namespace scriptscene::resource
