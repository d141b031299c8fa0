#pragma once

#include "resource_registry.hpp"
#include "../core/abi_error.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace scriptscene::resource {

// Resource ids one script environment may reference through the ABI.
//
// A grant remembers the registration serial it was issued for. Once that
// registration is gone the grant no longer resolves, even when the integer id
// has been handed to a new resource.
class CapabilitySet {
public:
    void authorize(const Resource& resource) {
        grants_[resource.id] = resource.serial;
    }

    void revoke(ResourceId id) { grants_.erase(id); }
    void clear() { grants_.clear(); }

    bool contains(ResourceId id) const { return grants_.count(id) != 0; }

    // Granted and still pointing at the same registration.
    bool permits(const ResourceRegistry& registry, ResourceId id) const;

    // NotAuthorized -> NotFound -> TypeMismatch, in that order.
    template <typename T>
    AccessResult<T> check_access(ResourceRegistry& registry, ResourceId id) const {
        auto it = grants_.find(id);
        if (id == kNullResource || it == grants_.end()) {
            return AccessResult<T>::fail(AbiErrorKind::NotAuthorized);
        }

        Resource* resource = registry.find(id, it->second);
        if (!resource) {
            return AccessResult<T>::fail(AbiErrorKind::NotFound);
        }

        T* payload = resource->as<T>();
        if (!payload) {
            return AccessResult<T>::fail(AbiErrorKind::TypeMismatch);
        }

        return AccessResult<T>::ok(payload);
    }

    // Same lookup, but failures throw AbiError.
    template <typename T>
    T& require(ResourceRegistry& registry, ResourceId id) const {
        auto result = check_access<T>(registry, id);
        if (!result) {
            throw AbiError(result.error, describe_denial(registry, id, ResourceTraits<T>::type, result.error));
        }
        return *result.value;
    }

    std::size_t size() const { return grants_.size(); }
    std::vector<ResourceId> ids() const;

private:
    static std::string describe_denial(const ResourceRegistry& registry, ResourceId id,
                                       ResourceType expected, AbiErrorKind error);

    std::unordered_map<ResourceId, RegistrationSerial> grants_;
};

} // namespace scriptscene::resource
