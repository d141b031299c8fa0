#pragma once

#include "resources.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace scriptscene::resource {

// Engine-wide id -> resource table.
//
// Ids are recycled after removal (0 is never handed out). Every registration
// also receives a serial that is never reused, so holders of a stale id can be
// told apart from the resource that now owns the integer.
class ResourceRegistry {
public:
    ResourceRegistry() = default;

    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    Resource& add(EnvironmentId owner, std::string name, ResourceData data);

    Resource* find(ResourceId id);
    const Resource* find(ResourceId id) const;

    // Live resource with the given id and serial, or nullptr.
    Resource* find(ResourceId id, RegistrationSerial serial);

    template <typename T>
    T* find_as(ResourceId id) {
        Resource* r = find(id);
        return r ? r->as<T>() : nullptr;
    }

    // Drops the mapping; the id goes back on the free list. Returns false if
    // the id was not registered.
    bool remove(ResourceId id);

    bool contains(ResourceId id) const { return resources_.count(id) != 0; }
    std::size_t size() const { return resources_.size(); }
    std::size_t count_of(ResourceType type) const;

    // Resources of `type` named `name`, in registration order.
    std::vector<Resource*> find_by_name(ResourceType type, std::string_view name);

    // Resources in registration order.
    std::vector<Resource*> ordered();

    template <typename Fn>
    void for_each(Fn&& fn) {
        for (Resource* r : ordered()) {
            fn(*r);
        }
    }

private:
    ResourceId allocate_id();

    std::unordered_map<ResourceId, std::unique_ptr<Resource>> resources_;
    std::deque<ResourceId> freeIds_;
    ResourceId nextId_{1};
    RegistrationSerial nextSerial_{1};
};

} // namespace scriptscene::resource
