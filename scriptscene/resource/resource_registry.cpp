#include "resource_registry.hpp"

#include "../core/abi_error.hpp"

#include <algorithm>

namespace scriptscene::resource {

ResourceId ResourceRegistry::allocate_id() {
    if (!freeIds_.empty()) {
        // Oldest released id first.
        const ResourceId id = freeIds_.front();
        freeIds_.pop_front();
        return id;
    }

    if (nextId_ == 0) {
        throw AbiError(AbiErrorKind::InvalidState, "resource id space exhausted");
    }
    return nextId_++;
}

Resource& ResourceRegistry::add(EnvironmentId owner, std::string name, ResourceData data) {
    const ResourceId id = allocate_id();

    auto resource = std::make_unique<Resource>();
    resource->id = id;
    resource->serial = nextSerial_++;
    resource->name = std::move(name);
    resource->owner = owner;
    resource->data = std::move(data);

    Resource& ref = *resource;
    resources_[id] = std::move(resource);
    return ref;
}

Resource* ResourceRegistry::find(ResourceId id) {
    if (id == kNullResource) return nullptr;
    auto it = resources_.find(id);
    return it == resources_.end() ? nullptr : it->second.get();
}

const Resource* ResourceRegistry::find(ResourceId id) const {
    if (id == kNullResource) return nullptr;
    auto it = resources_.find(id);
    return it == resources_.end() ? nullptr : it->second.get();
}

Resource* ResourceRegistry::find(ResourceId id, RegistrationSerial serial) {
    Resource* r = find(id);
    if (!r || r->serial != serial) return nullptr;
    return r;
}

bool ResourceRegistry::remove(ResourceId id) {
    auto it = resources_.find(id);
    if (it == resources_.end()) {
        return false;
    }

    resources_.erase(it);
    freeIds_.push_back(id);
    return true;
}

std::size_t ResourceRegistry::count_of(ResourceType type) const {
    std::size_t n = 0;
    for (const auto& [id, r] : resources_) {
        if (r->type() == type) ++n;
    }
    return n;
}

std::vector<Resource*> ResourceRegistry::find_by_name(ResourceType type, std::string_view name) {
    std::vector<Resource*> out;
    for (Resource* r : ordered()) {
        if (r->type() == type && r->name == name) {
            out.push_back(r);
        }
    }
    return out;
}

std::vector<Resource*> ResourceRegistry::ordered() {
    std::vector<Resource*> out;
    out.reserve(resources_.size());
    for (auto& [id, r] : resources_) {
        out.push_back(r.get());
    }
    std::sort(out.begin(), out.end(), [](const Resource* a, const Resource* b) {
        return a->serial < b->serial;
    });
    return out;
}

} // namespace scriptscene::resource
