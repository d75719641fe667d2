#include "deltaledger/EntityStore.hpp"

#include <stdexcept>
#include <utility>

namespace deltaledger {

EntityStore::EntityStore(std::string rootDir) : rootDir_(std::move(rootDir)) {}

const Entity* EntityStore::find(EntityKind kind, const std::string& entityId) const {
    const Entity* e = findRevision(kind, entityId);
    if (!e || e->isTombstone) return nullptr;
    return e;
}

const Entity* EntityStore::find(const std::string& entityId) const {
    for (EntityKind kind : allEntityKinds()) {
        if (const Entity* e = find(kind, entityId)) return e;
    }
    return nullptr;
}

std::vector<const Entity*> EntityStore::entities(EntityKind kind) const {
    std::vector<const Entity*> out;
    for (const auto& kv : entities_) {
        if (kv.first.kind == kind && !kv.second.isTombstone) out.push_back(&kv.second);
    }
    return out;
}

std::size_t EntityStore::size() const {
    std::size_t n = 0;
    for (const auto& kv : entities_) {
        if (!kv.second.isTombstone) ++n;
    }
    return n;
}

const Entity* EntityStore::findRevision(EntityKind kind, const std::string& entityId) const {
    auto it = entities_.find(EntityKey{kind, entityId});
    return it == entities_.end() ? nullptr : &it->second;
}

void EntityStore::mutate(EntityKind kind, const std::string& entityId, const std::function<void(Entity&)>& change) {
    EntityKey key{kind, entityId};
    auto it = entities_.find(key);
    if (it == entities_.end()) {
        throw std::out_of_range(std::string("no ") + entityTypeName(kind) + " with id " + entityId);
    }

    Entity copy = it->second;
    change(copy);

    if (copy.entityId != entityId || copy.kind() != kind) {
        throw std::invalid_argument("mutation may not change the id or kind of " + entityId);
    }
    if (copy.entityVersion != it->second.entityVersion) {
        throw std::invalid_argument("mutation may not stamp " + entityId + "; versions are minted at commit");
    }

    it->second = std::move(copy);
    dirty_.insert(key);
}

void EntityStore::insert(Entity entity) {
    if (entity.entityId.empty()) throw std::invalid_argument("entity id must not be empty");
    EntityKey key{entity.kind(), entity.entityId};
    if (entities_.count(key)) {
        throw std::invalid_argument(std::string(entityTypeName(key.kind)) + " id " + key.entityId + " already used");
    }
    entities_.emplace(key, std::move(entity));
    dirty_.insert(key);
}

void EntityStore::remove(EntityKind kind, const std::string& entityId) {
    mutate(kind, entityId, [](Entity& e) { e.isTombstone = true; });
}

std::vector<Entity> EntityStore::dirtyEntities() const {
    std::vector<Entity> out;
    out.reserve(dirty_.size());
    for (const auto& key : dirty_) out.push_back(entities_.at(key));
    return out;
}

EntityStore::ApplyOutcome EntityStore::applyRevision(const Entity& revision) {
    EntityKey key{revision.kind(), revision.entityId};
    auto it = entities_.find(key);
    if (it == entities_.end()) {
        entities_.emplace(key, revision);
        return ApplyOutcome::Inserted;
    }
    const Counter current = it->second.entityVersion.counter;
    if (revision.entityVersion.counter > current) {
        it->second = revision;
        return ApplyOutcome::Replaced;
    }
    if (revision.entityVersion.counter == current && !sameRevision(revision, it->second)) {
        return ApplyOutcome::Conflict;
    }
    return ApplyOutcome::Stale;
}

void EntityStore::acceptCommit(const std::vector<Entity>& stamped) {
    for (const auto& e : stamped) {
        EntityKey key{e.kind(), e.entityId};
        entities_[key] = e;
        dirty_.erase(key);
    }
    for (const auto& e : stamped) {
        if (e.entityVersion.counter > report_.knowledge) report_.knowledge = e.entityVersion.counter;
    }
}

} // namespace deltaledger
