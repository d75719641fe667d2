#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "deltaledger/Entity.hpp"
#include "deltaledger/LoadReport.hpp"

namespace deltaledger {

struct EntityKey {
    EntityKind kind;
    std::string entityId;

    // By id first so commit order follows entity ids.
    bool operator<(const EntityKey& other) const {
        if (entityId != other.entityId) return entityId < other.entityId;
        return kind < other.kind;
    }
    bool operator==(const EntityKey& other) const {
        return kind == other.kind && entityId == other.entityId;
    }
};

// The only holder of current state: a table of entity revisions keyed by
// (kind, id) plus the set of keys changed since load.
class EntityStore {
public:
    enum class ApplyOutcome { Inserted, Replaced, Stale, Conflict };

    explicit EntityStore(std::string rootDir = "");

    const std::string& rootDir() const { return rootDir_; }

    // Current view: tombstoned entities are not returned.
    const Entity* find(EntityKind kind, const std::string& entityId) const;
    const Entity* find(const std::string& entityId) const;
    std::vector<const Entity*> entities(EntityKind kind) const;
    std::size_t size() const;

    // Latest revision including tombstones.
    const Entity* findRevision(EntityKind kind, const std::string& entityId) const;
    std::size_t revisionCount() const { return entities_.size(); }

    // Sole mutation entry point. change runs against a copy; the copy
    // replaces the stored revision only if change returns normally and left
    // the id, kind and version stamp alone. Throws std::out_of_range for an
    // unknown entity and std::invalid_argument for an identity change.
    void mutate(EntityKind kind, const std::string& entityId, const std::function<void(Entity&)>& change);

    // Adds a new entity. Ids are never reused, tombstoned ones included.
    void insert(Entity entity);

    // Tombstones the entity through mutate().
    void remove(EntityKind kind, const std::string& entityId);

    const std::set<EntityKey>& dirty() const { return dirty_; }
    bool isDirty() const { return !dirty_.empty(); }

    // Dirty entities in key order.
    std::vector<Entity> dirtyEntities() const;

    // Load side, no dirty tracking. Whole-record replace when the revision's
    // counter is newer than the stored one.
    ApplyOutcome applyRevision(const Entity& revision);

    // Commit side: stores freshly stamped revisions and clears their keys
    // from the dirty set.
    void acceptCommit(const std::vector<Entity>& stamped);

    LoadReport& report() { return report_; }
    const LoadReport& report() const { return report_; }

private:
    std::string rootDir_;
    std::map<EntityKey, Entity> entities_;
    std::set<EntityKey> dirty_;
    LoadReport report_;
};

} // namespace deltaledger
