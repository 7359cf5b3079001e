#pragma once

#include "Entity.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace scramble
{
    // Live entities keyed by id. Iteration follows id order, which is creation order.
    class EntityStore
    {
    public:
        using Map = std::map<EntityId, Entity>;
        using ReleaseHook = std::function<void(const Entity &)>;

        EntityStore() = default;

        // Assigns the next id to `entity` and stores it. Returns the new id.
        EntityId insert(Entity entity);

        Entity *find(EntityId id);
        const Entity *find(EntityId id) const;

        // Removes every entity whose activity is Despawning, calling the release hook for each.
        // Must run after the full update pass of a tick, never during it.
        std::vector<EntityId> reapDespawned();

        bool erase(EntityId id);
        void clear();

        std::size_t size() const { return entities.size(); }
        bool empty() const { return entities.empty(); }
        std::size_t countByKind(EntityKind kind) const;

        EntityId peekNextId() const { return next_id; }

        // Called for each entity removed by reapDespawned(), erase() or clear().
        void setReleaseHook(ReleaseHook hook) { release_hook = std::move(hook); }

        Map::iterator begin() { return entities.begin(); }
        Map::iterator end() { return entities.end(); }
        Map::const_iterator begin() const { return entities.begin(); }
        Map::const_iterator end() const { return entities.end(); }

    private:
        void release(const Entity &entity) const;

        Map entities;
        EntityId next_id = 1;
        ReleaseHook release_hook;
    };

} // namespace scramble
