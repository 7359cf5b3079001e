#include "EntityStore.hpp"

#include <algorithm>

namespace scramble
{

    EntityId EntityStore::insert(Entity entity)
    {
        EntityId id = next_id++;
        entity.id = id;
        entities.emplace(id, std::move(entity));
        return id;
    }

    Entity *EntityStore::find(EntityId id)
    {
        auto it = entities.find(id);
        return it == entities.end() ? nullptr : &it->second;
    }

    const Entity *EntityStore::find(EntityId id) const
    {
        auto it = entities.find(id);
        return it == entities.end() ? nullptr : &it->second;
    }

    std::vector<EntityId> EntityStore::reapDespawned()
    {
        std::vector<EntityId> removed;
        for (const auto &entry : entities)
        {
            if (entry.second.activity == ActivityState::Despawning)
            {
                removed.push_back(entry.first);
            }
        }

        for (EntityId id : removed)
        {
            auto it = entities.find(id);
            release(it->second);
            entities.erase(it);
        }
        return removed;
    }

    bool EntityStore::erase(EntityId id)
    {
        auto it = entities.find(id);
        if (it == entities.end())
        {
            return false;
        }
        release(it->second);
        entities.erase(it);
        return true;
    }

    void EntityStore::clear()
    {
        for (const auto &entry : entities)
        {
            release(entry.second);
        }
        entities.clear();
        next_id = 1;
    }

    std::size_t EntityStore::countByKind(EntityKind kind) const
    {
        return static_cast<std::size_t>(std::count_if(entities.begin(), entities.end(),
                                                      [kind](const Map::value_type &entry)
                                                      { return entry.second.kind == kind; }));
    }

    void EntityStore::release(const Entity &entity) const
    {
        if (release_hook)
        {
            release_hook(entity);
        }
    }

} // namespace scramble
