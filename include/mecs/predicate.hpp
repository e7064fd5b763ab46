#pragma once
#include "entity.hpp"
#include "entity_id.hpp"

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace mecs {

/**
 * @brief A registered predicate plus its cached list of candidate entity ids.
 *
 * @details The list is reconciled lazily. Removing an entity from the world leaves its id in
 * the list; iteration turns such ids into null tombstones, and the next insertion into the
 * owning world compacts the tombstones away before testing the new entity.
 *
 * The predicate must be a pure function of the entity: results already in the list are never
 * re-tested.
 */
template <typename S>
class PredicateIndex {
public:
    using Predicate = std::function<bool(const Entity<S>&)>;

    explicit PredicateIndex(Predicate pred) : pred_(std::move(pred)) {}

    bool test(const Entity<S>& e) const { return pred_(e); }

    /** @brief Appends a candidate without testing it (used while seeding). */
    void push(EntityId id) { ids_.push_back(id); }

    /**
     * @brief Insertion-time maintenance: compacts tombstones, then appends `id` if `e` matches.
     */
    void on_add(EntityId id, const Entity<S>& e) {
        sweep();
        if (pred_(e))
            ids_.push_back(id);
    }

    /**
     * @brief Drops every tombstone, preserving the order of the remaining ids.
     * @return Number of tombstones dropped.
     */
    size_t sweep() {
        auto it = std::remove_if(ids_.begin(), ids_.end(),
                                 [](const EntityId& id) { return id.is_null(); });
        size_t dropped = static_cast<size_t>(std::distance(it, ids_.end()));
        ids_.erase(it, ids_.end());
        return dropped;
    }

    /** @brief Number of slots, tombstones included. */
    size_t size() const { return ids_.size(); }

    size_t tombstones() const {
        return static_cast<size_t>(std::count_if(
            ids_.begin(), ids_.end(), [](const EntityId& id) { return id.is_null(); }));
    }

    EntityId at(size_t slot) const { return ids_[slot]; }

    /**
     * @brief Marks a slot whose entity no longer exists.
     * @details Callable through a const index: tombstoning does not change which live entities
     * the index reports.
     */
    void tombstone(size_t slot) const { ids_[slot] = NULL_ENTITY; }

    const std::vector<EntityId>& candidates() const { return ids_; }

private:
    Predicate pred_;
    mutable std::vector<EntityId> ids_;
};

} // namespace mecs
