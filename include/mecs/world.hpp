#pragma once
#include "component.hpp"
#include "detail/iteration_guard.hpp"
#include "detail/range.hpp"
#include "entity.hpp"
#include "entity_id.hpp"
#include "pred_iter.hpp"
#include "predicate.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mecs {

/**
 * @brief Range over a world's whole entity table that keeps the iteration guard raised.
 * @details Yields `std::pair<const EntityId, Entity<S>>&` in unspecified order.
 */
template <typename It>
class EntityRange : public detail::Range<It> {
public:
    EntityRange(It first, It last, int& iterating)
        : detail::Range<It>(first, last), guard_(iterating) {}

private:
    detail::IterationGuard guard_;
};

/**
 * @brief The table of entities plus the set of registered predicate indices.
 *
 * @details The World is responsible for:
 * - Issuing entity ids (from 1, strictly increasing, never reused) and owning entity lifetime.
 * - Keeping every registered predicate index up to date on insertion.
 * - Handing out predicate iterators that reconcile stale ids lazily.
 *
 * Removal only touches the entity table. Predicate lists keep the removed id until an iterator
 * passes over it (tombstone) and the next `add` compacts it away.
 *
 * Read access may be shared freely. Structural changes (`add`, `remove`, `add_pred`,
 * `remove_pred`, `clear`) assert if any iterator or range over this world is still alive.
 * It is not thread-safe.
 */
template <typename S>
class World {
public:
    using Storage = S;
    using EntityType = Entity<S>;
    using Predicate = typename PredicateIndex<S>::Predicate;
    using EntityMap = std::unordered_map<EntityId, Entity<S>, EntityIdHash>;

    World() = default;
    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /**
     * @warning Asserts if `o` is being iterated: live cursors keep pointing at `o`.
     */
    World(World&& o) noexcept
        : entities_(std::move(o.entities_)), next_entity_id_(o.next_entity_id_),
          predicates_(std::move(o.predicates_)), next_pred_id_(o.next_pred_id_) {
        MECS_ASSERT(o.iterating_ == 0, "move during iteration");
    }

    /**
     * @warning Asserts if either world is being iterated.
     */
    World& operator=(World&& o) noexcept {
        MECS_ASSERT(iterating_ == 0 && o.iterating_ == 0, "move during iteration");
        entities_ = std::move(o.entities_);
        next_entity_id_ = o.next_entity_id_;
        predicates_ = std::move(o.predicates_);
        next_pred_id_ = o.next_pred_id_;
        return *this;
    }

    /**
     * @brief Builds a world by adding each entity in order.
     */
    static World from_entities(std::vector<Entity<S>> entities) {
        World w;
        for (auto& e : entities)
            w.add(std::move(e));
        return w;
    }

    // -- Add / remove --

    /**
     * @brief Inserts an entity and returns its newly issued id.
     * @details Every registered predicate index first compacts its tombstones and then tests
     * the entity, so insertion cost grows with the number of registered predicates.
     * @warning Asserts if called during iteration.
     */
    EntityId add(Entity<S> entity) {
        MECS_ASSERT(iterating_ == 0, "structural change during iteration");
        EntityId id = next_entity_id_;
        next_entity_id_.increment();

        for (auto& [pid, index] : predicates_)
            index.on_add(id, entity);

        entities_.emplace(id, std::move(entity));
        return id;
    }

    /**
     * @brief Removes an entity from the table.
     * @return The removed entity, or an empty optional if `id` is unknown.
     * @details Predicate indices are not touched here.
     * @warning Asserts if called during iteration.
     */
    std::optional<Entity<S>> remove(EntityId id) {
        MECS_ASSERT(iterating_ == 0, "structural change during iteration");
        auto it = entities_.find(id);
        if (it == entities_.end())
            return std::nullopt;
        std::optional<Entity<S>> removed(std::move(it->second));
        entities_.erase(it);
        return removed;
    }

    /**
     * @brief Removes every entity. Registered predicates stay registered.
     * @warning Asserts if called during iteration.
     */
    void clear() {
        MECS_ASSERT(iterating_ == 0, "structural change during iteration");
        entities_.clear();
    }

    // -- Access --

    Entity<S>* get(EntityId id) {
        auto it = entities_.find(id);
        return it == entities_.end() ? nullptr : &it->second;
    }

    const Entity<S>* get(EntityId id) const {
        auto it = entities_.find(id);
        return it == entities_.end() ? nullptr : &it->second;
    }

    /**
     * @brief Direct access for ids the caller knows to be live.
     * @warning Asserts if the id is unknown.
     */
    Entity<S>& operator[](EntityId id) {
        Entity<S>* e = get(id);
        MECS_ASSERT(e != nullptr, "unknown entity id");
        return *e;
    }

    const Entity<S>& operator[](EntityId id) const {
        const Entity<S>* e = get(id);
        MECS_ASSERT(e != nullptr, "unknown entity id");
        return *e;
    }

    bool contains(EntityId id) const { return entities_.find(id) != entities_.end(); }

    size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

    /** @brief The id the next `add` will issue. */
    EntityId next_id() const { return next_entity_id_; }

    // -- Predicates --

    /**
     * @brief Registers a predicate and seeds its index with one scan of the current table.
     * @param pred Pure function of an entity; it is never re-run on entities already indexed.
     * @return The predicate id, starting at 1.
     * @warning Asserts if called during iteration.
     */
    template <typename Func>
    PredicateId add_pred(Func&& pred) {
        MECS_ASSERT(iterating_ == 0, "structural change during iteration");
        if (next_pred_id_ == std::numeric_limits<PredicateId>::max()) {
            std::cerr << "mecs: predicate id space exhausted\n";
            std::abort();
        }
        PredicateId pid = next_pred_id_++;

        PredicateIndex<S> index{Predicate(std::forward<Func>(pred))};
        for (auto& [id, entity] : entities_) {
            if (index.test(entity))
                index.push(id);
        }
        predicates_.emplace(pid, std::move(index));
        return pid;
    }

    /**
     * @brief Deregisters a predicate. Its id is not reused.
     * @return false if `pid` was not registered.
     * @warning Asserts if called during iteration.
     */
    bool remove_pred(PredicateId pid) {
        MECS_ASSERT(iterating_ == 0, "structural change during iteration");
        return predicates_.erase(pid) != 0;
    }

    bool has_pred(PredicateId pid) const { return predicates_.find(pid) != predicates_.end(); }

    size_t pred_count() const { return predicates_.size(); }

    /** @brief Read-only view of a predicate index, or nullptr if `pid` is unknown. */
    const PredicateIndex<S>* predicate(PredicateId pid) const { return find_pred(pid); }

    // -- Iteration --

    /**
     * @brief Cursor over the entities matching a registered predicate.
     *
     * @details Returned by value, so it can be the range expression of a range-for:
     * @code
     * for (auto [id, entity] : world.query(pid)) { ... }
     * @endcode
     * For an unknown `pid` the cursor converts to false and yields nothing.
     */
    PredIter<S, false> query(PredicateId pid) const { return PredIter<S, false>(*this, pid); }

    PredIter<S, true> query_mut(PredicateId pid) { return PredIter<S, true>(*this, pid); }

    /**
     * @brief Cursor over the entities matching a registered predicate.
     * @return An empty optional if `pid` was never registered or has been removed.
     * @warning Store the result before iterating it: `*iter_pred(pid)` refers into a temporary
     * that does not outlive a range-for's range expression. Use `query` for that.
     */
    std::optional<PredIter<S, false>> iter_pred(PredicateId pid) const {
        if (!has_pred(pid))
            return std::nullopt;
        return PredIter<S, false>(*this, pid);
    }

    std::optional<PredIter<S, true>> iter_pred_mut(PredicateId pid) {
        if (!has_pred(pid))
            return std::nullopt;
        return PredIter<S, true>(*this, pid);
    }

    /**
     * @brief Invokes `fn(EntityId, Entity&)` for every live match of a predicate.
     * @return false if `pid` is unknown.
     */
    template <typename Func>
    bool each_pred(PredicateId pid, Func&& fn) {
        auto it = query_mut(pid);
        if (!it)
            return false;
        while (Entity<S>* e = it.next())
            fn(it.current_id(), *e);
        return true;
    }

    template <typename Func>
    bool each_pred(PredicateId pid, Func&& fn) const {
        auto it = query(pid);
        if (!it)
            return false;
        while (const Entity<S>* e = it.next())
            fn(it.current_id(), *e);
        return true;
    }

    /**
     * @brief Number of live entities matching a predicate.
     * @details Walks the index, so stale ids met along the way become tombstones.
     */
    std::optional<size_t> count_pred(PredicateId pid) const {
        auto it = query(pid);
        if (!it)
            return std::nullopt;
        size_t n = 0;
        while (it.next())
            ++n;
        return n;
    }

    /**
     * @brief Range over the whole entity table, independent of any predicate.
     */
    EntityRange<typename EntityMap::iterator> all() {
        return {entities_.begin(), entities_.end(), iterating_};
    }

    EntityRange<typename EntityMap::const_iterator> all() const {
        return {entities_.begin(), entities_.end(), iterating_};
    }

    /**
     * @brief Invokes `fn(EntityId, Entity&)` for every entity in the table.
     */
    template <typename Func>
    void each(Func&& fn) {
        for (auto& [id, entity] : all())
            fn(id, entity);
    }

    template <typename Func>
    void each(Func&& fn) const {
        for (auto& [id, entity] : all())
            fn(id, entity);
    }

    /** @brief Compares entity tables only; predicates and id counters are ignored. */
    bool operator==(const World& o) const { return entities_ == o.entities_; }
    bool operator!=(const World& o) const { return !(*this == o); }

    /**
     * @brief Prints one `#id {components}` line per entity, in id order.
     */
    friend std::ostream& operator<<(std::ostream& out, const World& w) {
        for (EntityId id : w.sorted_ids())
            out << id << ' ' << w.entities_.at(id) << '\n';
        return out;
    }

    /** @brief Live entity ids in ascending order. */
    std::vector<EntityId> sorted_ids() const {
        std::vector<EntityId> ids;
        ids.reserve(entities_.size());
        for (auto& [id, entity] : entities_)
            ids.push_back(id);
        std::sort(ids.begin(), ids.end());
        return ids;
    }

private:
    template <typename, bool>
    friend class PredIter;

    const PredicateIndex<S>* find_pred(PredicateId pid) const {
        auto it = predicates_.find(pid);
        return it == predicates_.end() ? nullptr : &it->second;
    }

    EntityMap entities_;
    EntityId next_entity_id_{1};
    std::unordered_map<PredicateId, PredicateIndex<S>> predicates_;
    PredicateId next_pred_id_ = 1;
    mutable int iterating_ = 0;
};

} // namespace mecs
