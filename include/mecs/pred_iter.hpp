#pragma once
#include "detail/iteration_guard.hpp"
#include "entity.hpp"
#include "entity_id.hpp"

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace mecs {

template <typename S>
class World;

/**
 * @brief Cursor over one predicate index of a World.
 *
 * @details Holds the world, the predicate id and a slot position; nothing else. Every call to
 * `next()` re-resolves the predicate and looks the candidate id up in the live entity table, so
 * no entity reference is carried from one call to the next. Ids whose entity has been removed
 * are turned into tombstones as they are passed over.
 *
 * The cursor is single-pass: once exhausted it stays exhausted. Obtain a fresh one from
 * `World::query` or `World::iter_pred` to traverse again. While it exists the world rejects
 * structural changes.
 *
 * A cursor over an unregistered predicate id is invalid: it converts to false and yields
 * nothing.
 *
 * @tparam Mutable Whether entities are yielded as mutable references.
 */
template <typename S, bool Mutable>
class PredIter {
public:
    using WorldType = std::conditional_t<Mutable, World<S>, const World<S>>;
    using EntityType = std::conditional_t<Mutable, Entity<S>, const Entity<S>>;

    /** @brief One yielded match. */
    struct Item {
        EntityId id;
        EntityType& entity;
    };

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Item;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Item;

        iterator() = default;
        explicit iterator(PredIter* owner) : owner_(owner) { advance(); }

        Item operator*() const { return Item{owner_->current_id(), *current_}; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& o) const { return current_ == o.current_; }
        bool operator!=(const iterator& o) const { return current_ != o.current_; }

    private:
        void advance() { current_ = owner_ ? owner_->next() : nullptr; }

        PredIter* owner_ = nullptr;
        EntityType* current_ = nullptr;
    };

    PredIter(WorldType& world, PredicateId pred)
        : world_(&world), pred_(pred), guard_(world.iterating_) {}

    PredIter(PredIter&&) noexcept = default;
    PredIter& operator=(PredIter&&) noexcept = default;
    PredIter(const PredIter&) = delete;
    PredIter& operator=(const PredIter&) = delete;

    /**
     * @brief Advances to the next live match.
     * @return The matching entity, or nullptr once the candidate list is exhausted.
     */
    EntityType* next() {
        const auto* index = world_->find_pred(pred_);
        if (!index)
            return nullptr;
        while (cursor_ < index->size()) {
            size_t slot = cursor_++;
            EntityId id = index->at(slot);
            if (id.is_null())
                continue;
            if (EntityType* e = world_->get(id)) {
                current_id_ = id;
                return e;
            }
            index->tombstone(slot);
        }
        current_id_ = NULL_ENTITY;
        return nullptr;
    }

    /** @brief Whether the predicate id names a registered predicate. */
    bool valid() const { return world_->find_pred(pred_) != nullptr; }

    explicit operator bool() const { return valid(); }

    /** @brief Id of the entity returned by the last successful `next()`. */
    EntityId current_id() const { return current_id_; }

    PredicateId predicate() const { return pred_; }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    WorldType* world_;
    PredicateId pred_;
    size_t cursor_ = 0;
    EntityId current_id_;
    detail::IterationGuard guard_;
};

} // namespace mecs
