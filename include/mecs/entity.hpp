#pragma once
#include "component.hpp"
#include "detail/range.hpp"

#include <optional>
#include <ostream>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mecs {

/**
 * @brief A record grouping component storages, at most one per component identifier.
 *
 * @details An Entity is a plain value: it owns its storages and has no internal
 * synchronization. Adding a storage whose identifier is already present replaces the old
 * storage and hands it back to the caller.
 *
 * @tparam S The storage type (`DynStorage`, `VariantStorage<...>`, or any type modelling the
 * storage concept described in component.hpp).
 */
template <typename S>
class Entity {
    static_assert(is_storage_v<S>, "Entity requires a component storage type");

public:
    using Storage = S;
    using Id = typename S::Id;
    using Map = std::unordered_map<Id, S>;

    Entity() = default;

    /**
     * @brief Builds an entity from storages, in order.
     * @details A later storage with the same identifier as an earlier one replaces it.
     */
    static Entity from_components(std::vector<S> components) {
        Entity e;
        for (auto& s : components)
            e.add(std::move(s));
        return e;
    }

    // -- Add / remove --

    /**
     * @brief Inserts a storage under its own identifier.
     * @param storage The storage to insert.
     * @return The storage previously held under that identifier, if any.
     */
    std::optional<S> add(S storage) {
        Id id = storage.id();
        auto it = components_.find(id);
        if (it != components_.end()) {
            std::optional<S> previous(std::move(it->second));
            it->second = std::move(storage);
            return previous;
        }
        components_.emplace(id, std::move(storage));
        return std::nullopt;
    }

    /**
     * @brief Wraps a value in a storage and adds it.
     * @return The storage previously held under the value's identifier, if any.
     */
    template <typename T>
    std::optional<S> emplace(T&& value) {
        return add(S(std::forward<T>(value)));
    }

    /**
     * @brief Removes the storage of component type T.
     * @return The removed storage, or an empty optional if T was absent.
     */
    template <typename T>
    std::optional<S> remove() {
        return remove_id(S::template id_of<T>());
    }

    std::optional<S> remove_id(const Id& id) {
        auto it = components_.find(id);
        if (it == components_.end())
            return std::nullopt;
        std::optional<S> removed(std::move(it->second));
        components_.erase(it);
        return removed;
    }

    void clear() { components_.clear(); }

    // -- Access --

    /**
     * @brief Retrieves component T.
     * @details Looks the storage up by T's identifier, then asks the storage to view itself as
     * T. Either step failing yields nullptr.
     */
    template <typename T>
    T* get() {
        S* storage = get_id(S::template id_of<T>());
        return storage ? storage->template get<T>() : nullptr;
    }

    template <typename T>
    const T* get() const {
        const S* storage = get_id(S::template id_of<T>());
        return storage ? storage->template get<T>() : nullptr;
    }

    /** @brief Raw storage lookup without type resolution. */
    S* get_id(const Id& id) {
        auto it = components_.find(id);
        return it == components_.end() ? nullptr : &it->second;
    }

    const S* get_id(const Id& id) const {
        auto it = components_.find(id);
        return it == components_.end() ? nullptr : &it->second;
    }

    template <typename T>
    bool has() const {
        return has_id(S::template id_of<T>());
    }

    bool has_id(const Id& id) const { return components_.find(id) != components_.end(); }

    size_t size() const { return components_.size(); }
    bool empty() const { return components_.empty(); }

    // -- Iteration --
    // Order is unspecified and stable only while the entity is not modified.

    detail::KeyRange<Map> ids() const {
        using It = typename detail::KeyRange<Map>::iterator_type;
        return {It(components_.begin()), It(components_.end())};
    }

    detail::ConstValueRange<Map> components() const {
        using It = typename detail::ConstValueRange<Map>::iterator_type;
        return {It(components_.begin()), It(components_.end())};
    }

    detail::ValueRange<Map> components() {
        using It = typename detail::ValueRange<Map>::iterator_type;
        return {It(components_.begin()), It(components_.end())};
    }

    bool operator==(const Entity& o) const { return components_ == o.components_; }
    bool operator!=(const Entity& o) const { return !(*this == o); }

    friend std::ostream& operator<<(std::ostream& out, const Entity& e) {
        out << '{';
        bool first = true;
        for (const S& s : e.components()) {
            if (!first)
                out << ", ";
            out << s;
            first = false;
        }
        return out << '}';
    }

private:
    Map components_;
};

/**
 * @brief Builds an entity of storage type S from storages or component values.
 *
 * @code
 * auto e = mecs::make_entity<mecs::DynStorage>(5, std::string("hello"));
 * @endcode
 */
template <typename S, typename... Args>
Entity<S> make_entity(Args&&... args) {
    Entity<S> e;
    (e.add(S(std::forward<Args>(args))), ...);
    return e;
}

} // namespace mecs
