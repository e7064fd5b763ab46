#pragma once
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <limits>

namespace mecs {

/**
 * @brief Handle of an entity inside a World.
 *
 * @details Identifiers are issued in strictly increasing order starting at 1 and are never
 * reused. The value 0 is the null identifier: it never names a live entity.
 */
struct EntityId {
    /**
     * @brief Raw identifier value. 0 means null.
     */
    uint64_t value = 0;

    constexpr EntityId() = default;
    constexpr explicit EntityId(uint64_t start) : value(start) {}

    /**
     * @brief The null identifier.
     */
    static constexpr EntityId null() { return EntityId{}; }

    constexpr bool is_null() const { return value == 0; }

    /**
     * @brief Advances to the next identifier.
     * @details Exhausting the identifier space aborts the process rather than wrapping, which
     * would hand out an identifier that may still be referenced.
     */
    EntityId& increment() {
        if (value == std::numeric_limits<uint64_t>::max()) {
            std::cerr << "mecs: entity id space exhausted\n";
            std::abort();
        }
        ++value;
        return *this;
    }

    constexpr bool operator==(const EntityId& o) const { return value == o.value; }
    constexpr bool operator!=(const EntityId& o) const { return value != o.value; }
    constexpr bool operator<(const EntityId& o) const { return value < o.value; }
    constexpr bool operator>(const EntityId& o) const { return value > o.value; }
    constexpr bool operator<=(const EntityId& o) const { return value <= o.value; }
    constexpr bool operator>=(const EntityId& o) const { return value >= o.value; }

    friend std::ostream& operator<<(std::ostream& out, const EntityId& id) {
        if (id.is_null())
            return out << "#null";
        return out << '#' << id.value;
    }
};

inline constexpr EntityId NULL_ENTITY{};

/**
 * @brief Hasher for using EntityId keys in unordered containers.
 */
struct EntityIdHash {
    size_t operator()(const EntityId& id) const { return std::hash<uint64_t>{}(id.value); }
};

/**
 * @brief Identifier of a registered predicate. Issued from 1; 0 is never issued.
 */
using PredicateId = size_t;

} // namespace mecs

namespace std {
template <>
struct hash<mecs::EntityId> {
    size_t operator()(const mecs::EntityId& id) const { return mecs::EntityIdHash{}(id); }
};
} // namespace std
