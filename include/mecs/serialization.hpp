#pragma once
#include "component.hpp"
#include "dyn_storage.hpp"
#include "entity.hpp"
#include "variant_storage.hpp"
#include "world.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mecs {

/**
 * @brief Per-storage-kind hooks used by the serializer.
 * @details Specialized for DynStorage and VariantStorage. A custom storage type can be made
 * serializable by providing the same three functions.
 */
template <typename S>
struct StorageCodec;

template <>
struct StorageCodec<DynStorage> {
    static ComponentTypeID type_of(const DynStorage& s) { return s.id(); }

    static const void* data(const DynStorage& s) { return s.data(); }

    static DynStorage read(const ComponentInfo& info, std::istream& in) {
        DynStorage s = DynStorage::make_default(*info.ops);
        info.deserialize_fn(s.data(), in);
        return s;
    }
};

template <typename... Ts>
struct StorageCodec<VariantStorage<Ts...>> {
    using Storage = VariantStorage<Ts...>;

    static ComponentTypeID type_of(const Storage& s) { return s.component_type(); }

    static const void* data(const Storage& s) {
        return s.visit([](const auto& v) -> const void* { return &v; });
    }

    static Storage read(const ComponentInfo& info, std::istream& in) {
        std::optional<Storage> out;
        (read_as<Ts>(info, in, out), ...);
        MECS_ASSERT(out.has_value(), "deserialize: component is not part of this storage");
        return std::move(*out);
    }

private:
    template <typename T>
    static void read_as(const ComponentInfo& info, std::istream& in, std::optional<Storage>& out) {
        if (out || info.ops->id != component_id<T>())
            return;
        if constexpr (std::is_default_constructible_v<T>) {
            T value{};
            info.deserialize_fn(&value, in);
            out.emplace(std::move(value));
        } else {
            MECS_ASSERT(false, "deserialize: component is not default-constructible");
        }
    }
};

namespace detail {

inline void write_u32(std::ostream& out, uint32_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

inline uint32_t read_u32(std::istream& in) {
    uint32_t v = 0;
    in.read(reinterpret_cast<char*>(&v), sizeof(v));
    MECS_ASSERT(in.good(), "deserialize: truncated stream");
    return v;
}

template <typename S>
void write_entity(const Entity<S>& entity, std::ostream& out) {
    std::vector<std::pair<const ComponentInfo*, const S*>> entries;
    entries.reserve(entity.size());
    for (const S& s : entity.components()) {
        const ComponentInfo* info = find_component_info(StorageCodec<S>::type_of(s));
        MECS_ASSERT(info != nullptr, "serialize: entity contains unregistered component type");
        MECS_ASSERT(info->serialize_fn != nullptr,
                    "serialize: component type has no serialize function");
        entries.emplace_back(info, &s);
    }
    // Name order keeps the output independent of hash map iteration order.
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first->name < b.first->name; });

    write_u32(out, static_cast<uint32_t>(entries.size()));
    for (auto& [info, storage] : entries) {
        write_u32(out, static_cast<uint32_t>(info->name.size()));
        out.write(info->name.data(), static_cast<std::streamsize>(info->name.size()));
        info->serialize_fn(StorageCodec<S>::data(*storage), out);
    }
}

template <typename S>
Entity<S> read_entity(std::istream& in) {
    Entity<S> entity;
    uint32_t component_count = read_u32(in);
    for (uint32_t c = 0; c < component_count; ++c) {
        uint32_t name_len = read_u32(in);
        std::string name(name_len, '\0');
        in.read(&name[0], name_len);
        MECS_ASSERT(in.good(), "deserialize: truncated stream");

        const ComponentInfo* info = find_component_info(component_id_by_name(name));
        MECS_ASSERT(info->deserialize_fn != nullptr,
                    "deserialize: component type has no deserialize function");
        entity.add(StorageCodec<S>::read(*info, in));
    }
    return entity;
}

} // namespace detail

/**
 * @brief Writes one entity as a component sequence.
 *
 * @details Format: component count (uint32), then per component its registered name
 * (uint32 length + bytes) followed by the bytes of its serialize function.
 *
 * @warning Every component must be registered via `register_component` with a serialize
 * function, or this asserts.
 */
template <typename S>
void serialize(const Entity<S>& entity, std::ostream& out) {
    detail::write_entity(entity, out);
}

/**
 * @brief Reads a component sequence written by `serialize(const Entity&, ...)` into `entity`.
 * @details Components are inserted with `Entity::add`, replacing any with the same id.
 */
template <typename S>
void deserialize(Entity<S>& entity, std::istream& in) {
    Entity<S> loaded = detail::read_entity<S>(in);
    for (S& s : loaded.components())
        entity.add(std::move(s));
}

/**
 * @brief Serializes the entity table of a World.
 *
 * @details The binary format is:
 * - Header: "MECS" (4 bytes)
 * - Version: uint32_t (currently 1)
 * - Entity Count: uint32_t
 * - Per entity, in ascending id order: the entity encoding of `serialize(const Entity&, ...)`
 *
 * Entity ids and predicates are not written: predicates are derived runtime state and must be
 * registered again after loading.
 */
template <typename S>
void serialize(const World<S>& world, std::ostream& out) {
    out.write("MECS", 4);
    detail::write_u32(out, 1);
    detail::write_u32(out, static_cast<uint32_t>(world.size()));
    for (EntityId id : world.sorted_ids())
        detail::write_entity(world[id], out);
}

/**
 * @brief Restores entities from a stream into an empty World.
 *
 * @details Entities go through `World::add` in stream order, so they receive fresh ids from
 * the target's counter and feed any predicate already registered on the target.
 *
 * @warning The target world must be empty. Every component in the stream must be registered.
 */
template <typename S>
void deserialize(World<S>& world, std::istream& in) {
    MECS_ASSERT(world.empty(), "deserialize: world must be empty");

    char magic[4] = {};
    in.read(magic, 4);
    MECS_ASSERT(in.good() && magic[0] == 'M' && magic[1] == 'E' && magic[2] == 'C' &&
                    magic[3] == 'S',
                "deserialize: invalid magic");

    uint32_t version = detail::read_u32(in);
    MECS_ASSERT(version == 1, "deserialize: unsupported version");

    uint32_t entity_count = detail::read_u32(in);
    for (uint32_t i = 0; i < entity_count; ++i)
        world.add(detail::read_entity<S>(in));
}

} // namespace mecs
