#pragma once

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

#ifndef MECS_ASSERT
#define MECS_ASSERT(expr, msg) assert((expr) && (msg))
#endif

namespace mecs {

using ComponentTypeID = uint32_t;

inline ComponentTypeID next_component_id() {
    static ComponentTypeID counter = 0;
    return counter++;
}

/**
 * @brief Process-wide identifier of a component type.
 * @details Issued on first use and stable for the rest of the process. This is the identifier
 * used by the open-set storage (`DynStorage`).
 */
template <typename T>
ComponentTypeID component_id() {
    static ComponentTypeID id = next_component_id();
    return id;
}

/**
 * @brief Detects whether `os << value` is well-formed for a const T.
 */
template <typename T, typename = void>
struct is_printable : std::false_type {};

template <typename T>
struct is_printable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                            << std::declval<const T&>())>> : std::true_type {};

template <typename T>
inline constexpr bool is_printable_v = is_printable<T>::value;

/**
 * @brief Per-type table of lifetime and debug operations for a heap-allocated component.
 *
 * @details Lets type-erased holders destroy, copy, default-create and print a value without
 * knowing its static type. Entries are nullptr where the type does not support the operation.
 */
struct ComponentOps {
    using DestroyFunc = void (*)(void* ptr);
    using CreateFunc = void* (*)();
    using CloneFunc = void* (*)(const void* src);
    using PrintFunc = void (*)(const void* ptr, std::ostream& out);

    ComponentTypeID id = 0;
    size_t size = 0;
    size_t alignment = 1;

    DestroyFunc destroy_fn = nullptr;
    CreateFunc create_fn = nullptr;
    CloneFunc clone_fn = nullptr;
    PrintFunc print_fn = nullptr;
};

template <typename T>
ComponentOps make_component_ops() {
    ComponentOps ops;
    ops.id = component_id<T>();
    ops.size = sizeof(T);
    ops.alignment = alignof(T);
    ops.destroy_fn = [](void* ptr) {
        delete static_cast<T*>(ptr);
    };
    if constexpr (std::is_default_constructible_v<T>) {
        ops.create_fn = []() -> void* {
            return new T();
        };
    }
    if constexpr (std::is_copy_constructible_v<T>) {
        ops.clone_fn = [](const void* src) -> void* {
            return new T(*static_cast<const T*>(src));
        };
    }
    if constexpr (is_printable_v<T>) {
        ops.print_fn = [](const void* ptr, std::ostream& out) {
            out << *static_cast<const T*>(ptr);
        };
    }
    return ops;
}

/**
 * @brief Returns the shared operation table for T.
 */
template <typename T>
const ComponentOps& component_ops() {
    static const ComponentOps ops = make_component_ops<T>();
    return ops;
}

// -- Stable name registry for serialization and debug output --

using SerializeFunc = void (*)(const void* elem, std::ostream& out);
using DeserializeFunc = void (*)(void* elem, std::istream& in);

/**
 * @brief Registry record binding a component type to a stable name and its binary codec.
 */
struct ComponentInfo {
    std::string name;
    const ComponentOps* ops = nullptr;
    SerializeFunc serialize_fn = nullptr;
    DeserializeFunc deserialize_fn = nullptr;
};

inline std::map<std::string, ComponentTypeID>& name_to_id_registry() {
    static std::map<std::string, ComponentTypeID> reg;
    return reg;
}

inline std::map<ComponentTypeID, ComponentInfo>& component_info_registry() {
    static std::map<ComponentTypeID, ComponentInfo> reg;
    return reg;
}

/**
 * @brief Binds a stable name and (de)serialize functions to component type T.
 * @param name Name written to serialized streams.
 * @param ser Custom serialize function; trivially copyable types default to a byte copy.
 * @param deser Custom deserialize function; trivially copyable types default to a byte copy.
 * @details Registering the same (name, type) pair again is a no-op. Reusing a name for a
 * different type, or a type under a different name, asserts.
 */
template <typename T>
void register_component(const char* name, SerializeFunc ser = nullptr,
                        DeserializeFunc deser = nullptr) {
    auto& n2i = name_to_id_registry();
    auto& infos = component_info_registry();
    ComponentTypeID id = component_id<T>();

    auto it = n2i.find(name);
    if (it != n2i.end()) {
        MECS_ASSERT(it->second == id, "component name already registered to different type");
        return;
    }
    auto it2 = infos.find(id);
    if (it2 != infos.end()) {
        MECS_ASSERT(it2->second.name == std::string(name),
                    "component type already registered with different name");
        return;
    }

    ComponentInfo info;
    info.name = name;
    info.ops = &component_ops<T>();
    info.serialize_fn = ser;
    info.deserialize_fn = deser;
    if constexpr (std::is_trivially_copyable_v<T>) {
        if (!info.serialize_fn) {
            info.serialize_fn = [](const void* elem, std::ostream& out) {
                out.write(static_cast<const char*>(elem), sizeof(T));
            };
        }
        if (!info.deserialize_fn) {
            info.deserialize_fn = [](void* elem, std::istream& in) {
                in.read(static_cast<char*>(elem), sizeof(T));
            };
        }
    }

    n2i[name] = id;
    infos.emplace(id, std::move(info));
}

inline const ComponentInfo* find_component_info(ComponentTypeID id) {
    auto& infos = component_info_registry();
    auto it = infos.find(id);
    return it == infos.end() ? nullptr : &it->second;
}

inline ComponentTypeID component_id_by_name(const std::string& name) {
    auto& n2i = name_to_id_registry();
    auto it = n2i.find(name);
    MECS_ASSERT(it != n2i.end(), "component_id_by_name: name not registered");
    return it->second;
}

inline const std::string& component_name(ComponentTypeID id) {
    const ComponentInfo* info = find_component_info(id);
    MECS_ASSERT(info != nullptr, "component_name: id not registered");
    return info->name;
}

inline bool component_registered(ComponentTypeID id) {
    return find_component_info(id) != nullptr;
}

/**
 * @brief Human readable label for a component type: its registered name, or `component#<id>`.
 */
inline std::string component_label(ComponentTypeID id) {
    if (const ComponentInfo* info = find_component_info(id))
        return info->name;
    return "component#" + std::to_string(id);
}

// -- Storage concept --
//
// A storage type S holds exactly one component value and exposes:
//   using Id;                                    equality comparable, std::hash-able
//   Id id() const;                               identifier of the held value, O(1)
//   template <class T> static Id id_of();        identifier T is stored under
//   template <class T> T* get();                 nullptr unless the held value is a T
//   template <class T> const T* get() const;

template <typename S, typename = void>
struct is_storage : std::false_type {};

template <typename S>
struct is_storage<S, std::void_t<typename S::Id, decltype(std::declval<const S&>().id()),
                                 decltype(std::hash<typename S::Id>{}(
                                     std::declval<const typename S::Id&>()))>>
    : std::is_same<std::decay_t<decltype(std::declval<const S&>().id())>, typename S::Id> {};

template <typename S>
inline constexpr bool is_storage_v = is_storage<S>::value;

} // namespace mecs
