#pragma once
#include "component.hpp"

#include <cstddef>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace mecs {

namespace detail {

template <typename T, typename... Ts>
struct type_index;

template <typename T, typename... Ts>
struct type_index<T, T, Ts...> : std::integral_constant<size_t, 0> {};

template <typename T, typename U, typename... Ts>
struct type_index<T, U, Ts...> : std::integral_constant<size_t, 1 + type_index<T, Ts...>::value> {};

template <typename T, typename... Ts>
inline constexpr bool contains_type_v = (std::is_same_v<T, Ts> || ...);

template <typename... Ts>
struct all_distinct : std::true_type {};

template <typename T, typename... Ts>
struct all_distinct<T, Ts...>
    : std::bool_constant<!contains_type_v<T, Ts...> && all_distinct<Ts...>::value> {};

} // namespace detail

/**
 * @brief Closed-set component storage over a fixed list of component types.
 *
 * @details The identifier of a type is its position in `Ts...`, fixed at compile time.
 * `get<T>()` succeeds exactly when the active alternative is T. Every type must appear once.
 *
 * @code
 * using Components = mecs::VariantStorage<Position, Velocity, std::string>;
 * static_assert(Components::id_of<Velocity>() == 1);
 * @endcode
 */
template <typename... Ts>
class VariantStorage {
    static_assert(sizeof...(Ts) > 0, "VariantStorage requires at least one component type");
    static_assert(detail::all_distinct<Ts...>::value,
                  "VariantStorage component types must be distinct");

public:
    using Id = size_t;
    using Variant = std::variant<Ts...>;

    static constexpr size_t type_count = sizeof...(Ts);

    template <typename T>
    static constexpr bool holds_type = detail::contains_type_v<T, Ts...>;

    template <typename T, typename U = std::decay_t<T>,
              typename = std::enable_if_t<detail::contains_type_v<U, Ts...>>>
    VariantStorage(T&& value) : value_(std::in_place_type<U>, std::forward<T>(value)) {}

    template <typename T>
    static constexpr Id id_of() {
        static_assert(detail::contains_type_v<T, Ts...>, "type is not part of this storage");
        return detail::type_index<T, Ts...>::value;
    }

    Id id() const { return value_.index(); }

    template <typename T>
    T* get() {
        static_assert(detail::contains_type_v<T, Ts...>, "type is not part of this storage");
        return std::get_if<T>(&value_);
    }

    template <typename T>
    const T* get() const {
        static_assert(detail::contains_type_v<T, Ts...>, "type is not part of this storage");
        return std::get_if<T>(&value_);
    }

    template <typename Func>
    decltype(auto) visit(Func&& fn) {
        return std::visit(std::forward<Func>(fn), value_);
    }

    template <typename Func>
    decltype(auto) visit(Func&& fn) const {
        return std::visit(std::forward<Func>(fn), value_);
    }

    /** @brief Process-wide component id of the active alternative. */
    ComponentTypeID component_type() const {
        return visit([](const auto& v) { return component_id<std::decay_t<decltype(v)>>(); });
    }

    const Variant& variant() const { return value_; }
    Variant& variant() { return value_; }

    bool operator==(const VariantStorage& o) const { return value_ == o.value_; }
    bool operator!=(const VariantStorage& o) const { return !(*this == o); }

    friend std::ostream& operator<<(std::ostream& out, const VariantStorage& s) {
        s.visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            out << component_label(component_id<T>()) << '(';
            if constexpr (is_printable_v<T>)
                out << v;
            out << ')';
        });
        return out;
    }

private:
    Variant value_;
};

} // namespace mecs
