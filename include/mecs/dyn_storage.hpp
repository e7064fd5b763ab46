#pragma once
#include "component.hpp"

#include <ostream>
#include <type_traits>
#include <utility>

namespace mecs {

/**
 * @brief Open-set component storage: a heap box holding one value of any printable type.
 *
 * @details The identifier is the process-wide `component_id<T>()` of the boxed type. Viewing
 * the value as T succeeds only when T is exactly the boxed type; there is no conversion and no
 * base-class matching. DynStorage is move-only.
 */
class DynStorage {
public:
    using Id = ComponentTypeID;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, DynStorage>>>
    explicit DynStorage(T&& value)
        : ops_(&component_ops<std::decay_t<T>>()),
          data_(new std::decay_t<T>(std::forward<T>(value))) {
        static_assert(is_printable_v<std::decay_t<T>>,
                      "DynStorage components must be printable with operator<<");
    }

    ~DynStorage() { reset(); }

    DynStorage(DynStorage&& o) noexcept : ops_(o.ops_), data_(o.data_) { o.data_ = nullptr; }

    DynStorage& operator=(DynStorage&& o) noexcept {
        if (this != &o) {
            reset();
            ops_ = o.ops_;
            data_ = o.data_;
            o.data_ = nullptr;
        }
        return *this;
    }

    DynStorage(const DynStorage&) = delete;
    DynStorage& operator=(const DynStorage&) = delete;

    /**
     * @brief Default-constructs a value described by `ops` (used by deserialization).
     * @warning Asserts if the type has no default constructor.
     */
    static DynStorage make_default(const ComponentOps& ops) {
        MECS_ASSERT(ops.create_fn != nullptr, "make_default: component is not default-constructible");
        return DynStorage(&ops, ops.create_fn());
    }

    template <typename T>
    static Id id_of() {
        return component_id<T>();
    }

    Id id() const { return ops_->id; }

    /** @brief Returns the boxed value if it is exactly a T, nullptr otherwise. */
    template <typename T>
    T* get() {
        if (!data_ || ops_->id != component_id<T>())
            return nullptr;
        return static_cast<T*>(data_);
    }

    template <typename T>
    const T* get() const {
        if (!data_ || ops_->id != component_id<T>())
            return nullptr;
        return static_cast<const T*>(data_);
    }

    template <typename T>
    bool is() const {
        return ops_->id == component_id<T>();
    }

    const ComponentOps& ops() const { return *ops_; }

    /** @brief Raw pointer to the boxed value, for serialization adapters. */
    void* data() { return data_; }
    const void* data() const { return data_; }

    friend std::ostream& operator<<(std::ostream& out, const DynStorage& s) {
        out << component_label(s.ops_->id) << '(';
        if (s.data_ && s.ops_->print_fn)
            s.ops_->print_fn(s.data_, out);
        out << ')';
        return out;
    }

private:
    DynStorage(const ComponentOps* ops, void* data) : ops_(ops), data_(data) {}

    void reset() {
        if (data_)
            ops_->destroy_fn(data_);
        data_ = nullptr;
    }

    const ComponentOps* ops_;
    void* data_;
};

/**
 * @brief Constructs a T in place and boxes it.
 */
template <typename T, typename... Args>
DynStorage make_dyn(Args&&... args) {
    return DynStorage(T(std::forward<Args>(args)...));
}

} // namespace mecs
