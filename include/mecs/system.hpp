#pragma once
#include "world.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace mecs {

/**
 * @brief Manages a collection of systems (logic functions) to be executed sequentially.
 * @details Systems are simple functions that operate on the World, typically by iterating a
 * predicate registered up front. They run in registration order.
 */
template <typename S>
class SystemRegistry {
public:
    using SystemFunc = std::function<void(World<S>&)>;

    /**
     * @brief Registers a new system.
     * @param name Diagnostic name for the system.
     * @param fn The system function `void(World<S>&)`.
     */
    void add(std::string name, SystemFunc fn) {
        systems_.push_back({std::move(name), std::move(fn)});
    }

    /**
     * @brief Executes all registered systems in order.
     * @param world The world to update.
     */
    void run_all(World<S>& world) {
        for (auto& [name, fn] : systems_)
            fn(world);
    }

    size_t size() const { return systems_.size(); }

    const std::string& name(size_t i) const { return systems_[i].first; }

private:
    std::vector<std::pair<std::string, SystemFunc>> systems_;
};

} // namespace mecs
