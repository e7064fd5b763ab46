#pragma once

#include "../component.hpp"

#ifndef GLM_ENABLE_EXPERIMENTAL
#define GLM_ENABLE_EXPERIMENTAL
#endif
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/io.hpp>

#include <type_traits>

/**
 * @file glm.hpp
 * @brief GLM Integration Bridge.
 * @details Lets GLM vectors, quaternions and matrices be used directly as components:
 * printing comes from `glm/gtx/io.hpp` (required by DynStorage), and
 * `register_glm_components()` gives them stable names and byte-copy codecs for serialization.
 */

// 1. Layout Verification (Compile-time checks)
static_assert(sizeof(glm::vec3) == 3 * sizeof(float), "glm::vec3 must be tightly packed");
static_assert(sizeof(glm::quat) == 4 * sizeof(float), "glm::quat must be tightly packed");
static_assert(sizeof(glm::mat4) == 16 * sizeof(float), "glm::mat4 must be tightly packed");

// 2. Byte-copy serialization comes from register_component
static_assert(std::is_trivially_copyable_v<glm::vec3>, "glm::vec3 must be trivially copyable");
static_assert(std::is_trivially_copyable_v<glm::quat>, "glm::quat must be trivially copyable");
static_assert(std::is_trivially_copyable_v<glm::mat4>, "glm::mat4 must be trivially copyable");

namespace mecs {

/**
 * @brief Registers the common GLM types under `glm::vec2`, `glm::vec3`, `glm::vec4`,
 * `glm::quat` and `glm::mat4`. Safe to call more than once.
 */
inline void register_glm_components() {
    register_component<glm::vec2>("glm::vec2");
    register_component<glm::vec3>("glm::vec3");
    register_component<glm::vec4>("glm::vec4");
    register_component<glm::quat>("glm::quat");
    register_component<glm::mat4>("glm::mat4");
}

} // namespace mecs
