#pragma once

/**
 * @file mecs.hpp
 * @brief Main entry point for the mecs library.
 * @details Includes component storages, entities, the world with its predicate indices,
 * systems and serialization.
 */

#include "component.hpp"
#include "dyn_storage.hpp"
#include "entity.hpp"
#include "entity_id.hpp"
#include "pred_iter.hpp"
#include "predicate.hpp"
#include "serialization.hpp"
#include "system.hpp"
#include "variant_storage.hpp"
#include "world.hpp"
