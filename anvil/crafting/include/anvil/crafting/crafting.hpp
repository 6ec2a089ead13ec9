#pragma once

// Umbrella header for anvil::crafting module
#include <anvil/crafting/recipe_catalog.hpp>
#include <anvil/crafting/skill_catalog.hpp>
#include <anvil/crafting/crafting_events.hpp>
#include <anvil/crafting/crafting_system.hpp>
