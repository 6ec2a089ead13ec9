#pragma once

#include <anvil/crafting/recipe_catalog.hpp>

namespace anvil::crafting {

// ============================================================================
// Crafting Started Event
// ============================================================================

struct CraftingStartedEvent {
    const Recipe* recipe = nullptr;
    int max_progress = 0;
};

// ============================================================================
// Progress Changed Event
// ============================================================================

struct ProgressChangedEvent {
    int progress = 0;
    int max_progress = 0;
    int delta = 0;                  // After clamping to max_progress
};

// ============================================================================
// Crafting Completed Event
// ============================================================================

// Published exactly once per session, before the ProgressChangedEvent of the
// final skill use
struct CraftingCompletedEvent {
    const Recipe* recipe = nullptr;
};

// ============================================================================
// Crafting Stopped Event
// ============================================================================

struct CraftingStoppedEvent {
    const Recipe* recipe = nullptr;
    int progress = 0;
    bool was_completed = false;
};

} // namespace anvil::crafting
