#pragma once

#include <anvil/inventory/item_stack.hpp>
#include <string>
#include <cstdint>

namespace anvil::inventory {

// ============================================================================
// Item Added Event
// ============================================================================

struct ItemAddedEvent {
    InventoryStack stack;           // State of the stack after the add
    int quantity_added = 0;
};

// ============================================================================
// Item Removed Event
// ============================================================================

struct ItemRemovedEvent {
    int recipe_id = 0;
    int quantity_removed = 0;
    ItemQuality quality = ItemQuality::Normal;
    int remaining = 0;              // 0 when the stack was erased
};

// ============================================================================
// Gold Changed Event
// ============================================================================

struct GoldChangedEvent {
    int64_t old_amount = 0;
    int64_t new_amount = 0;
    int64_t delta = 0;
};

// ============================================================================
// Item Sold Event
// ============================================================================

struct ItemSoldEvent {
    int recipe_id = 0;
    std::string item_name;
    ItemQuality quality = ItemQuality::Normal;
    int price = 0;
};

// ============================================================================
// Recipe Unlocked Event
// ============================================================================

struct RecipeUnlockedEvent {
    int recipe_id = 0;
    std::string recipe_name;
    uint64_t timestamp = 0;
};

// ============================================================================
// Recipe Completed Event
// ============================================================================

struct RecipeCompletedEvent {
    int recipe_id = 0;
    std::string recipe_name;
    int times_completed = 0;
};

} // namespace anvil::inventory
