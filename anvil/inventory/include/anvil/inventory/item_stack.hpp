#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace anvil::inventory {

// ============================================================================
// Item Quality
// ============================================================================

enum class ItemQuality : uint8_t {
    Normal = 1,
    Fine = 2,
    Exceptional = 3,
    Masterwork = 4
};

constexpr int ITEM_QUALITY_COUNT = 4;

const char* get_quality_name(ItemQuality quality);
std::optional<ItemQuality> quality_from_string(const std::string& name);
std::optional<ItemQuality> quality_from_int(int value);

// ============================================================================
// InventoryStack - Quantity of one recipe at one quality
// ============================================================================

struct InventoryStack {
    int recipe_id = 0;
    int quantity = 0;               // Always > 0 while the stack is in a ledger
    ItemQuality quality = ItemQuality::Normal;
    uint64_t date_added = 0;        // Unix seconds

    bool same_slot(int id, ItemQuality q) const { return recipe_id == id && quality == q; }
};

} // namespace anvil::inventory
