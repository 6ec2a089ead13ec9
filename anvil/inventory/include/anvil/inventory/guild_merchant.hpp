#pragma once

#include <anvil/inventory/inventory_ledger.hpp>
#include <anvil/crafting/recipe_catalog.hpp>
#include <anvil/core/event_dispatcher.hpp>
#include <string>
#include <vector>

namespace anvil::inventory {

enum class SellResult : uint8_t {
    Sold,
    UnknownItem,        // No recipe with that name or id
    NotSellable,        // Recipe has no guild price
    NotInInventory      // No matching stack in the bag
};

const char* get_sell_result_name(SellResult result);

// A stack the guild will buy, with its unit price
struct SellableStack {
    const InventoryStack* stack = nullptr;
    const crafting::Recipe* recipe = nullptr;
    int price = 0;
};

// ============================================================================
// GuildMerchant - Sells bag items for gold
// ============================================================================
//
// One unit per sale. Gold is credited only after the item was removed.

class GuildMerchant {
public:
    GuildMerchant(const crafting::RecipeCatalog& recipes, InventoryLedger& ledger,
                  core::EventDispatcher& events);

    SellResult sell(const std::string& item_name, ItemQuality quality = ItemQuality::Normal);
    SellResult sell(int recipe_id, ItemQuality quality = ItemQuality::Normal);

    // 0 if the item is unknown or not sellable
    int get_sell_price(int recipe_id) const;
    int get_sell_price(const std::string& item_name) const;

    // Bag display order
    std::vector<SellableStack> get_sellable_stacks() const;

    core::ScopedConnection on_item_sold(std::function<void(const ItemSoldEvent&)> callback);

private:
    SellResult sell_recipe(const crafting::Recipe& recipe, ItemQuality quality);

    const crafting::RecipeCatalog& m_recipes;
    InventoryLedger& m_ledger;
    core::EventDispatcher& m_events;
};

} // namespace anvil::inventory
