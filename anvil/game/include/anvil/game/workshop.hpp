#pragma once

#include <anvil/crafting/crafting_system.hpp>
#include <anvil/inventory/inventory_ledger.hpp>
#include <anvil/inventory/recipe_book.hpp>
#include <anvil/core/event_dispatcher.hpp>
#include <vector>

namespace anvil::game {

// ============================================================================
// Workshop - Routes finished crafts into the bag and recipe book
// ============================================================================
//
// Each completed session deposits one Normal item and records a completion,
// unlocking the recipe first if needed. The subscription lives as long as
// the Workshop.

class Workshop {
public:
    Workshop(crafting::CraftingSystem& crafting,
             inventory::InventoryLedger& ledger,
             inventory::RecipeBook& book,
             core::EventDispatcher& events);

    Workshop(const Workshop&) = delete;
    Workshop& operator=(const Workshop&) = delete;

    // Recipes the player can pick, favorites first
    std::vector<const crafting::Recipe*> available_recipes() const;

    // Fresh-game kit: two unlocked recipes and a few items to sell
    void give_starter_items();

    // Unlocks every recipe with unlock_level <= level; returns how many were new
    int unlock_starting_recipes(int level);

    int crafted_count() const { return m_crafted_count; }

private:
    void on_crafting_completed(const crafting::CraftingCompletedEvent& event);

    crafting::CraftingSystem& m_crafting;
    inventory::InventoryLedger& m_ledger;
    inventory::RecipeBook& m_book;

    int m_crafted_count = 0;
    core::ScopedConnection m_completed_connection;
};

} // namespace anvil::game
