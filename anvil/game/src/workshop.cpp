#include <anvil/game/workshop.hpp>
#include <anvil/core/log.hpp>

namespace anvil::game {

using inventory::ItemQuality;

namespace {

// Starter kit recipe ids from data/recipes.json
constexpr int IRON_SWORD = 1;
constexpr int STEEL_LONGSWORD = 2;
constexpr int STEEL_CHESTPLATE = 4;
constexpr int HEALING_POTION = 9;

} // namespace

Workshop::Workshop(crafting::CraftingSystem& crafting,
                   inventory::InventoryLedger& ledger,
                   inventory::RecipeBook& book,
                   core::EventDispatcher& events)
    : m_crafting(crafting)
    , m_ledger(ledger)
    , m_book(book) {
    m_completed_connection = events.subscribe<crafting::CraftingCompletedEvent>(
        [this](const crafting::CraftingCompletedEvent& event) {
            on_crafting_completed(event);
        });
}

void Workshop::on_crafting_completed(const crafting::CraftingCompletedEvent& event) {
    if (!event.recipe) {
        return;
    }

    const crafting::Recipe& recipe = *event.recipe;
    if (!m_ledger.add_item(recipe.id, 1, ItemQuality::Normal)) {
        core::log(core::LogLevel::Error, "[Workshop] Could not store crafted {}", recipe.name);
        return;
    }

    m_book.unlock_recipe(recipe.id);
    m_book.complete_recipe(recipe.id);
    ++m_crafted_count;

    core::log(core::LogLevel::Info, "[Workshop] {} added to the bag", recipe.name);
}

std::vector<const crafting::Recipe*> Workshop::available_recipes() const {
    return m_book.get_available_recipes();
}

void Workshop::give_starter_items() {
    m_book.unlock_recipe(STEEL_LONGSWORD);
    m_book.unlock_recipe(STEEL_CHESTPLATE);

    m_ledger.add_item(IRON_SWORD, 3, ItemQuality::Normal);
    m_ledger.add_item(IRON_SWORD, 1, ItemQuality::Fine);
    m_ledger.add_item(HEALING_POTION, 5, ItemQuality::Normal);

    core::log(core::LogLevel::Info, "[Workshop] Starter items granted");
}

int Workshop::unlock_starting_recipes(int level) {
    int unlocked = 0;
    for (const crafting::Recipe* recipe : m_crafting.recipes().get_by_unlock_level(level)) {
        if (!m_book.is_recipe_unlocked(recipe->id) && m_book.unlock_recipe(recipe->id)) {
            ++unlocked;
        }
    }
    return unlocked;
}

} // namespace anvil::game
