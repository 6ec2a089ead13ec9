// Workshop Demo - Scripted crafting session without a renderer
//
// Loads settings and reference data, restores the saved inventory (or hands
// out the starter kit), crafts the selected recipe with the skill bar, sells
// one item to the guild and writes the save back.
//
// Usage:
//   workshop_demo [settings.json]

#include <anvil/core/core.hpp>
#include <anvil/crafting/crafting.hpp>
#include <anvil/inventory/inventory.hpp>
#include <anvil/save/save.hpp>
#include <anvil/game/game.hpp>

#include <chrono>
#include <cstdio>

using namespace anvil;
using anvil::core::LogLevel;

namespace {

void print_bag(const inventory::InventoryLedger& ledger) {
    std::printf("Bag (%zu stacks, %lld gold):\n", ledger.stack_count(),
                static_cast<long long>(ledger.get_gold()));
    for (const auto* stack : ledger.get_bag_contents()) {
        const auto* recipe = ledger.recipes().get_by_id(stack->recipe_id);
        std::printf("  %-20s %-12s x%d\n", recipe ? recipe->name.c_str() : "?",
                    inventory::get_quality_name(stack->quality), stack->quantity);
    }

    const auto& stats = ledger.get_bag_stats();
    std::printf("  total items %d, total value %lld\n", stats.total_items,
                static_cast<long long>(stats.total_value));
}

int run(const core::GameSettings& settings) {
    auto recipes = crafting::RecipeCatalog::load(settings.data.recipes_path);
    auto skills = crafting::SkillCatalog::load(settings.data.skills_path);

    core::EventDispatcher events;
    crafting::CraftingSystem crafting(recipes, skills, events);
    inventory::InventoryLedger ledger(recipes, events);
    inventory::RecipeBook book(recipes, events);
    inventory::GuildMerchant guild(recipes, ledger, events);
    game::Workshop workshop(crafting, ledger, book, events);

    crafting.set_active_skill_count(static_cast<size_t>(settings.gameplay.active_skill_count));
    book.set_cache_duration(std::chrono::milliseconds(settings.gameplay.unlocked_cache_ms));

    auto progress_connection = crafting.on_progress_changed([](const crafting::ProgressChangedEvent& e) {
        std::printf("  progress %d/%d (+%d)\n", e.progress, e.max_progress, e.delta);
    });

    auto blob = save::read_save_file(settings.save.save_path);
    if (blob.empty() || !save::load_into(blob, ledger, book, recipes)) {
        workshop.unlock_starting_recipes(settings.gameplay.starting_level);
        if (settings.save.starter_items) {
            workshop.give_starter_items();
        }
    }

    print_bag(ledger);

    std::printf("Available recipes:\n");
    for (const auto* recipe : workshop.available_recipes()) {
        std::printf("  [%d] %s (%s)\n", recipe->id, recipe->name.c_str(),
                    crafting::difficulty_to_string(recipe->difficulty));
    }

    crafting.select_recipe(0);
    if (!crafting.start_crafting_selected()) {
        return 1;
    }

    std::printf("Crafting %s:\n", crafting.get_active_recipe()->name.c_str());
    auto skill_bar = crafting.get_skills();
    size_t next_skill = 0;
    while (crafting.is_currently_crafting() && !skill_bar.empty()) {
        crafting.use_skill_by_key(skill_bar[next_skill]->key);
        next_skill = (next_skill + 1) % skill_bar.size();
    }
    crafting.stop_crafting();

    guild.sell("Iron Sword");
    print_bag(ledger);

    auto stats = book.get_stats();
    std::printf("Recipe book: %zu/%zu unlocked, %zu completed\n",
                stats.unlocked_recipes, stats.total_recipes, stats.completed_recipes);

    if (!save::save_to_file(settings.save.save_path, save::capture(ledger, book))) {
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    core::GameSettings settings;
    const char* settings_path = argc > 1 ? argv[1] : "data/settings.json";
    if (!settings.load(settings_path)) {
        core::log(LogLevel::Warn, "[Workshop] Using default settings");
    }
    core::set_log_level(settings.log_level);

    try {
        return run(settings);
    } catch (const data::DataValidationError& e) {
        core::log(LogLevel::Fatal, "[Workshop] {}", e.what());
        return 1;
    }
}
