#include <catch2/catch_test_macros.hpp>
#include <anvil/game/workshop.hpp>
#include <anvil/inventory/guild_merchant.hpp>
#include <anvil/save/inventory_save.hpp>
#include <string>

using namespace anvil;
using inventory::ItemQuality;

namespace {

std::string data_path(const std::string& file) {
    return std::string(ANVIL_DATA_DIR) + "/" + file;
}

class WorkshopFixture {
protected:
    WorkshopFixture()
        : recipes(crafting::RecipeCatalog::load(data_path("recipes.json")))
        , skills(crafting::SkillCatalog::load(data_path("skills.json")))
        , crafting(recipes, skills, events)
        , ledger(recipes, events)
        , book(recipes, events)
        , workshop(crafting, ledger, book, events) {}

    void finish(int recipe_id) {
        REQUIRE(crafting.start_crafting(recipes.get_by_id(recipe_id)));
        while (crafting.is_currently_crafting()) {
            REQUIRE(crafting.use_skill(5));
        }
    }

    crafting::RecipeCatalog recipes;
    crafting::SkillCatalog skills;
    core::EventDispatcher events;
    crafting::CraftingSystem crafting;
    inventory::InventoryLedger ledger;
    inventory::RecipeBook book;
    game::Workshop workshop;
};

} // namespace

TEST_CASE_METHOD(WorkshopFixture, "A finished craft lands in the bag and the book", "[game][workshop]") {
    finish(6);

    REQUIRE(ledger.get_item_quantity(6) == 1);
    REQUIRE(book.is_recipe_unlocked(6));
    REQUIRE(book.get_completion_count(6) == 1);
    REQUIRE(workshop.crafted_count() == 1);

    SECTION("Crafting again stacks up") {
        finish(6);
        REQUIRE(ledger.get_item_quantity(6) == 2);
        REQUIRE(ledger.stack_count() == 1);
        REQUIRE(book.get_completion_count(6) == 2);
        REQUIRE(workshop.crafted_count() == 2);
    }
}

TEST_CASE_METHOD(WorkshopFixture, "Stopped sessions produce nothing", "[game][workshop]") {
    crafting.start_crafting(recipes.get_by_id(1));
    crafting.use_skill(1);
    crafting.stop_crafting();

    REQUIRE(ledger.is_empty());
    REQUIRE(book.size() == 0);
    REQUIRE(workshop.crafted_count() == 0);
}

TEST_CASE_METHOD(WorkshopFixture, "Starter kit", "[game][workshop]") {
    workshop.give_starter_items();

    REQUIRE(book.is_recipe_unlocked(2));
    REQUIRE(book.is_recipe_unlocked(4));
    REQUIRE(ledger.get_item_quantity(1) == 3);
    REQUIRE(ledger.get_item_quantity(1, ItemQuality::Fine) == 1);
    REQUIRE(ledger.get_item_quantity(9) == 5);

    auto available = workshop.available_recipes();
    REQUIRE(available.size() == 2);
    REQUIRE(available[0]->name == "Steel Chestplate");
    REQUIRE(available[1]->name == "Steel Longsword");
}

TEST_CASE_METHOD(WorkshopFixture, "Unlocking by level", "[game][workshop]") {
    REQUIRE(workshop.unlock_starting_recipes(1) == 2);
    REQUIRE(workshop.unlock_starting_recipes(3) == 2);
    REQUIRE(workshop.unlock_starting_recipes(3) == 0);
    REQUIRE(book.size() == 4);
    REQUIRE(book.is_recipe_unlocked(6));
    REQUIRE_FALSE(book.is_recipe_unlocked(4));
}

TEST_CASE_METHOD(WorkshopFixture, "Craft, sell and reload", "[game][workshop]") {
    inventory::GuildMerchant merchant(recipes, ledger, events);

    finish(1);
    finish(1);
    REQUIRE(merchant.sell("Iron Sword") == inventory::SellResult::Sold);
    REQUIRE(ledger.get_item_quantity(1) == 1);
    REQUIRE(ledger.get_gold() == 25);

    auto blob = save::serialize(save::capture(ledger, book));

    core::EventDispatcher fresh_events;
    inventory::InventoryLedger fresh_ledger(recipes, fresh_events);
    inventory::RecipeBook fresh_book(recipes, fresh_events);
    REQUIRE(save::load_into(blob, fresh_ledger, fresh_book, recipes));

    REQUIRE(fresh_ledger.get_item_quantity(1) == 1);
    REQUIRE(fresh_ledger.get_gold() == 25);
    REQUIRE(fresh_book.get_completion_count(1) == 2);
}
