#include <catch2/catch_test_macros.hpp>
#include <anvil/inventory/guild_merchant.hpp>
#include <string>
#include <vector>

using namespace anvil::inventory;
using anvil::crafting::Recipe;
using anvil::crafting::RecipeCatalog;
using anvil::core::EventDispatcher;

namespace {

Recipe make_recipe(int id, const std::string& name, int sell_price) {
    Recipe recipe;
    recipe.id = id;
    recipe.name = name;
    recipe.materials = {"Scrap x1"};
    recipe.max_progress = 100;
    recipe.value = sell_price * 2;
    recipe.sell_price = sell_price;
    return recipe;
}

class MerchantFixture {
protected:
    MerchantFixture()
        : recipes({make_recipe(1, "Iron Sword", 50), make_recipe(6, "Enchanted Ring", 0),
                   make_recipe(9, "Healing Potion", 15)})
        , ledger(recipes, events)
        , merchant(recipes, ledger, events) {}

    RecipeCatalog recipes;
    EventDispatcher events;
    InventoryLedger ledger;
    GuildMerchant merchant;
};

} // namespace

TEST_CASE_METHOD(MerchantFixture, "Selling one Iron Sword", "[inventory][guild]") {
    std::vector<ItemSoldEvent> sold;
    auto conn = merchant.on_item_sold([&](const ItemSoldEvent& e) { sold.push_back(e); });

    ledger.add_item(1, 3);
    REQUIRE(ledger.get_gold() == 0);

    REQUIRE(merchant.sell("Iron Sword") == SellResult::Sold);

    REQUIRE(ledger.get_item_quantity(1) == 2);
    REQUIRE(ledger.get_gold() == 50);
    REQUIRE(sold.size() == 1);
    REQUIRE(sold[0].recipe_id == 1);
    REQUIRE(sold[0].item_name == "Iron Sword");
    REQUIRE(sold[0].quality == ItemQuality::Normal);
    REQUIRE(sold[0].price == 50);
}

TEST_CASE_METHOD(MerchantFixture, "Selling the last unit empties the stack", "[inventory][guild]") {
    ledger.add_item(9, 1, ItemQuality::Fine);

    REQUIRE(merchant.sell(9, ItemQuality::Fine) == SellResult::Sold);
    REQUIRE(ledger.find_stack(9, ItemQuality::Fine) == nullptr);
    REQUIRE(ledger.get_gold() == 15);

    REQUIRE(merchant.sell(9, ItemQuality::Fine) == SellResult::NotInInventory);
    REQUIRE(ledger.get_gold() == 15);
}

TEST_CASE_METHOD(MerchantFixture, "Failed sales leave the ledger alone", "[inventory][guild]") {
    int sold = 0;
    auto conn = merchant.on_item_sold([&](const ItemSoldEvent&) { ++sold; });

    ledger.add_item(1, 1);
    ledger.add_item(6, 2);

    SECTION("Unknown item") {
        REQUIRE(merchant.sell("Dragon Scale") == SellResult::UnknownItem);
        REQUIRE(merchant.sell(404) == SellResult::UnknownItem);
    }

    SECTION("No guild price") {
        REQUIRE(merchant.sell("Enchanted Ring") == SellResult::NotSellable);
        REQUIRE(ledger.get_item_quantity(6) == 2);
    }

    SECTION("Not carried") {
        REQUIRE(merchant.sell("Healing Potion") == SellResult::NotInInventory);
    }

    SECTION("Carried at a different quality") {
        REQUIRE(merchant.sell("Iron Sword", ItemQuality::Masterwork) == SellResult::NotInInventory);
        REQUIRE(ledger.get_item_quantity(1) == 1);
    }

    REQUIRE(ledger.get_gold() == 0);
    REQUIRE(sold == 0);
}

TEST_CASE_METHOD(MerchantFixture, "Prices and sellable stacks", "[inventory][guild]") {
    REQUIRE(merchant.get_sell_price(1) == 50);
    REQUIRE(merchant.get_sell_price("Healing Potion") == 15);
    REQUIRE(merchant.get_sell_price("Enchanted Ring") == 0);
    REQUIRE(merchant.get_sell_price(404) == 0);

    ledger.add_item(6, 1);
    ledger.add_item(9, 4);
    ledger.add_item(1, 2, ItemQuality::Exceptional);

    auto sellable = merchant.get_sellable_stacks();
    REQUIRE(sellable.size() == 2);
    REQUIRE(sellable[0].recipe->id == 9);
    REQUIRE(sellable[0].stack->quantity == 4);
    REQUIRE(sellable[1].recipe->id == 1);
    REQUIRE(sellable[1].price == 50);
}

TEST_CASE("Sell result names", "[inventory][guild]") {
    REQUIRE(std::string(get_sell_result_name(SellResult::Sold)) == "Sold");
    REQUIRE(std::string(get_sell_result_name(SellResult::NotInInventory)) == "NotInInventory");
}
