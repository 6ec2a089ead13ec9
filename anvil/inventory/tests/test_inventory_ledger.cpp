#include <catch2/catch_test_macros.hpp>
#include <anvil/inventory/inventory_ledger.hpp>
#include <string>
#include <vector>

using namespace anvil::inventory;
using anvil::crafting::Recipe;
using anvil::crafting::RecipeCatalog;
using anvil::core::EventDispatcher;

namespace {

Recipe make_recipe(int id, const std::string& name, int value) {
    Recipe recipe;
    recipe.id = id;
    recipe.name = name;
    recipe.materials = {"Scrap x1"};
    recipe.max_progress = 100;
    recipe.value = value;
    recipe.sell_price = value / 2;
    return recipe;
}

class LedgerFixture {
protected:
    LedgerFixture()
        : recipes({make_recipe(1, "Iron Sword", 50), make_recipe(2, "Steel Longsword", 120),
                   make_recipe(9, "Healing Potion", 30)})
        , ledger(recipes, events) {
        ledger.set_clock([this]() { return ++now; });
    }

    std::vector<int> bag_ids() const {
        std::vector<int> ids;
        for (const auto* stack : ledger.get_bag_contents()) {
            ids.push_back(stack->recipe_id);
        }
        return ids;
    }

    RecipeCatalog recipes;
    EventDispatcher events;
    InventoryLedger ledger;
    uint64_t now = 1000;
};

} // namespace

// ============================================================================
// Quality helpers
// ============================================================================

TEST_CASE("ItemQuality names and parsing", "[inventory][quality]") {
    REQUIRE(std::string(get_quality_name(ItemQuality::Normal)) == "Normal");
    REQUIRE(std::string(get_quality_name(ItemQuality::Masterwork)) == "Masterwork");

    REQUIRE(quality_from_string("Fine") == ItemQuality::Fine);
    REQUIRE_FALSE(quality_from_string("Legendary").has_value());

    REQUIRE(quality_from_int(3) == ItemQuality::Exceptional);
    REQUIRE_FALSE(quality_from_int(0).has_value());
    REQUIRE_FALSE(quality_from_int(5).has_value());
}

// ============================================================================
// Items
// ============================================================================

TEST_CASE_METHOD(LedgerFixture, "Adding items merges into one stack per quality", "[inventory][ledger]") {
    const InventoryStack* first = ledger.add_item(1, 3);
    REQUIRE(first != nullptr);
    REQUIRE(first->quantity == 3);
    REQUIRE(first->date_added == 1001);

    const InventoryStack* again = ledger.add_item(1, 2);
    REQUIRE(again == first);
    REQUIRE(again->quantity == 5);
    REQUIRE(again->date_added == 1001);

    ledger.add_item(1, 1, ItemQuality::Fine);
    REQUIRE(ledger.stack_count() == 2);
    REQUIRE(ledger.get_item_quantity(1) == 5);
    REQUIRE(ledger.get_item_quantity(1, ItemQuality::Fine) == 1);
    REQUIRE(ledger.get_total_quantity(1) == 6);
}

TEST_CASE_METHOD(LedgerFixture, "Invalid additions change nothing", "[inventory][ledger]") {
    int added = 0;
    auto conn = ledger.on_item_added([&](const ItemAddedEvent&) { ++added; });

    REQUIRE(ledger.add_item(1, 0) == nullptr);
    REQUIRE(ledger.add_item(1, -4) == nullptr);
    REQUIRE(ledger.add_item(77, 1) == nullptr);

    REQUIRE(ledger.is_empty());
    REQUIRE(added == 0);
}

TEST_CASE_METHOD(LedgerFixture, "Removing items", "[inventory][ledger]") {
    std::vector<ItemRemovedEvent> removed;
    auto conn = ledger.on_item_removed([&](const ItemRemovedEvent& e) { removed.push_back(e); });

    ledger.add_item(1, 3);

    SECTION("Partial removal keeps the stack") {
        REQUIRE(ledger.remove_item(1, 1));
        REQUIRE(ledger.get_item_quantity(1) == 2);
        REQUIRE(removed.size() == 1);
        REQUIRE(removed[0].quantity_removed == 1);
        REQUIRE(removed[0].remaining == 2);
    }

    SECTION("Removing everything erases the stack") {
        REQUIRE(ledger.remove_item(1, 3));
        REQUIRE(ledger.find_stack(1) == nullptr);
        REQUIRE(ledger.is_empty());
        REQUIRE(removed.back().remaining == 0);
    }

    SECTION("Removing too many fails without changes") {
        REQUIRE_FALSE(ledger.remove_item(1, 4));
        REQUIRE(ledger.get_item_quantity(1) == 3);
        REQUIRE(removed.empty());
    }

    SECTION("Wrong quality or missing item fails") {
        REQUIRE_FALSE(ledger.remove_item(1, 1, ItemQuality::Masterwork));
        REQUIRE_FALSE(ledger.remove_item(2, 1));
        REQUIRE_FALSE(ledger.remove_item(1, 0));
        REQUIRE(ledger.get_item_quantity(1) == 3);
    }
}

TEST_CASE_METHOD(LedgerFixture, "Add then remove restores the bag", "[inventory][ledger]") {
    ledger.add_item(1, 2);
    ledger.add_item(9, 5, ItemQuality::Fine);

    ledger.add_item(2, 4, ItemQuality::Exceptional);
    REQUIRE(ledger.remove_item(2, 4, ItemQuality::Exceptional));

    REQUIRE(ledger.stack_count() == 2);
    REQUIRE(ledger.get_item_quantity(1) == 2);
    REQUIRE(ledger.get_item_quantity(9, ItemQuality::Fine) == 5);
    REQUIRE(ledger.find_stack(2, ItemQuality::Exceptional) == nullptr);
}

TEST_CASE_METHOD(LedgerFixture, "Item events carry the stack snapshot", "[inventory][ledger]") {
    std::vector<ItemAddedEvent> added;
    auto conn = ledger.on_item_added([&](const ItemAddedEvent& e) { added.push_back(e); });

    ledger.add_item(9, 2, ItemQuality::Fine);
    ledger.add_item(9, 3, ItemQuality::Fine);

    REQUIRE(added.size() == 2);
    REQUIRE(added[1].quantity_added == 3);
    REQUIRE(added[1].stack.quantity == 5);
    REQUIRE(added[1].stack.quality == ItemQuality::Fine);
}

TEST_CASE_METHOD(LedgerFixture, "A listener that empties the stack during an add", "[inventory][ledger]") {
    auto conn = ledger.on_item_added([this](const ItemAddedEvent& e) {
        ledger.remove_item(e.stack.recipe_id, e.stack.quantity, e.stack.quality);
    });

    REQUIRE(ledger.add_item(1, 1) == nullptr);
    REQUIRE(ledger.find_stack(1) == nullptr);
    REQUIRE(ledger.is_empty());
}

TEST_CASE_METHOD(LedgerFixture, "A listener that tops up the stack during an add", "[inventory][ledger]") {
    bool topped_up = false;
    auto conn = ledger.on_item_added([&](const ItemAddedEvent&) {
        if (!topped_up) {
            topped_up = true;
            ledger.add_item(9, 2);
        }
    });

    const InventoryStack* stack = ledger.add_item(9, 1);
    REQUIRE(stack != nullptr);
    REQUIRE(stack->quantity == 3);
}

TEST_CASE_METHOD(LedgerFixture, "Out-of-range qualities are rejected", "[inventory][ledger]") {
    REQUIRE(ledger.add_item(1, 1, static_cast<ItemQuality>(0)) == nullptr);
    REQUIRE(ledger.add_item(1, 1, static_cast<ItemQuality>(5)) == nullptr);
    REQUIRE(ledger.is_empty());

    const BagStats& stats = ledger.get_bag_stats();
    REQUIRE(stats.total_items == 0);
    REQUIRE(stats.count_for(static_cast<ItemQuality>(0)) == 0);
    REQUIRE(stats.count_for(static_cast<ItemQuality>(200)) == 0);

    InventoryStack bad{1, 2, static_cast<ItemQuality>(0), 5};
    InventoryStack good{9, 1, ItemQuality::Exceptional, 6};
    ledger.restore({bad, good}, 0);
    REQUIRE(ledger.stack_count() == 1);
    REQUIRE(ledger.get_bag_stats().count_for(ItemQuality::Exceptional) == 1);
}

// ============================================================================
// Sorting and stats
// ============================================================================

TEST_CASE_METHOD(LedgerFixture, "Bag sorting", "[inventory][ledger]") {
    ledger.add_item(9, 5);                             // Healing Potion, value 150
    ledger.add_item(1, 2, ItemQuality::Masterwork);    // Iron Sword, value 100
    ledger.add_item(2, 1, ItemQuality::Fine);          // Steel Longsword, value 120

    REQUIRE(ledger.get_sort_mode() == SortMode::Date);
    REQUIRE(bag_ids() == std::vector<int>{9, 1, 2});

    SECTION("Name") {
        ledger.sort_bag(SortMode::Name);
        REQUIRE(bag_ids() == std::vector<int>{9, 1, 2});
        REQUIRE(ledger.get_sort_mode() == SortMode::Name);
    }

    SECTION("Quantity") {
        ledger.sort_bag(SortMode::Quantity);
        REQUIRE(bag_ids() == std::vector<int>{9, 1, 2});
    }

    SECTION("Date is newest first") {
        ledger.sort_bag(SortMode::Date);
        REQUIRE(bag_ids() == std::vector<int>{2, 1, 9});
    }

    SECTION("Quality") {
        ledger.sort_bag(SortMode::Quality);
        REQUIRE(bag_ids() == std::vector<int>{1, 2, 9});
    }

    SECTION("Value") {
        ledger.sort_bag(SortMode::Value);
        REQUIRE(bag_ids() == std::vector<int>{9, 2, 1});
    }

    SECTION("Sorting never changes contents") {
        ledger.sort_bag(SortMode::Value);
        ledger.sort_bag(SortMode::Name);
        REQUIRE(ledger.stack_count() == 3);
        REQUIRE(ledger.get_item_quantity(1, ItemQuality::Masterwork) == 2);
    }
}

TEST_CASE("Sort mode names", "[inventory][ledger]") {
    REQUIRE(std::string(get_sort_mode_name(SortMode::Quantity)) == "quantity");
    REQUIRE(sort_mode_from_string("value") == SortMode::Value);
    REQUIRE_FALSE(sort_mode_from_string("rarity").has_value());
}

TEST_CASE_METHOD(LedgerFixture, "Bag stats follow mutations", "[inventory][ledger]") {
    ledger.add_item(1, 3);
    ledger.add_item(1, 1, ItemQuality::Fine);

    const BagStats& stats = ledger.get_bag_stats();
    REQUIRE(stats.total_items == 4);
    REQUIRE(stats.total_value == 200);
    REQUIRE(stats.stack_count == 2);
    REQUIRE(stats.count_for(ItemQuality::Normal) == 3);
    REQUIRE(stats.count_for(ItemQuality::Fine) == 1);
    REQUIRE(stats.count_for(ItemQuality::Masterwork) == 0);

    ledger.remove_item(1, 3);
    const BagStats& after = ledger.get_bag_stats();
    REQUIRE(after.total_items == 1);
    REQUIRE(after.stack_count == 1);
    REQUIRE(after.count_for(ItemQuality::Normal) == 0);
}

// ============================================================================
// Wallet
// ============================================================================

TEST_CASE_METHOD(LedgerFixture, "Gold wallet", "[inventory][gold]") {
    std::vector<GoldChangedEvent> changes;
    auto conn = ledger.on_gold_changed([&](const GoldChangedEvent& e) { changes.push_back(e); });

    REQUIRE(ledger.get_gold() == 0);
    REQUIRE(ledger.add_gold(100));
    REQUIRE(ledger.remove_gold(30));
    REQUIRE(ledger.get_gold() == 70);
    REQUIRE(ledger.has_gold(70));
    REQUIRE_FALSE(ledger.has_gold(71));

    REQUIRE(changes.size() == 2);
    REQUIRE(changes[1].old_amount == 100);
    REQUIRE(changes[1].new_amount == 70);
    REQUIRE(changes[1].delta == -30);

    SECTION("Overspending is refused") {
        REQUIRE_FALSE(ledger.remove_gold(71));
        REQUIRE(ledger.get_gold() == 70);
        REQUIRE(changes.size() == 2);
    }

    SECTION("Non-positive amounts are refused") {
        REQUIRE_FALSE(ledger.add_gold(0));
        REQUIRE_FALSE(ledger.add_gold(-5));
        REQUIRE_FALSE(ledger.remove_gold(-5));
        REQUIRE(ledger.get_gold() == 70);
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE_METHOD(LedgerFixture, "Clear and restore", "[inventory][ledger]") {
    ledger.add_item(1, 2);
    ledger.add_gold(40);

    int events_seen = 0;
    auto added = ledger.on_item_added([&](const ItemAddedEvent&) { ++events_seen; });
    auto gold = ledger.on_gold_changed([&](const GoldChangedEvent&) { ++events_seen; });

    SECTION("Clear empties silently") {
        ledger.clear();
        REQUIRE(ledger.is_empty());
        REQUIRE(ledger.get_gold() == 0);
        REQUIRE(ledger.get_bag_stats().total_items == 0);
        REQUIRE(events_seen == 0);
    }

    SECTION("Restore installs stacks in order") {
        InventoryStack a{9, 4, ItemQuality::Fine, 10};
        InventoryStack b{2, 1, ItemQuality::Normal, 20};
        InventoryStack dup{9, 7, ItemQuality::Fine, 30};

        ledger.restore({a, b, dup}, 250);

        REQUIRE(bag_ids() == std::vector<int>{9, 2});
        REQUIRE(ledger.get_item_quantity(9, ItemQuality::Fine) == 4);
        REQUIRE(ledger.get_item_quantity(1) == 0);
        REQUIRE(ledger.get_gold() == 250);
        REQUIRE(events_seen == 0);
    }
}
