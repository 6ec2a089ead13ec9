#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <anvil/crafting/recipe_catalog.hpp>
#include <algorithm>

using namespace anvil::crafting;
using anvil::data::DataValidationError;
using json = nlohmann::json;
using Catch::Matchers::ContainsSubstring;

namespace {

Recipe make_recipe(int id, const std::string& name, const std::string& category,
                   Difficulty difficulty = Difficulty::Easy, int unlock_level = 1) {
    Recipe recipe;
    recipe.id = id;
    recipe.name = name;
    recipe.materials = {"Iron Bar x2"};
    recipe.max_progress = 100;
    recipe.difficulty = difficulty;
    recipe.category = category;
    recipe.unlock_level = unlock_level;
    recipe.value = 10 * id;
    return recipe;
}

bool has_issue(const DataValidationError& error, const std::string& text) {
    const auto& issues = error.issues();
    return std::any_of(issues.begin(), issues.end(),
                       [&](const std::string& issue) { return issue.find(text) != std::string::npos; });
}

} // namespace

TEST_CASE("RecipeCatalog lookups", "[crafting][recipes]") {
    RecipeCatalog catalog({
        make_recipe(1, "Iron Sword", "Weapons", Difficulty::Easy, 1),
        make_recipe(4, "Steel Chestplate", "Armor", Difficulty::Medium, 4),
        make_recipe(2, "Steel Longsword", "Weapons", Difficulty::Medium, 3),
    });

    SECTION("By id and name") {
        REQUIRE(catalog.size() == 3);
        REQUIRE(catalog.get_by_id(4)->name == "Steel Chestplate");
        REQUIRE(catalog.get_by_id(99) == nullptr);
        REQUIRE(catalog.get_by_name("Steel Longsword")->id == 2);
        REQUIRE(catalog.get_by_name("Wooden Spoon") == nullptr);
        REQUIRE(catalog.exists(1));
        REQUIRE_FALSE(catalog.exists(3));
    }

    SECTION("Catalog order is load order") {
        REQUIRE(catalog.at(0)->id == 1);
        REQUIRE(catalog.at(1)->id == 4);
        REQUIRE(catalog.at(2)->id == 2);
        REQUIRE(catalog.at(3) == nullptr);
    }

    SECTION("Filters") {
        auto weapons = catalog.get_by_category("Weapons");
        REQUIRE(weapons.size() == 2);
        REQUIRE(weapons[0]->id == 1);
        REQUIRE(weapons[1]->id == 2);

        REQUIRE(catalog.get_by_difficulty(Difficulty::Medium).size() == 2);
        REQUIRE(catalog.get_by_difficulty(Difficulty::Master).empty());
        REQUIRE(catalog.get_by_unlock_level(3).size() == 2);
        REQUIRE(catalog.get_categories() == std::vector<std::string>{"Weapons", "Armor"});
    }

    SECTION("Difficulty names") {
        REQUIRE(RecipeCatalog::get_difficulties().size() == 4);
        REQUIRE(std::string(difficulty_to_string(Difficulty::Master)) == "Master");
        REQUIRE(difficulty_from_string("Hard") == Difficulty::Hard);
        REQUIRE_FALSE(difficulty_from_string("Legendary").has_value());
    }
}

TEST_CASE("RecipeCatalog rejects bad definitions", "[crafting][recipes]") {
    SECTION("Duplicate ids") {
        std::vector<Recipe> recipes = {make_recipe(1, "A", "X"), make_recipe(1, "B", "X")};
        REQUIRE_THROWS_AS(RecipeCatalog(recipes), DataValidationError);
    }

    SECTION("Every problem is reported at once") {
        Recipe no_name = make_recipe(2, "", "X");
        Recipe no_materials = make_recipe(3, "Bare", "X");
        no_materials.materials.clear();
        Recipe zero_progress = make_recipe(4, "Instant", "X");
        zero_progress.max_progress = 0;

        try {
            RecipeCatalog catalog({no_name, no_materials, zero_progress});
            FAIL("expected DataValidationError");
        } catch (const DataValidationError& e) {
            REQUIRE(e.source() == "Recipe");
            REQUIRE(e.issues().size() == 3);
            REQUIRE(has_issue(e, "Recipe 2 missing name"));
            REQUIRE(has_issue(e, "Recipe 3 missing materials"));
            REQUIRE(has_issue(e, "Recipe 4 invalid max_progress"));
        }
    }

    SECTION("Negative prices") {
        Recipe recipe = make_recipe(1, "Debt", "X");
        recipe.sell_price = -5;
        REQUIRE_THROWS_WITH(RecipeCatalog({recipe}), ContainsSubstring("negative sell_price"));
    }
}

TEST_CASE("RecipeCatalog from JSON", "[crafting][recipes]") {
    SECTION("Well-formed document") {
        json root = json::parse(R"({"recipes": [
            {"id": 1, "name": "Iron Sword", "materials": ["Iron Bar x2"], "max_progress": 100,
             "difficulty": "Easy", "category": "Weapons", "value": 50, "sell_price": 25}
        ]})");

        auto catalog = RecipeCatalog::from_json(root);
        const Recipe* sword = catalog.get_by_id(1);
        REQUIRE(sword != nullptr);
        REQUIRE(sword->sell_price == 25);
        REQUIRE(sword->is_sellable());
        REQUIRE(sword->unlock_level == 1);
    }

    SECTION("Malformed entries are all reported") {
        json root = json::parse(R"([
            {"id": 1, "name": "Iron Sword", "materials": ["Iron Bar x2", 7], "max_progress": 100,
             "difficulty": "Easy"},
            {"id": 2, "name": "Mystery", "materials": ["Dust x1"], "max_progress": 10,
             "difficulty": "Impossible"},
            {"name": "Nameless", "materials": "Iron", "max_progress": 10, "difficulty": "Easy"},
            42
        ])");

        try {
            RecipeCatalog::from_json(root);
            FAIL("expected DataValidationError");
        } catch (const DataValidationError& e) {
            REQUIRE(has_issue(e, "malformed material at position 2"));
            REQUIRE(has_issue(e, "unknown difficulty 'Impossible'"));
            REQUIRE(has_issue(e, "field 'materials' must be an array"));
            REQUIRE(has_issue(e, "Recipe #3 missing id"));
            REQUIRE(has_issue(e, "Entry 4 is not an object"));
        }
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(RecipeCatalog::load("does/not/exist.json"), DataValidationError);
    }
}

TEST_CASE("Shipped recipe data loads", "[crafting][recipes][data]") {
    auto catalog = RecipeCatalog::load(std::string(ANVIL_DATA_DIR) + "/recipes.json");

    REQUIRE(catalog.size() == 10);
    REQUIRE(catalog.get_by_id(1)->name == "Iron Sword");
    REQUIRE(catalog.get_by_id(1)->max_progress == 100);
    REQUIRE(catalog.get_by_id(9)->name == "Healing Potion");
    REQUIRE(catalog.get_by_id(10)->difficulty == Difficulty::Master);
    REQUIRE(catalog.get_categories() ==
            std::vector<std::string>{"Weapons", "Armor", "Tools", "Magic", "Consumables"});
}
