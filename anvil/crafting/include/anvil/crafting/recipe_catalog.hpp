#pragma once

#include <anvil/data/validation.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

namespace anvil::crafting {

// ============================================================================
// Difficulty
// ============================================================================

enum class Difficulty : uint8_t {
    Easy,
    Medium,
    Hard,
    Master
};

// ============================================================================
// Recipe - Immutable craftable item definition
// ============================================================================

struct Recipe {
    int id = 0;                             // Unique, > 0
    std::string name;
    std::vector<std::string> materials;     // "Iron Bar x2"
    std::string description;
    int max_progress = 0;                   // Progress needed to complete
    Difficulty difficulty = Difficulty::Easy;
    std::string category;                   // "Weapons", "Armor", ...
    int unlock_level = 1;
    int craft_time = 0;                     // Seconds; informational only
    int value = 0;                          // Appraised worth
    int sell_price = 0;                     // Guild buy price, 0 = not sellable

    bool is_sellable() const { return sell_price > 0; }
};

// ============================================================================
// Recipe Catalog
// ============================================================================

// Read-only after construction. Construction throws data::DataValidationError
// listing every problem found in the data.
class RecipeCatalog {
public:
    explicit RecipeCatalog(std::vector<Recipe> recipes);

    // Root must be an array of recipe objects, or an object with a "recipes" array
    static RecipeCatalog from_json(const nlohmann::json& root);
    static RecipeCatalog load(const std::string& path);

    // Semantic checks shared by every construction path
    static data::ValidationReport validate(const std::vector<Recipe>& recipes);

    RecipeCatalog(const RecipeCatalog&) = delete;
    RecipeCatalog& operator=(const RecipeCatalog&) = delete;
    RecipeCatalog(RecipeCatalog&&) = default;
    RecipeCatalog& operator=(RecipeCatalog&&) = default;

    // Lookup
    const Recipe* get_by_id(int id) const;
    const Recipe* get_by_name(const std::string& name) const;
    bool exists(int id) const { return get_by_id(id) != nullptr; }

    // Catalog order access
    const std::vector<Recipe>& get_all() const { return m_recipes; }
    size_t size() const { return m_recipes.size(); }
    bool empty() const { return m_recipes.empty(); }
    const Recipe* at(size_t index) const;

    // Queries
    std::vector<const Recipe*> get_by_category(const std::string& category) const;
    std::vector<const Recipe*> get_by_difficulty(Difficulty difficulty) const;
    std::vector<const Recipe*> get_by_unlock_level(int max_level) const;
    std::vector<std::string> get_categories() const;    // First-seen order
    static std::vector<Difficulty> get_difficulties();

private:
    RecipeCatalog(std::vector<Recipe> recipes, data::ValidationReport load_issues);

    std::vector<Recipe> m_recipes;
    std::unordered_map<int, size_t> m_index_by_id;
};

// ============================================================================
// Difficulty Helpers
// ============================================================================

const char* difficulty_to_string(Difficulty difficulty);
std::optional<Difficulty> difficulty_from_string(const std::string& name);

} // namespace anvil::crafting
