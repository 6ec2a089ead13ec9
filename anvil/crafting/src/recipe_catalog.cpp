#include <anvil/crafting/recipe_catalog.hpp>
#include <anvil/data/json_loader.hpp>
#include <anvil/core/log.hpp>
#include <algorithm>
#include <unordered_set>

namespace anvil::crafting {

using json = nlohmann::json;
namespace jh = data::json_helpers;

namespace {

std::string describe(const Recipe& recipe, size_t index) {
    if (recipe.id > 0) {
        return "Recipe " + std::to_string(recipe.id);
    }
    return "Recipe #" + std::to_string(index + 1);
}

// Type problems are reported here; presence and range checks are left to
// RecipeCatalog::validate so every entry is checked in full.
Recipe deserialize_recipe(const json& j, data::ValidationReport& issues) {
    Recipe recipe;

    recipe.id = jh::get_int(j, "id", 0);
    recipe.name = jh::get_string(j, "name");
    std::string label = "Recipe " + (recipe.id > 0 ? std::to_string(recipe.id)
                                                   : "'" + recipe.name + "'");

    if (j.contains("id") && !j["id"].is_number_integer()) {
        issues.add(label + ": field 'id' must be an integer");
    }

    if (j.contains("materials")) {
        if (!j["materials"].is_array()) {
            issues.add(label + ": field 'materials' must be an array");
        } else {
            size_t position = 0;
            for (const auto& material : j["materials"]) {
                ++position;
                if (!material.is_string()) {
                    issues.add(label + ": malformed material at position " + std::to_string(position));
                    continue;
                }
                recipe.materials.push_back(material.get<std::string>());
            }
        }
    }

    std::string field_error;
    if (jh::require_string(j, "difficulty", field_error)) {
        std::string name = j["difficulty"].get<std::string>();
        auto difficulty = difficulty_from_string(name);
        if (difficulty) {
            recipe.difficulty = *difficulty;
        } else {
            issues.add(label + ": unknown difficulty '" + name + "'");
        }
    } else {
        issues.add(label + ": " + field_error);
    }

    recipe.description = jh::get_string(j, "description");
    recipe.max_progress = jh::get_int(j, "max_progress", 0);
    recipe.category = jh::get_string(j, "category");
    recipe.unlock_level = jh::get_int(j, "unlock_level", 1);
    recipe.craft_time = jh::get_int(j, "craft_time", 0);
    recipe.value = jh::get_int(j, "value", 0);
    recipe.sell_price = jh::get_int(j, "sell_price", 0);

    return recipe;
}

} // namespace

// ============================================================================
// RecipeCatalog
// ============================================================================

RecipeCatalog::RecipeCatalog(std::vector<Recipe> recipes)
    : RecipeCatalog(std::move(recipes), data::ValidationReport{}) {}

RecipeCatalog::RecipeCatalog(std::vector<Recipe> recipes, data::ValidationReport load_issues) {
    data::ValidationReport report = std::move(load_issues);
    report.merge(validate(recipes));

    if (!report.ok()) {
        core::log(core::LogLevel::Error, "[Crafting] Recipe data validation failed:\n{}", report.to_string());
        throw data::DataValidationError("Recipe", std::move(report));
    }

    m_recipes = std::move(recipes);
    m_index_by_id.reserve(m_recipes.size());
    for (size_t i = 0; i < m_recipes.size(); ++i) {
        m_index_by_id.emplace(m_recipes[i].id, i);
    }

    core::log(core::LogLevel::Info, "[Crafting] Loaded {} recipes in {} categories",
              m_recipes.size(), get_categories().size());
}

RecipeCatalog RecipeCatalog::from_json(const json& root) {
    data::ValidationReport load_issues;
    auto deserialize = [&load_issues](const json& j, std::string&) -> std::optional<Recipe> {
        return deserialize_recipe(j, load_issues);
    };

    std::string array_key = root.is_object() ? "recipes" : "";
    auto result = data::parse_json_array<Recipe>(root, deserialize, array_key);
    for (auto& error : result.errors) {
        load_issues.add(std::move(error));
    }
    return RecipeCatalog(std::move(result.items), std::move(load_issues));
}

RecipeCatalog RecipeCatalog::load(const std::string& path) {
    std::string error;
    auto root = data::load_json_file(path, &error);
    if (!root) {
        data::ValidationReport report;
        report.add(error);
        throw data::DataValidationError("Recipe", std::move(report));
    }

    core::log(core::LogLevel::Debug, "[Crafting] Loading recipes from {}", path);
    return from_json(*root);
}

data::ValidationReport RecipeCatalog::validate(const std::vector<Recipe>& recipes) {
    data::ValidationReport report;
    std::unordered_set<int> seen_ids;

    for (size_t i = 0; i < recipes.size(); ++i) {
        const Recipe& recipe = recipes[i];
        std::string label = describe(recipe, i);

        if (recipe.id <= 0) {
            report.add(label + " missing id");
        } else if (!seen_ids.insert(recipe.id).second) {
            report.add("Duplicate recipe id: " + std::to_string(recipe.id));
        }

        if (recipe.name.empty()) {
            report.add(label + " missing name");
        }

        if (recipe.materials.empty()) {
            report.add(label + " missing materials");
        }
        for (size_t m = 0; m < recipe.materials.size(); ++m) {
            if (recipe.materials[m].empty()) {
                report.add(label + " has an empty material at position " + std::to_string(m + 1));
            }
        }

        if (recipe.max_progress <= 0) {
            report.add(label + " invalid max_progress (" + std::to_string(recipe.max_progress) + ")");
        }

        if (recipe.value < 0) {
            report.add(label + " has negative value");
        }
        if (recipe.sell_price < 0) {
            report.add(label + " has negative sell_price");
        }
    }

    return report;
}

const Recipe* RecipeCatalog::get_by_id(int id) const {
    auto it = m_index_by_id.find(id);
    if (it != m_index_by_id.end()) {
        return &m_recipes[it->second];
    }
    return nullptr;
}

const Recipe* RecipeCatalog::get_by_name(const std::string& name) const {
    auto it = std::find_if(m_recipes.begin(), m_recipes.end(),
                           [&name](const Recipe& r) { return r.name == name; });
    return it != m_recipes.end() ? &*it : nullptr;
}

const Recipe* RecipeCatalog::at(size_t index) const {
    return index < m_recipes.size() ? &m_recipes[index] : nullptr;
}

std::vector<const Recipe*> RecipeCatalog::get_by_category(const std::string& category) const {
    std::vector<const Recipe*> result;
    for (const auto& recipe : m_recipes) {
        if (recipe.category == category) {
            result.push_back(&recipe);
        }
    }
    return result;
}

std::vector<const Recipe*> RecipeCatalog::get_by_difficulty(Difficulty difficulty) const {
    std::vector<const Recipe*> result;
    for (const auto& recipe : m_recipes) {
        if (recipe.difficulty == difficulty) {
            result.push_back(&recipe);
        }
    }
    return result;
}

std::vector<const Recipe*> RecipeCatalog::get_by_unlock_level(int max_level) const {
    std::vector<const Recipe*> result;
    for (const auto& recipe : m_recipes) {
        if (recipe.unlock_level <= max_level) {
            result.push_back(&recipe);
        }
    }
    return result;
}

std::vector<std::string> RecipeCatalog::get_categories() const {
    std::vector<std::string> categories;
    std::unordered_set<std::string> seen;
    for (const auto& recipe : m_recipes) {
        if (seen.insert(recipe.category).second) {
            categories.push_back(recipe.category);
        }
    }
    return categories;
}

std::vector<Difficulty> RecipeCatalog::get_difficulties() {
    return {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard, Difficulty::Master};
}

// ============================================================================
// Difficulty Helpers
// ============================================================================

const char* difficulty_to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:   return "Easy";
        case Difficulty::Medium: return "Medium";
        case Difficulty::Hard:   return "Hard";
        case Difficulty::Master: return "Master";
        default:                 return "Unknown";
    }
}

std::optional<Difficulty> difficulty_from_string(const std::string& name) {
    for (Difficulty difficulty : RecipeCatalog::get_difficulties()) {
        if (name == difficulty_to_string(difficulty)) {
            return difficulty;
        }
    }
    return std::nullopt;
}

} // namespace anvil::crafting
