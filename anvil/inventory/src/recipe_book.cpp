#include <anvil/inventory/recipe_book.hpp>
#include <anvil/core/log.hpp>
#include <algorithm>
#include <ctime>

namespace anvil::inventory {

RecipeBook::RecipeBook(const crafting::RecipeCatalog& recipes, core::EventDispatcher& events)
    : m_recipes(recipes)
    , m_events(events)
    , m_clock([]() { return static_cast<uint64_t>(std::time(nullptr)); }) {}

const RecipeBookEntry* RecipeBook::unlock_recipe(int recipe_id) {
    auto it = m_entries.find(recipe_id);
    if (it != m_entries.end()) {
        return &it->second;
    }

    const crafting::Recipe* recipe = m_recipes.get_by_id(recipe_id);
    if (!recipe) {
        core::log(core::LogLevel::Warn, "[RecipeBook] Cannot unlock unknown recipe {}", recipe_id);
        return nullptr;
    }

    RecipeBookEntry entry;
    entry.recipe_id = recipe_id;
    entry.date_unlocked = m_clock();
    m_entries.emplace(recipe_id, entry);
    m_unlock_order.push_back(recipe_id);
    invalidate_cache();

    core::log(core::LogLevel::Info, "[RecipeBook] Unlocked {}", recipe->name);

    RecipeUnlockedEvent event;
    event.recipe_id = recipe_id;
    event.recipe_name = recipe->name;
    event.timestamp = entry.date_unlocked;
    m_events.dispatch(event);

    // Listeners may have cleared or restored the book
    return get_entry(recipe_id);
}

const RecipeBookEntry* RecipeBook::complete_recipe(int recipe_id) {
    auto it = m_entries.find(recipe_id);
    if (it == m_entries.end()) {
        core::log(core::LogLevel::Warn, "[RecipeBook] Recipe {} completed before it was unlocked", recipe_id);
        return nullptr;
    }

    RecipeBookEntry& entry = it->second;
    ++entry.times_completed;
    invalidate_cache();

    const crafting::Recipe* recipe = m_recipes.get_by_id(recipe_id);
    std::string name = recipe ? recipe->name : std::to_string(recipe_id);
    core::log(core::LogLevel::Info, "[RecipeBook] {} completed ({} times)", name, entry.times_completed);

    RecipeCompletedEvent event;
    event.recipe_id = recipe_id;
    event.recipe_name = name;
    event.times_completed = entry.times_completed;
    m_events.dispatch(event);

    return get_entry(recipe_id);
}

bool RecipeBook::toggle_favorite(int recipe_id) {
    auto it = m_entries.find(recipe_id);
    if (it == m_entries.end()) {
        core::log(core::LogLevel::Warn, "[RecipeBook] Cannot favorite locked recipe {}", recipe_id);
        return false;
    }

    it->second.favorite = !it->second.favorite;
    invalidate_cache();
    return it->second.favorite;
}

bool RecipeBook::is_recipe_unlocked(int recipe_id) const {
    return m_entries.count(recipe_id) > 0;
}

const RecipeBookEntry* RecipeBook::get_entry(int recipe_id) const {
    auto it = m_entries.find(recipe_id);
    return it != m_entries.end() ? &it->second : nullptr;
}

int RecipeBook::get_completion_count(int recipe_id) const {
    const RecipeBookEntry* entry = get_entry(recipe_id);
    return entry ? entry->times_completed : 0;
}

const std::vector<const RecipeBookEntry*>& RecipeBook::get_unlocked_recipes() const {
    auto now = SteadyClock::now();
    if (m_cache_valid && now - m_cache_time < m_cache_duration) {
        return m_sorted_cache;
    }

    m_sorted_cache = get_entries();
    std::stable_sort(m_sorted_cache.begin(), m_sorted_cache.end(),
        [this](const RecipeBookEntry* a, const RecipeBookEntry* b) {
            if (a->favorite != b->favorite) {
                return a->favorite;
            }
            const auto* recipe_a = m_recipes.get_by_id(a->recipe_id);
            const auto* recipe_b = m_recipes.get_by_id(b->recipe_id);
            if (!recipe_a || !recipe_b) return false;
            return recipe_a->name < recipe_b->name;
        });

    m_cache_time = now;
    m_cache_valid = true;
    return m_sorted_cache;
}

std::vector<const crafting::Recipe*> RecipeBook::get_available_recipes() const {
    std::vector<const crafting::Recipe*> result;
    for (const RecipeBookEntry* entry : get_unlocked_recipes()) {
        if (const auto* recipe = m_recipes.get_by_id(entry->recipe_id)) {
            result.push_back(recipe);
        }
    }
    return result;
}

std::vector<const RecipeBookEntry*> RecipeBook::get_entries() const {
    std::vector<const RecipeBookEntry*> entries;
    entries.reserve(m_unlock_order.size());
    for (int id : m_unlock_order) {
        entries.push_back(&m_entries.at(id));
    }
    return entries;
}

RecipeBookStats RecipeBook::get_stats() const {
    RecipeBookStats stats;
    stats.total_recipes = m_recipes.size();
    stats.unlocked_recipes = m_entries.size();
    for (const auto& [id, entry] : m_entries) {
        stats.total_completions += entry.times_completed;
        if (entry.times_completed > 0) {
            ++stats.completed_recipes;
        }
    }
    if (stats.unlocked_recipes > 0) {
        stats.completion_rate = static_cast<float>(stats.completed_recipes) /
                                static_cast<float>(stats.unlocked_recipes);
    }
    return stats;
}

void RecipeBook::clear() {
    m_entries.clear();
    m_unlock_order.clear();
    m_sorted_cache.clear();
    invalidate_cache();
}

void RecipeBook::restore(const std::vector<RecipeBookEntry>& entries) {
    clear();
    for (const auto& entry : entries) {
        if (m_entries.emplace(entry.recipe_id, entry).second) {
            m_unlock_order.push_back(entry.recipe_id);
        }
    }
    core::log(core::LogLevel::Info, "[RecipeBook] Restored {} entries", m_entries.size());
}

core::ScopedConnection RecipeBook::on_recipe_unlocked(std::function<void(const RecipeUnlockedEvent&)> callback) {
    return m_events.subscribe<RecipeUnlockedEvent>(std::move(callback));
}

core::ScopedConnection RecipeBook::on_recipe_completed(std::function<void(const RecipeCompletedEvent&)> callback) {
    return m_events.subscribe<RecipeCompletedEvent>(std::move(callback));
}

} // namespace anvil::inventory
