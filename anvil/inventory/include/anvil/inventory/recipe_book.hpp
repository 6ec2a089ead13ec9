#pragma once

#include <anvil/inventory/inventory_events.hpp>
#include <anvil/crafting/recipe_catalog.hpp>
#include <anvil/core/event_dispatcher.hpp>
#include <chrono>
#include <functional>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace anvil::inventory {

// ============================================================================
// Recipe Book Entry
// ============================================================================

struct RecipeBookEntry {
    int recipe_id = 0;
    uint64_t date_unlocked = 0;     // Unix seconds
    int times_completed = 0;
    bool favorite = false;
};

struct RecipeBookStats {
    size_t total_recipes = 0;       // Size of the catalog
    size_t unlocked_recipes = 0;
    size_t completed_recipes = 0;   // Unlocked entries completed at least once
    int total_completions = 0;
    float completion_rate = 0.0f;   // completed / unlocked, [0, 1]
};

// ============================================================================
// RecipeBook - Unlocked recipes, completion counts and favorites
// ============================================================================
//
// One entry per recipe id. Entry addresses never change while the book holds
// them, so unlocking twice returns the same pointer.

class RecipeBook {
public:
    using Clock = std::function<uint64_t()>;
    using SteadyClock = std::chrono::steady_clock;

    static constexpr uint32_t DEFAULT_CACHE_MS = 1000;

    RecipeBook(const crafting::RecipeCatalog& recipes, core::EventDispatcher& events);

    RecipeBook(const RecipeBook&) = delete;
    RecipeBook& operator=(const RecipeBook&) = delete;

    // nullptr if the recipe id is not in the catalog, or if an event listener
    // dropped the entry before returning
    const RecipeBookEntry* unlock_recipe(int recipe_id);

    // nullptr if the recipe has not been unlocked, or if an event listener
    // dropped the entry before returning
    const RecipeBookEntry* complete_recipe(int recipe_id);

    // Returns the new favorite state; false if the recipe is not unlocked
    bool toggle_favorite(int recipe_id);

    bool is_recipe_unlocked(int recipe_id) const;
    const RecipeBookEntry* get_entry(int recipe_id) const;
    int get_completion_count(int recipe_id) const;

    // Favorites first, then by recipe name
    const std::vector<const RecipeBookEntry*>& get_unlocked_recipes() const;
    std::vector<const crafting::Recipe*> get_available_recipes() const;

    // Unlock order
    std::vector<const RecipeBookEntry*> get_entries() const;
    size_t size() const { return m_entries.size(); }

    RecipeBookStats get_stats() const;

    void clear();
    void restore(const std::vector<RecipeBookEntry>& entries);

    void set_clock(Clock clock) { m_clock = std::move(clock); }
    void set_cache_duration(std::chrono::milliseconds duration) { m_cache_duration = duration; }

    // ========================================================================
    // Convenience subscriptions
    // ========================================================================

    core::ScopedConnection on_recipe_unlocked(std::function<void(const RecipeUnlockedEvent&)> callback);
    core::ScopedConnection on_recipe_completed(std::function<void(const RecipeCompletedEvent&)> callback);

private:
    void invalidate_cache() { m_cache_valid = false; }

    const crafting::RecipeCatalog& m_recipes;
    core::EventDispatcher& m_events;

    std::unordered_map<int, RecipeBookEntry> m_entries;
    std::vector<int> m_unlock_order;
    Clock m_clock;

    mutable std::vector<const RecipeBookEntry*> m_sorted_cache;
    mutable SteadyClock::time_point m_cache_time{};
    mutable bool m_cache_valid = false;
    std::chrono::milliseconds m_cache_duration{DEFAULT_CACHE_MS};
};

} // namespace anvil::inventory
