#pragma once

#include <anvil/crafting/recipe_catalog.hpp>
#include <anvil/crafting/skill_catalog.hpp>
#include <anvil/crafting/crafting_events.hpp>
#include <anvil/core/event_dispatcher.hpp>
#include <optional>
#include <functional>

namespace anvil::crafting {

// ============================================================================
// Crafting Session
// ============================================================================

struct CraftingSession {
    const Recipe* recipe = nullptr;     // Not owned, lives in the catalog
    int progress = 0;                   // [0, recipe->max_progress]
    bool is_active = false;
    bool is_completed = false;
};

// Read-only snapshot for UI and tools
struct CraftingState {
    const Recipe* recipe = nullptr;
    int progress = 0;
    int max_progress = 0;
    bool is_active = false;
    bool is_completed = false;
    size_t selected_index = 0;
};

// ============================================================================
// CraftingSystem - Single-session progress engine
// ============================================================================
//
// At most one session exists at a time. Skill uses add progress, clamped to
// the recipe's max_progress; any overflow is discarded. Completion is final
// for the session: further skill uses are rejected until a new session starts.

class CraftingSystem {
public:
    static constexpr int IDLE_MAX_PROGRESS = 100;

    CraftingSystem(const RecipeCatalog& recipes, const SkillCatalog& skills,
                   core::EventDispatcher& events);

    CraftingSystem(const CraftingSystem&) = delete;
    CraftingSystem& operator=(const CraftingSystem&) = delete;

    // ========================================================================
    // Recipe Selection (0-based, clamped; never touches the session)
    // ========================================================================

    void select_recipe(size_t index);
    void select_next();
    void select_previous();
    size_t get_selected_index() const { return m_selected_index; }
    const Recipe* get_selected_recipe() const;

    // ========================================================================
    // Session Control
    // ========================================================================

    // Replaces any existing session. Returns false on nullptr.
    bool start_crafting(const Recipe* recipe);
    bool start_crafting_selected();

    // Safe to call with no session
    void stop_crafting();

    // Returns false (no state change, no events) with no live session or an unknown skill
    bool use_skill(int skill_id);
    bool use_skill_by_key(const std::string& key);

    // ========================================================================
    // Queries
    // ========================================================================

    bool is_currently_crafting() const;
    bool is_crafting_completed() const;
    bool has_session() const { return m_session.has_value(); }

    int get_progress() const;
    int get_max_progress() const;
    float get_progress_percentage() const;     // [0, 100]
    const Recipe* get_active_recipe() const;
    CraftingState get_state() const;

    const std::vector<Recipe>& get_recipes() const { return m_recipes.get_all(); }
    std::vector<const Skill*> get_skills() const;  // Skill bar
    const RecipeCatalog& recipes() const { return m_recipes; }
    const SkillCatalog& skills() const { return m_skills; }

    void set_active_skill_count(size_t count) { m_active_skill_count = count; }

    // ========================================================================
    // Convenience subscriptions
    // ========================================================================

    core::ScopedConnection on_crafting_complete(std::function<void(const CraftingCompletedEvent&)> callback);
    core::ScopedConnection on_progress_changed(std::function<void(const ProgressChangedEvent&)> callback);

private:
    const RecipeCatalog& m_recipes;
    const SkillCatalog& m_skills;
    core::EventDispatcher& m_events;

    std::optional<CraftingSession> m_session;
    size_t m_selected_index = 0;
    size_t m_active_skill_count = SkillCatalog::DEFAULT_ACTIVE_SKILLS;
};

} // namespace anvil::crafting
