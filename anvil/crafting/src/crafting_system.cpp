#include <anvil/crafting/crafting_system.hpp>
#include <anvil/core/log.hpp>
#include <algorithm>

namespace anvil::crafting {

CraftingSystem::CraftingSystem(const RecipeCatalog& recipes, const SkillCatalog& skills,
                               core::EventDispatcher& events)
    : m_recipes(recipes)
    , m_skills(skills)
    , m_events(events) {}

// ============================================================================
// Recipe Selection
// ============================================================================

void CraftingSystem::select_recipe(size_t index) {
    if (m_recipes.empty()) {
        m_selected_index = 0;
        return;
    }
    m_selected_index = std::min(index, m_recipes.size() - 1);
}

void CraftingSystem::select_next() {
    select_recipe(m_selected_index + 1);
}

void CraftingSystem::select_previous() {
    if (m_selected_index > 0) {
        select_recipe(m_selected_index - 1);
    }
}

const Recipe* CraftingSystem::get_selected_recipe() const {
    return m_recipes.at(m_selected_index);
}

// ============================================================================
// Session Control
// ============================================================================

bool CraftingSystem::start_crafting(const Recipe* recipe) {
    if (!recipe) {
        core::log(core::LogLevel::Warn, "[Crafting] start_crafting called without a recipe");
        return false;
    }

    if (m_session && m_session->is_active && !m_session->is_completed) {
        core::log(core::LogLevel::Info, "[Crafting] Abandoning {} at {}/{}",
                  m_session->recipe->name, m_session->progress, m_session->recipe->max_progress);
    }

    m_session = CraftingSession{recipe, 0, true, false};
    core::log(core::LogLevel::Info, "[Crafting] Started crafting {}", recipe->name);

    CraftingStartedEvent event;
    event.recipe = recipe;
    event.max_progress = recipe->max_progress;
    m_events.dispatch(event);
    return true;
}

bool CraftingSystem::start_crafting_selected() {
    return start_crafting(get_selected_recipe());
}

void CraftingSystem::stop_crafting() {
    if (!m_session) {
        return;
    }

    CraftingStoppedEvent event;
    event.recipe = m_session->recipe;
    event.progress = m_session->progress;
    event.was_completed = m_session->is_completed;
    m_session.reset();

    core::log(core::LogLevel::Info, "[Crafting] Stopped crafting {}", event.recipe->name);
    m_events.dispatch(event);
}

bool CraftingSystem::use_skill(int skill_id) {
    if (!is_currently_crafting()) {
        core::log(core::LogLevel::Warn, "[Crafting] Skill {} used with no active session", skill_id);
        return false;
    }

    const Skill* skill = m_skills.get_by_id(skill_id);
    if (!skill) {
        core::log(core::LogLevel::Warn, "[Crafting] Unknown skill id {}", skill_id);
        return false;
    }

    CraftingSession& session = *m_session;
    const Recipe* recipe = session.recipe;
    int old_progress = session.progress;
    session.progress = std::min(recipe->max_progress, session.progress + skill->progress_bonus);
    int delta = session.progress - old_progress;

    core::log(core::LogLevel::Debug, "[Crafting] {} +{} -> {}/{}",
              skill->name, delta, session.progress, recipe->max_progress);

    // Handlers may stop or restart the session, so the progress event is
    // built from locals rather than the session
    if (session.progress >= recipe->max_progress) {
        session.is_completed = true;
        core::log(core::LogLevel::Info, "[Crafting] Completed {}", recipe->name);

        CraftingCompletedEvent completed;
        completed.recipe = recipe;
        m_events.dispatch(completed);
    }

    if (delta > 0) {
        ProgressChangedEvent changed;
        changed.progress = old_progress + delta;
        changed.max_progress = recipe->max_progress;
        changed.delta = delta;
        m_events.dispatch(changed);
    }

    return true;
}

bool CraftingSystem::use_skill_by_key(const std::string& key) {
    const Skill* skill = m_skills.get_by_key(key);
    if (!skill) {
        core::log(core::LogLevel::Warn, "[Crafting] No skill bound to key '{}'", key);
        return false;
    }
    return use_skill(skill->id);
}

// ============================================================================
// Queries
// ============================================================================

bool CraftingSystem::is_currently_crafting() const {
    return m_session && m_session->is_active && !m_session->is_completed;
}

bool CraftingSystem::is_crafting_completed() const {
    return m_session && m_session->is_completed;
}

int CraftingSystem::get_progress() const {
    return m_session ? m_session->progress : 0;
}

int CraftingSystem::get_max_progress() const {
    return m_session ? m_session->recipe->max_progress : IDLE_MAX_PROGRESS;
}

float CraftingSystem::get_progress_percentage() const {
    int max_progress = get_max_progress();
    if (max_progress <= 0) return 0.0f;
    return static_cast<float>(get_progress()) * 100.0f / static_cast<float>(max_progress);
}

const Recipe* CraftingSystem::get_active_recipe() const {
    return m_session ? m_session->recipe : nullptr;
}

CraftingState CraftingSystem::get_state() const {
    CraftingState state;
    state.recipe = get_active_recipe();
    state.progress = get_progress();
    state.max_progress = get_max_progress();
    state.is_active = m_session && m_session->is_active;
    state.is_completed = is_crafting_completed();
    state.selected_index = m_selected_index;
    return state;
}

std::vector<const Skill*> CraftingSystem::get_skills() const {
    return m_skills.get_active(m_active_skill_count);
}

// ============================================================================
// Convenience subscriptions
// ============================================================================

core::ScopedConnection CraftingSystem::on_crafting_complete(
    std::function<void(const CraftingCompletedEvent&)> callback) {
    return m_events.subscribe<CraftingCompletedEvent>(std::move(callback));
}

core::ScopedConnection CraftingSystem::on_progress_changed(
    std::function<void(const ProgressChangedEvent&)> callback) {
    return m_events.subscribe<ProgressChangedEvent>(std::move(callback));
}

} // namespace anvil::crafting
