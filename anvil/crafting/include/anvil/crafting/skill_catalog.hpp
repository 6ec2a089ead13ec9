#pragma once

#include <anvil/data/validation.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <map>

namespace anvil::crafting {

// ============================================================================
// Skill - Immutable crafting action definition
// ============================================================================

struct Skill {
    int id = 0;                         // Unique, > 0
    std::string key;                    // Single character, unique ("1".."7")
    std::string name;
    std::string description;
    int progress_bonus = 0;             // Progress added per use
    std::vector<float> color;           // RGBA, exactly 4 components
    std::string category;               // "Primary", "Secondary", "Special"
    int unlock_level = 1;

    // Not consulted by crafting logic
    float cooldown = 0.0f;
    int mana_cost = 0;
    float crit_chance = 0.0f;
    float crit_multiplier = 1.0f;
    std::string sound_effect;
    std::string visual_effect;
};

// ============================================================================
// Skill Catalog
// ============================================================================

// Read-only after construction. Construction throws data::DataValidationError
// listing every problem found in the data.
class SkillCatalog {
public:
    static constexpr size_t DEFAULT_ACTIVE_SKILLS = 5;

    explicit SkillCatalog(std::vector<Skill> skills);

    // Root must be an array of skill objects, or an object with a "skills" array
    static SkillCatalog from_json(const nlohmann::json& root);
    static SkillCatalog load(const std::string& path);

    static data::ValidationReport validate(const std::vector<Skill>& skills);

    SkillCatalog(const SkillCatalog&) = delete;
    SkillCatalog& operator=(const SkillCatalog&) = delete;
    SkillCatalog(SkillCatalog&&) = default;
    SkillCatalog& operator=(SkillCatalog&&) = default;

    // Lookup
    const Skill* get_by_id(int id) const;
    const Skill* get_by_key(const std::string& key) const;

    const std::vector<Skill>& get_all() const { return m_skills; }
    size_t size() const { return m_skills.size(); }

    // Queries
    std::vector<const Skill*> get_active(size_t max_skills = DEFAULT_ACTIVE_SKILLS) const;
    std::vector<const Skill*> get_by_category(const std::string& category) const;
    std::vector<const Skill*> get_by_unlock_level(int max_level) const;
    std::vector<std::string> get_categories() const;
    std::map<std::string, const Skill*> get_keyboard_layout() const;

    // Sum of progress bonuses for every skill unlocked at player_level
    int get_total_progress_potential(int player_level) const;

private:
    SkillCatalog(std::vector<Skill> skills, data::ValidationReport load_issues);

    std::vector<Skill> m_skills;
    std::unordered_map<int, size_t> m_index_by_id;
    std::unordered_map<std::string, size_t> m_index_by_key;
};

} // namespace anvil::crafting
