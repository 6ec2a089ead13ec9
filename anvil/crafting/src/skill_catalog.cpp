#include <anvil/crafting/skill_catalog.hpp>
#include <anvil/data/json_loader.hpp>
#include <anvil/core/log.hpp>
#include <algorithm>
#include <unordered_set>

namespace anvil::crafting {

using json = nlohmann::json;
namespace jh = data::json_helpers;

namespace {

Skill deserialize_skill(const json& j, data::ValidationReport& issues) {
    Skill skill;

    skill.id = jh::get_int(j, "id", 0);
    skill.name = jh::get_string(j, "name");
    std::string label = "Skill " + (skill.id > 0 ? std::to_string(skill.id)
                                                 : "'" + skill.name + "'");

    if (j.contains("id") && !j["id"].is_number_integer()) {
        issues.add(label + ": field 'id' must be an integer");
    }
    if (j.contains("key") && !j["key"].is_string()) {
        issues.add(label + ": field 'key' must be a string");
    }
    if (j.contains("color")) {
        const auto& color = j["color"];
        if (!color.is_array()) {
            issues.add(label + ": field 'color' must be an array");
        } else {
            for (const auto& component : color) {
                if (!component.is_number()) {
                    issues.add(label + ": color components must be numbers");
                    break;
                }
            }
        }
    }

    skill.key = jh::get_string(j, "key");
    skill.description = jh::get_string(j, "description");
    skill.progress_bonus = jh::get_int(j, "progress_bonus", 0);
    skill.color = jh::get_float_array(j, "color");
    skill.category = jh::get_string(j, "category");
    skill.unlock_level = jh::get_int(j, "unlock_level", 1);
    skill.cooldown = jh::get_float(j, "cooldown", 0.0f);
    skill.mana_cost = jh::get_int(j, "mana_cost", 0);
    skill.crit_chance = jh::get_float(j, "crit_chance", 0.0f);
    skill.crit_multiplier = jh::get_float(j, "crit_multiplier", 1.0f);
    skill.sound_effect = jh::get_string(j, "sound_effect");
    skill.visual_effect = jh::get_string(j, "visual_effect");

    return skill;
}

} // namespace

// ============================================================================
// SkillCatalog
// ============================================================================

SkillCatalog::SkillCatalog(std::vector<Skill> skills)
    : SkillCatalog(std::move(skills), data::ValidationReport{}) {}

SkillCatalog::SkillCatalog(std::vector<Skill> skills, data::ValidationReport load_issues) {
    data::ValidationReport report = std::move(load_issues);
    report.merge(validate(skills));

    if (!report.ok()) {
        core::log(core::LogLevel::Error, "[Crafting] Skill data validation failed:\n{}", report.to_string());
        throw data::DataValidationError("Skill", std::move(report));
    }

    m_skills = std::move(skills);
    for (size_t i = 0; i < m_skills.size(); ++i) {
        m_index_by_id.emplace(m_skills[i].id, i);
        m_index_by_key.emplace(m_skills[i].key, i);
    }

    core::log(core::LogLevel::Info, "[Crafting] Loaded {} skills", m_skills.size());
}

SkillCatalog SkillCatalog::from_json(const json& root) {
    data::ValidationReport load_issues;
    auto deserialize = [&load_issues](const json& j, std::string&) -> std::optional<Skill> {
        return deserialize_skill(j, load_issues);
    };

    std::string array_key = root.is_object() ? "skills" : "";
    auto result = data::parse_json_array<Skill>(root, deserialize, array_key);
    for (auto& error : result.errors) {
        load_issues.add(std::move(error));
    }
    return SkillCatalog(std::move(result.items), std::move(load_issues));
}

SkillCatalog SkillCatalog::load(const std::string& path) {
    std::string error;
    auto root = data::load_json_file(path, &error);
    if (!root) {
        data::ValidationReport report;
        report.add(error);
        throw data::DataValidationError("Skill", std::move(report));
    }

    core::log(core::LogLevel::Debug, "[Crafting] Loading skills from {}", path);
    return from_json(*root);
}

data::ValidationReport SkillCatalog::validate(const std::vector<Skill>& skills) {
    data::ValidationReport report;
    std::unordered_set<int> seen_ids;
    std::unordered_set<std::string> seen_keys;

    for (size_t i = 0; i < skills.size(); ++i) {
        const Skill& skill = skills[i];
        std::string label = skill.id > 0 ? "Skill " + std::to_string(skill.id)
                                         : "Skill #" + std::to_string(i + 1);

        if (skill.id <= 0) {
            report.add(label + " missing id");
        } else if (!seen_ids.insert(skill.id).second) {
            report.add("Duplicate skill id: " + std::to_string(skill.id));
        }

        if (skill.key.empty()) {
            report.add(label + " missing key");
        } else if (skill.key.size() != 1) {
            report.add(label + " key '" + skill.key + "' must be a single character");
        } else if (!seen_keys.insert(skill.key).second) {
            report.add("Duplicate skill key: " + skill.key);
        }

        if (skill.name.empty()) {
            report.add(label + " missing name");
        }

        if (skill.progress_bonus <= 0) {
            report.add(label + " invalid progress_bonus (" + std::to_string(skill.progress_bonus) + ")");
        }

        if (skill.color.size() != 4) {
            report.add(label + " invalid color (should be {r,g,b,a})");
        }
    }

    return report;
}

const Skill* SkillCatalog::get_by_id(int id) const {
    auto it = m_index_by_id.find(id);
    return it != m_index_by_id.end() ? &m_skills[it->second] : nullptr;
}

const Skill* SkillCatalog::get_by_key(const std::string& key) const {
    auto it = m_index_by_key.find(key);
    return it != m_index_by_key.end() ? &m_skills[it->second] : nullptr;
}

std::vector<const Skill*> SkillCatalog::get_active(size_t max_skills) const {
    std::vector<const Skill*> result;
    size_t count = std::min(max_skills, m_skills.size());
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(&m_skills[i]);
    }
    return result;
}

std::vector<const Skill*> SkillCatalog::get_by_category(const std::string& category) const {
    std::vector<const Skill*> result;
    for (const auto& skill : m_skills) {
        if (skill.category == category) {
            result.push_back(&skill);
        }
    }
    return result;
}

std::vector<const Skill*> SkillCatalog::get_by_unlock_level(int max_level) const {
    std::vector<const Skill*> result;
    for (const auto& skill : m_skills) {
        if (skill.unlock_level <= max_level) {
            result.push_back(&skill);
        }
    }
    return result;
}

std::vector<std::string> SkillCatalog::get_categories() const {
    std::vector<std::string> categories;
    std::unordered_set<std::string> seen;
    for (const auto& skill : m_skills) {
        if (seen.insert(skill.category).second) {
            categories.push_back(skill.category);
        }
    }
    return categories;
}

std::map<std::string, const Skill*> SkillCatalog::get_keyboard_layout() const {
    std::map<std::string, const Skill*> layout;
    for (const auto& skill : m_skills) {
        layout[skill.key] = &skill;
    }
    return layout;
}

int SkillCatalog::get_total_progress_potential(int player_level) const {
    int total = 0;
    for (const auto& skill : m_skills) {
        if (skill.unlock_level <= player_level) {
            total += skill.progress_bonus;
        }
    }
    return total;
}

} // namespace anvil::crafting
