#include <anvil/core/game_settings.hpp>
#include <anvil/core/filesystem.hpp>
#include <nlohmann/json.hpp>

namespace anvil::core {

using json = nlohmann::json;

bool GameSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Warn, "[Settings] No settings at {}, using defaults", path);
        return false;
    }

    try {
        json j = json::parse(content);

        if (j.contains("data")) {
            auto& d = j["data"];
            data.recipes_path = d.value("recipes_path", data.recipes_path);
            data.skills_path = d.value("skills_path", data.skills_path);
        }

        if (j.contains("save")) {
            auto& s = j["save"];
            save.save_path = s.value("save_path", save.save_path);
            save.starter_items = s.value("starter_items", save.starter_items);
        }

        if (j.contains("gameplay")) {
            auto& g = j["gameplay"];
            gameplay.active_skill_count = g.value("active_skill_count", gameplay.active_skill_count);
            gameplay.starting_level = g.value("starting_level", gameplay.starting_level);
            gameplay.unlocked_cache_ms = g.value("unlocked_cache_ms", gameplay.unlocked_cache_ms);
        }

        if (j.contains("log_level") && j["log_level"].is_string()) {
            std::string level_name = j["log_level"].get<std::string>();
            if (!parse_log_level(level_name, log_level)) {
                log(LogLevel::Warn, "[Settings] Unknown log level '{}'", level_name);
            }
        }

        return true;
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[Settings] Failed to parse {}: {}", path, e.what());
        return false;
    }
}

bool GameSettings::save_to(const std::string& path) const {
    json j;

    j["data"] = {
        {"recipes_path", data.recipes_path},
        {"skills_path", data.skills_path}
    };

    j["save"] = {
        {"save_path", save.save_path},
        {"starter_items", save.starter_items}
    };

    j["gameplay"] = {
        {"active_skill_count", gameplay.active_skill_count},
        {"starting_level", gameplay.starting_level},
        {"unlocked_cache_ms", gameplay.unlocked_cache_ms}
    };

    j["log_level"] = log_level_name(log_level);

    return FileSystem::write_text(path, j.dump(4));
}

void GameSettings::reset() {
    *this = GameSettings{};
}

} // namespace anvil::core
