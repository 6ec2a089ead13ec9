#pragma once

#include <anvil/core/log.hpp>
#include <string>
#include <cstdint>

namespace anvil::core {

struct DataSettings {
    std::string recipes_path = "data/recipes.json";
    std::string skills_path = "data/skills.json";
};

struct SaveSettings {
    std::string save_path = "anvil_inventory.sav";
    bool starter_items = true;      // Give the starter kit when no save exists
};

struct GameplaySettings {
    int active_skill_count = 5;     // Buttons on the crafting skill bar
    int starting_level = 1;         // Recipes up to this unlock level start unlocked
    uint32_t unlocked_cache_ms = 1000;
};

struct GameSettings {
    DataSettings data;
    SaveSettings save;
    GameplaySettings gameplay;
    LogLevel log_level = LogLevel::Info;

    // Missing keys keep their current value; returns false if the file is unreadable or malformed
    bool load(const std::string& path);
    bool save_to(const std::string& path) const;

    void reset();
};

} // namespace anvil::core
