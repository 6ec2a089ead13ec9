#pragma once

// Umbrella header for anvil::core module
#include <anvil/core/log.hpp>
#include <anvil/core/event_dispatcher.hpp>
#include <anvil/core/filesystem.hpp>
#include <anvil/core/game_settings.hpp>
