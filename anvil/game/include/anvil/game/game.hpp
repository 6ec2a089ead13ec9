#pragma once

// Umbrella header for anvil::game module
#include <anvil/game/workshop.hpp>
