#pragma once

// Umbrella header for anvil::save module
#include <anvil/save/inventory_save.hpp>
