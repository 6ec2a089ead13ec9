#pragma once

// Umbrella header for anvil::inventory module
#include <anvil/inventory/item_stack.hpp>
#include <anvil/inventory/inventory_events.hpp>
#include <anvil/inventory/inventory_ledger.hpp>
#include <anvil/inventory/recipe_book.hpp>
#include <anvil/inventory/guild_merchant.hpp>
