#include <anvil/inventory/inventory_ledger.hpp>
#include <anvil/core/log.hpp>
#include <algorithm>
#include <ctime>

namespace anvil::inventory {

// ============================================================================
// Sort Mode Helpers
// ============================================================================

const char* get_sort_mode_name(SortMode mode) {
    switch (mode) {
        case SortMode::Name:     return "name";
        case SortMode::Quantity: return "quantity";
        case SortMode::Date:     return "date";
        case SortMode::Quality:  return "quality";
        case SortMode::Value:    return "value";
        default:                 return "unknown";
    }
}

std::optional<SortMode> sort_mode_from_string(const std::string& name) {
    for (SortMode mode : {SortMode::Name, SortMode::Quantity, SortMode::Date,
                          SortMode::Quality, SortMode::Value}) {
        if (name == get_sort_mode_name(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

// ============================================================================
// InventoryLedger
// ============================================================================

InventoryLedger::InventoryLedger(const crafting::RecipeCatalog& recipes, core::EventDispatcher& events)
    : m_recipes(recipes)
    , m_events(events)
    , m_clock([]() { return static_cast<uint64_t>(std::time(nullptr)); }) {}

const InventoryStack* InventoryLedger::add_item(int recipe_id, int quantity, ItemQuality quality) {
    if (quantity <= 0) {
        core::log(core::LogLevel::Warn, "[Inventory] Rejected add of {} x recipe {}", quantity, recipe_id);
        return nullptr;
    }

    const crafting::Recipe* recipe = m_recipes.get_by_id(recipe_id);
    if (!recipe) {
        core::log(core::LogLevel::Warn, "[Inventory] Cannot add unknown recipe {}", recipe_id);
        return nullptr;
    }

    if (!quality_from_int(static_cast<int>(quality))) {
        core::log(core::LogLevel::Warn, "[Inventory] Rejected add of recipe {} with invalid quality {}",
                  recipe_id, static_cast<int>(quality));
        return nullptr;
    }

    StackKey key{recipe_id, quality};
    auto it = m_stacks.find(key);
    if (it != m_stacks.end()) {
        it->second.quantity += quantity;
    } else {
        InventoryStack stack;
        stack.recipe_id = recipe_id;
        stack.quantity = quantity;
        stack.quality = quality;
        stack.date_added = m_clock();
        it = m_stacks.emplace(key, stack).first;
        m_order.push_back(key);
    }
    invalidate_stats();

    core::log(core::LogLevel::Info, "[Inventory] Added {} x {} ({}), now {}",
              quantity, recipe->name, get_quality_name(quality), it->second.quantity);

    ItemAddedEvent event;
    event.stack = it->second;
    event.quantity_added = quantity;
    m_events.dispatch(event);

    // Listeners may have removed the stack
    return find_stack(recipe_id, quality);
}

bool InventoryLedger::remove_item(int recipe_id, int quantity, ItemQuality quality) {
    if (quantity <= 0) {
        core::log(core::LogLevel::Warn, "[Inventory] Rejected remove of {} x recipe {}", quantity, recipe_id);
        return false;
    }

    StackKey key{recipe_id, quality};
    auto it = m_stacks.find(key);
    if (it == m_stacks.end()) {
        core::log(core::LogLevel::Warn, "[Inventory] No {} stack of recipe {} to remove from",
                  get_quality_name(quality), recipe_id);
        return false;
    }

    if (it->second.quantity < quantity) {
        core::log(core::LogLevel::Warn, "[Inventory] Cannot remove {} of recipe {}, only {} held",
                  quantity, recipe_id, it->second.quantity);
        return false;
    }

    it->second.quantity -= quantity;
    int remaining = it->second.quantity;
    if (remaining == 0) {
        m_stacks.erase(it);
        m_order.erase(std::remove(m_order.begin(), m_order.end(), key), m_order.end());
    }
    invalidate_stats();

    core::log(core::LogLevel::Info, "[Inventory] Removed {} of recipe {} ({}), {} left",
              quantity, recipe_id, get_quality_name(quality), remaining);

    ItemRemovedEvent event;
    event.recipe_id = recipe_id;
    event.quantity_removed = quantity;
    event.quality = quality;
    event.remaining = remaining;
    m_events.dispatch(event);

    return true;
}

int InventoryLedger::get_item_quantity(int recipe_id, ItemQuality quality) const {
    const InventoryStack* stack = find_stack(recipe_id, quality);
    return stack ? stack->quantity : 0;
}

int InventoryLedger::get_total_quantity(int recipe_id) const {
    int total = 0;
    for (const auto& [key, stack] : m_stacks) {
        if (key.first == recipe_id) {
            total += stack.quantity;
        }
    }
    return total;
}

const InventoryStack* InventoryLedger::find_stack(int recipe_id, ItemQuality quality) const {
    auto it = m_stacks.find(StackKey{recipe_id, quality});
    return it != m_stacks.end() ? &it->second : nullptr;
}

std::vector<const InventoryStack*> InventoryLedger::get_bag_contents() const {
    std::vector<const InventoryStack*> contents;
    contents.reserve(m_order.size());
    for (const auto& key : m_order) {
        contents.push_back(&m_stacks.at(key));
    }
    return contents;
}

// ============================================================================
// Sorting
// ============================================================================

void InventoryLedger::sort_bag(SortMode mode) {
    auto stack_of = [this](const StackKey& key) -> const InventoryStack& {
        return m_stacks.at(key);
    };

    switch (mode) {
        case SortMode::Name:
            std::stable_sort(m_order.begin(), m_order.end(), [this](const StackKey& a, const StackKey& b) {
                const auto* recipe_a = m_recipes.get_by_id(a.first);
                const auto* recipe_b = m_recipes.get_by_id(b.first);
                if (!recipe_a || !recipe_b) return false;
                return recipe_a->name < recipe_b->name;
            });
            break;
        case SortMode::Quantity:
            std::stable_sort(m_order.begin(), m_order.end(), [&](const StackKey& a, const StackKey& b) {
                return stack_of(a).quantity > stack_of(b).quantity;
            });
            break;
        case SortMode::Date:
            std::stable_sort(m_order.begin(), m_order.end(), [&](const StackKey& a, const StackKey& b) {
                return stack_of(a).date_added > stack_of(b).date_added;
            });
            break;
        case SortMode::Quality:
            std::stable_sort(m_order.begin(), m_order.end(), [](const StackKey& a, const StackKey& b) {
                return static_cast<int>(a.second) > static_cast<int>(b.second);
            });
            break;
        case SortMode::Value:
            std::stable_sort(m_order.begin(), m_order.end(), [&](const StackKey& a, const StackKey& b) {
                return stack_value(stack_of(a)) > stack_value(stack_of(b));
            });
            break;
    }

    m_sort_mode = mode;
    invalidate_stats();
    core::log(core::LogLevel::Debug, "[Inventory] Sorted bag by {}", get_sort_mode_name(mode));
}

const BagStats& InventoryLedger::get_bag_stats() const {
    if (!m_stats_dirty) {
        return m_stats;
    }

    BagStats stats;
    stats.stack_count = m_stacks.size();
    for (const auto& [key, stack] : m_stacks) {
        stats.total_items += stack.quantity;
        stats.total_value += stack_value(stack);
        stats.quality_counts[static_cast<size_t>(stack.quality) - 1] += stack.quantity;
    }

    m_stats = stats;
    m_stats_dirty = false;
    return m_stats;
}

int64_t InventoryLedger::stack_value(const InventoryStack& stack) const {
    const crafting::Recipe* recipe = m_recipes.get_by_id(stack.recipe_id);
    return recipe ? static_cast<int64_t>(recipe->value) * stack.quantity : 0;
}

// ============================================================================
// Wallet
// ============================================================================

bool InventoryLedger::add_gold(int64_t amount) {
    if (amount <= 0) {
        core::log(core::LogLevel::Warn, "[Inventory] Ignored gold deposit of {}", amount);
        return false;
    }
    set_gold(m_gold + amount);
    return true;
}

bool InventoryLedger::remove_gold(int64_t amount) {
    if (amount <= 0) {
        core::log(core::LogLevel::Warn, "[Inventory] Ignored gold withdrawal of {}", amount);
        return false;
    }
    if (amount > m_gold) {
        core::log(core::LogLevel::Warn, "[Inventory] Cannot spend {} gold, only {} held", amount, m_gold);
        return false;
    }
    set_gold(m_gold - amount);
    return true;
}

void InventoryLedger::set_gold(int64_t amount) {
    GoldChangedEvent event;
    event.old_amount = m_gold;
    event.new_amount = amount;
    event.delta = amount - m_gold;
    m_gold = amount;

    core::log(core::LogLevel::Info, "[Inventory] Gold {} -> {}", event.old_amount, event.new_amount);
    m_events.dispatch(event);
}

// ============================================================================
// Lifecycle
// ============================================================================

void InventoryLedger::clear() {
    m_stacks.clear();
    m_order.clear();
    m_gold = 0;
    invalidate_stats();
}

void InventoryLedger::restore(const std::vector<InventoryStack>& stacks, int64_t gold) {
    clear();
    for (const auto& stack : stacks) {
        if (!quality_from_int(static_cast<int>(stack.quality))) {
            core::log(core::LogLevel::Warn, "[Inventory] Skipped restored stack of recipe {} with invalid quality {}",
                      stack.recipe_id, static_cast<int>(stack.quality));
            continue;
        }
        StackKey key{stack.recipe_id, stack.quality};
        if (m_stacks.emplace(key, stack).second) {
            m_order.push_back(key);
        }
    }
    m_gold = std::max<int64_t>(gold, 0);

    core::log(core::LogLevel::Info, "[Inventory] Restored {} stacks and {} gold", m_stacks.size(), m_gold);
}

// ============================================================================
// Convenience subscriptions
// ============================================================================

core::ScopedConnection InventoryLedger::on_item_added(std::function<void(const ItemAddedEvent&)> callback) {
    return m_events.subscribe<ItemAddedEvent>(std::move(callback));
}

core::ScopedConnection InventoryLedger::on_item_removed(std::function<void(const ItemRemovedEvent&)> callback) {
    return m_events.subscribe<ItemRemovedEvent>(std::move(callback));
}

core::ScopedConnection InventoryLedger::on_gold_changed(std::function<void(const GoldChangedEvent&)> callback) {
    return m_events.subscribe<GoldChangedEvent>(std::move(callback));
}

} // namespace anvil::inventory
