#pragma once

#include <anvil/inventory/item_stack.hpp>
#include <anvil/inventory/inventory_events.hpp>
#include <anvil/crafting/recipe_catalog.hpp>
#include <anvil/core/event_dispatcher.hpp>
#include <array>
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace anvil::inventory {

// ============================================================================
// Sort Mode
// ============================================================================

enum class SortMode : uint8_t {
    Name,           // A to Z
    Quantity,       // Largest stack first
    Date,           // Newest first
    Quality,        // Highest quality first
    Value           // recipe value x quantity, highest first
};

const char* get_sort_mode_name(SortMode mode);
std::optional<SortMode> sort_mode_from_string(const std::string& name);

// ============================================================================
// Bag Stats
// ============================================================================

struct BagStats {
    int total_items = 0;                                // Sum of quantities
    int64_t total_value = 0;                            // Sum of value x quantity
    size_t stack_count = 0;
    std::array<int, ITEM_QUALITY_COUNT> quality_counts{};  // Indexed by quality - 1

    // 0 for values outside ItemQuality
    int count_for(ItemQuality quality) const {
        if (!quality_from_int(static_cast<int>(quality))) return 0;
        return quality_counts[static_cast<size_t>(quality) - 1];
    }
};

// ============================================================================
// InventoryLedger - Item stacks and gold wallet
// ============================================================================
//
// At most one stack exists per (recipe, quality); a stack that reaches zero is
// erased. Pointers to a stack stay valid until that stack is erased, cleared
// or replaced by restore(). Gold never goes negative.

class InventoryLedger {
public:
    using Clock = std::function<uint64_t()>;

    InventoryLedger(const crafting::RecipeCatalog& recipes, core::EventDispatcher& events);

    InventoryLedger(const InventoryLedger&) = delete;
    InventoryLedger& operator=(const InventoryLedger&) = delete;

    // ========================================================================
    // Items
    // ========================================================================

    // Returns the updated stack, or nullptr for quantity <= 0, an unknown recipe
    // or an out-of-range quality. Also nullptr if an ItemAddedEvent listener
    // removed the stack.
    const InventoryStack* add_item(int recipe_id, int quantity = 1,
                                   ItemQuality quality = ItemQuality::Normal);

    // Returns false without changes when the stack is missing or too small
    bool remove_item(int recipe_id, int quantity = 1,
                     ItemQuality quality = ItemQuality::Normal);

    int get_item_quantity(int recipe_id, ItemQuality quality = ItemQuality::Normal) const;
    int get_total_quantity(int recipe_id) const;
    const InventoryStack* find_stack(int recipe_id, ItemQuality quality = ItemQuality::Normal) const;

    // Display order
    std::vector<const InventoryStack*> get_bag_contents() const;
    size_t stack_count() const { return m_stacks.size(); }
    bool is_empty() const { return m_stacks.empty(); }

    // ========================================================================
    // Sorting
    // ========================================================================

    void sort_bag(SortMode mode);
    SortMode get_sort_mode() const { return m_sort_mode; }

    // Cached until the next mutation
    const BagStats& get_bag_stats() const;

    // ========================================================================
    // Wallet
    // ========================================================================

    bool add_gold(int64_t amount);
    bool remove_gold(int64_t amount);
    int64_t get_gold() const { return m_gold; }
    bool has_gold(int64_t amount) const { return amount <= m_gold; }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Empties the bag and wallet without publishing events
    void clear();

    // Installs stacks in the given order. Callers validate first; stacks with
    // an out-of-range quality are skipped.
    void restore(const std::vector<InventoryStack>& stacks, int64_t gold);

    void set_clock(Clock clock) { m_clock = std::move(clock); }

    const crafting::RecipeCatalog& recipes() const { return m_recipes; }

    // ========================================================================
    // Convenience subscriptions
    // ========================================================================

    core::ScopedConnection on_item_added(std::function<void(const ItemAddedEvent&)> callback);
    core::ScopedConnection on_item_removed(std::function<void(const ItemRemovedEvent&)> callback);
    core::ScopedConnection on_gold_changed(std::function<void(const GoldChangedEvent&)> callback);

private:
    using StackKey = std::pair<int, ItemQuality>;

    void invalidate_stats() { m_stats_dirty = true; }
    void set_gold(int64_t amount);
    int64_t stack_value(const InventoryStack& stack) const;

    const crafting::RecipeCatalog& m_recipes;
    core::EventDispatcher& m_events;

    std::map<StackKey, InventoryStack> m_stacks;
    std::vector<StackKey> m_order;
    SortMode m_sort_mode = SortMode::Date;

    int64_t m_gold = 0;
    Clock m_clock;

    mutable BagStats m_stats;
    mutable bool m_stats_dirty = true;
};

} // namespace anvil::inventory
