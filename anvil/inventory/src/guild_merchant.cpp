#include <anvil/inventory/guild_merchant.hpp>
#include <anvil/core/log.hpp>

namespace anvil::inventory {

const char* get_sell_result_name(SellResult result) {
    switch (result) {
        case SellResult::Sold:           return "Sold";
        case SellResult::UnknownItem:    return "UnknownItem";
        case SellResult::NotSellable:    return "NotSellable";
        case SellResult::NotInInventory: return "NotInInventory";
        default:                         return "Unknown";
    }
}

GuildMerchant::GuildMerchant(const crafting::RecipeCatalog& recipes, InventoryLedger& ledger,
                             core::EventDispatcher& events)
    : m_recipes(recipes)
    , m_ledger(ledger)
    , m_events(events) {}

SellResult GuildMerchant::sell(const std::string& item_name, ItemQuality quality) {
    const crafting::Recipe* recipe = m_recipes.get_by_name(item_name);
    if (!recipe) {
        core::log(core::LogLevel::Warn, "[Guild] No recipe named '{}'", item_name);
        return SellResult::UnknownItem;
    }
    return sell_recipe(*recipe, quality);
}

SellResult GuildMerchant::sell(int recipe_id, ItemQuality quality) {
    const crafting::Recipe* recipe = m_recipes.get_by_id(recipe_id);
    if (!recipe) {
        core::log(core::LogLevel::Warn, "[Guild] No recipe with id {}", recipe_id);
        return SellResult::UnknownItem;
    }
    return sell_recipe(*recipe, quality);
}

SellResult GuildMerchant::sell_recipe(const crafting::Recipe& recipe, ItemQuality quality) {
    if (!recipe.is_sellable()) {
        core::log(core::LogLevel::Warn, "[Guild] No sell price for {}", recipe.name);
        return SellResult::NotSellable;
    }

    if (m_ledger.get_item_quantity(recipe.id, quality) < 1) {
        core::log(core::LogLevel::Warn, "[Guild] Player has no {} {}", get_quality_name(quality), recipe.name);
        return SellResult::NotInInventory;
    }

    if (!m_ledger.remove_item(recipe.id, 1, quality)) {
        return SellResult::NotInInventory;
    }
    m_ledger.add_gold(recipe.sell_price);

    core::log(core::LogLevel::Info, "[Guild] Sold {} for {} gold", recipe.name, recipe.sell_price);

    ItemSoldEvent event;
    event.recipe_id = recipe.id;
    event.item_name = recipe.name;
    event.quality = quality;
    event.price = recipe.sell_price;
    m_events.dispatch(event);

    return SellResult::Sold;
}

int GuildMerchant::get_sell_price(int recipe_id) const {
    const crafting::Recipe* recipe = m_recipes.get_by_id(recipe_id);
    return recipe ? recipe->sell_price : 0;
}

int GuildMerchant::get_sell_price(const std::string& item_name) const {
    const crafting::Recipe* recipe = m_recipes.get_by_name(item_name);
    return recipe ? recipe->sell_price : 0;
}

std::vector<SellableStack> GuildMerchant::get_sellable_stacks() const {
    std::vector<SellableStack> result;
    for (const InventoryStack* stack : m_ledger.get_bag_contents()) {
        const crafting::Recipe* recipe = m_recipes.get_by_id(stack->recipe_id);
        if (recipe && recipe->is_sellable()) {
            result.push_back({stack, recipe, recipe->sell_price});
        }
    }
    return result;
}

core::ScopedConnection GuildMerchant::on_item_sold(std::function<void(const ItemSoldEvent&)> callback) {
    return m_events.subscribe<ItemSoldEvent>(std::move(callback));
}

} // namespace anvil::inventory
