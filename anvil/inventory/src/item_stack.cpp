#include <anvil/inventory/item_stack.hpp>

namespace anvil::inventory {

const char* get_quality_name(ItemQuality quality) {
    switch (quality) {
        case ItemQuality::Normal:      return "Normal";
        case ItemQuality::Fine:        return "Fine";
        case ItemQuality::Exceptional: return "Exceptional";
        case ItemQuality::Masterwork:  return "Masterwork";
        default:                       return "Unknown";
    }
}

std::optional<ItemQuality> quality_from_string(const std::string& name) {
    for (int i = 1; i <= ITEM_QUALITY_COUNT; ++i) {
        auto quality = static_cast<ItemQuality>(i);
        if (name == get_quality_name(quality)) {
            return quality;
        }
    }
    return std::nullopt;
}

std::optional<ItemQuality> quality_from_int(int value) {
    if (value < 1 || value > ITEM_QUALITY_COUNT) {
        return std::nullopt;
    }
    return static_cast<ItemQuality>(value);
}

} // namespace anvil::inventory
