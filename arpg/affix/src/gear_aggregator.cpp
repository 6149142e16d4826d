#include <arpg/affix/gear_aggregator.hpp>
#include <arpg/affix/gem_bonus.hpp>
#include <arpg/core/log.hpp>
#include <arpg/core/math.hpp>

namespace arpg::affix {

void add_item_bonuses(const items::Item& item, BonusTotals& totals) {
    for (const auto& affix : item.affixes) {
        if (affix.is_conditional()) continue;

        auto channel = find_passive_channel(affix.stat_key);
        if (!channel) {
            core::log(core::LogLevel::Trace, "[Affix] Ignoring unknown stat '{}' on item '{}'",
                      affix.stat_key, item.id);
            continue;
        }
        totals.add(*channel, affix.rolled_value);
    }

    if (const items::Gem* gem = item.socketed_gem()) {
        GemBonus bonus = get_gem_bonus(gem->type);
        totals.add(bonus.channel, bonus.value);
    }
}

BonusTotals aggregate_gear(const items::Equipment& equipment) {
    BonusTotals totals;
    equipment.for_each_item([&](const items::Item& item) {
        add_item_bonuses(item, totals);
    });
    return totals;
}

float total_base_armor(const items::Equipment& equipment) {
    float armor = 0.0f;
    equipment.for_each_item([&](const items::Item& item) {
        if (item.base_stats.armor) {
            armor += core::finite_or(*item.base_stats.armor, 0.0f);
        }
    });
    return armor;
}

std::optional<float> weapon_base_damage(const items::Equipment& equipment) {
    const items::Item* weapon = equipment.get(items::EquipSlot::Weapon);
    if (!weapon || !weapon->base_stats.damage) {
        return std::nullopt;
    }
    return core::finite_or(*weapon->base_stats.damage, 0.0f);
}

} // namespace arpg::affix
