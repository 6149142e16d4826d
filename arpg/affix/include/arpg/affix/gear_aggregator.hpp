#pragma once

#include <arpg/affix/bonus_channel.hpp>
#include <arpg/items/equipment.hpp>
#include <optional>

namespace arpg::affix {

// Sum passive affixes and gem bonuses of one item into totals.
// Conditional and unknown stat keys are skipped.
void add_item_bonuses(const items::Item& item, BonusTotals& totals);

// Passive totals across all equipped items
BonusTotals aggregate_gear(const items::Equipment& equipment);

// Sum of base armor over equipped items
float total_base_armor(const items::Equipment& equipment);

// Base damage of the equipped weapon, nullopt when unarmed or the weapon has none
std::optional<float> weapon_base_damage(const items::Equipment& equipment);

} // namespace arpg::affix
