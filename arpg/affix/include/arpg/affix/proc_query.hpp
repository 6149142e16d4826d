#pragma once

#include <arpg/affix/affix_catalog.hpp>
#include <arpg/affix/world_view.hpp>
#include <arpg/items/equipment.hpp>
#include <arpg/settings/combat_tuning.hpp>
#include <string_view>

namespace arpg::affix {

// ============================================================================
// Proc queries - Read by combat code at the moment of a hit or kill
// ============================================================================

// Sum of rolled values for a stat key across equipped gear, condition ignored
float equipped_conditional_value(const items::Equipment& equipment, std::string_view stat_key);

// +1 projectile affix equipped and dexterity at the breakpoint. False without a player.
bool has_extra_projectile(const items::Equipment& equipment, const PlayerView* player,
                          const settings::CombatTuning& tuning);

// Percent bonus granted by equipped status-on-target affixes of this stat key
// when the enemy carries one of the statuses the catalog lists for it
float status_on_target_bonus(const items::Equipment& equipment, const AffixCatalog& catalog,
                             std::string_view stat_key, const EnemyInfo& enemy);

// Percent damage against burning enemies
float status_on_target_damage_bonus(const items::Equipment& equipment, const AffixCatalog& catalog,
                                    const EnemyInfo& enemy);

// Percent attack speed against slowed or chilled enemies
float status_on_target_attack_speed_bonus(const items::Equipment& equipment, const AffixCatalog& catalog,
                                          const EnemyInfo& enemy);

// HP restored on kill, value percent of max HP
float on_kill_heal_amount(const items::Equipment& equipment, float max_hp);

// Fraction of remaining cooldowns refunded on kill
float on_kill_cooldown_refund(const items::Equipment& equipment);

// Probability in [0, 1] that a hit applies slow
float on_hit_slow_chance(const items::Equipment& equipment);

// Seconds the on-hit slow lasts
float on_hit_slow_duration(const AffixCatalog& catalog);

} // namespace arpg::affix
