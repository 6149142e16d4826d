#pragma once

#include <arpg/settings/combat_tuning.hpp>

namespace arpg::stats {

// ============================================================================
// Attribute scaling - What allocated stat points are worth
// ============================================================================

// Multiplier on outgoing damage from intelligence
float intelligence_damage_multiplier(float intelligence, const settings::CombatTuning& tuning);

// Attacks-per-second multiplier from dexterity
float dexterity_attack_speed_multiplier(float dexterity, const settings::CombatTuning& tuning);

// Projectile speed multiplier from dexterity
float dexterity_projectile_speed_multiplier(float dexterity, const settings::CombatTuning& tuning);

// Cooldown duration multiplier from focus (< 1 means shorter cooldowns)
float focus_cooldown_multiplier(float focus, const settings::CombatTuning& tuning);

// Additive max HP from vitality
float vitality_bonus_hp(float vitality, const settings::CombatTuning& tuning);

} // namespace arpg::stats
