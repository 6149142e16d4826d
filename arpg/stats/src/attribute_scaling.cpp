#include <arpg/stats/attribute_scaling.hpp>

namespace arpg::stats {

float intelligence_damage_multiplier(float intelligence, const settings::CombatTuning& tuning) {
    return 1.0f + intelligence * tuning.damage_per_intelligence;
}

float dexterity_attack_speed_multiplier(float dexterity, const settings::CombatTuning& tuning) {
    // Inverse of the attack cooldown multiplier 1 / (1 + dex * k)
    return 1.0f + dexterity * tuning.attack_speed_per_dexterity;
}

float dexterity_projectile_speed_multiplier(float dexterity, const settings::CombatTuning& tuning) {
    return 1.0f + dexterity * tuning.projectile_speed_per_dexterity;
}

float focus_cooldown_multiplier(float focus, const settings::CombatTuning& tuning) {
    return 1.0f / (1.0f + focus * tuning.cooldown_per_focus);
}

float vitality_bonus_hp(float vitality, const settings::CombatTuning& tuning) {
    return vitality * tuning.hp_per_vitality;
}

} // namespace arpg::stats
