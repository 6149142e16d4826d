#include <arpg/stats/stat_calculator.hpp>
#include <arpg/stats/attribute_scaling.hpp>
#include <arpg/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace arpg::stats {

using affix::BonusChannel;

// ============================================================================
// StatCalculator
// ============================================================================

float StatCalculator::damage_reduction(float armor, const settings::CombatTuning& tuning) {
    if (!(armor > 0.0f)) {
        return 0.0f;
    }
    float reduction = armor / (armor + tuning.armor_constant);
    // Diminishing returns never reach full immunity
    constexpr float k_max_reduction = 1.0f - std::numeric_limits<float>::epsilon();
    return std::clamp(reduction, 0.0f, k_max_reduction);
}

float StatCalculator::cooldown_reduction(float percent_cdr, float focus, const settings::CombatTuning& tuning) {
    float gear_cdr = percent_cdr / 100.0f;
    float focus_cdr = 1.0f - focus_cooldown_multiplier(focus, tuning);
    return std::clamp(gear_cdr + focus_cdr, 0.0f, tuning.cooldown_reduction_cap);
}

FinalStats StatCalculator::calculate(const StatInputs& inputs, const settings::CombatTuning& tuning) {
    const affix::BonusTotals totals = inputs.gear + inputs.conditional;
    const affix::Attributes& attrs = inputs.attributes;

    auto channel = [&totals](BonusChannel c) { return totals.get(c); };

    FinalStats stats;

    // ========================================================================
    // Offensive
    // ========================================================================

    float weapon_damage = inputs.weapon_base_damage.value_or(tuning.unarmed_weapon_damage);
    float damage = (weapon_damage + channel(BonusChannel::FlatDamage))
                 * (1.0f + channel(BonusChannel::PercentDamage) / 100.0f)
                 * intelligence_damage_multiplier(attrs.intelligence, tuning);
    stats.damage = std::round(damage);

    stats.attack_speed = (1.0f + channel(BonusChannel::PercentAttackSpeed) / 100.0f)
                       * dexterity_attack_speed_multiplier(attrs.dexterity, tuning);

    stats.projectile_speed = (1.0f + channel(BonusChannel::PercentProjectileSpeed) / 100.0f)
                           * dexterity_projectile_speed_multiplier(attrs.dexterity, tuning);

    stats.crit_chance = std::clamp(channel(BonusChannel::PercentCritChance) / 100.0f, 0.0f, 1.0f);
    stats.crit_multiplier = tuning.base_crit_multiplier;

    // ========================================================================
    // Defensive
    // ========================================================================

    float max_hp = (tuning.base_max_hp + vitality_bonus_hp(attrs.vitality, tuning) + channel(BonusChannel::FlatHP))
                 * (1.0f + channel(BonusChannel::PercentHP) / 100.0f);
    stats.max_hp = std::round(max_hp);

    stats.armor = inputs.base_armor + channel(BonusChannel::FlatArmor);
    stats.damage_reduction = damage_reduction(stats.armor, tuning);
    stats.hp_regen = channel(BonusChannel::HpRegen);

    // ========================================================================
    // Utility
    // ========================================================================

    stats.move_speed = tuning.base_move_speed * (1.0f + channel(BonusChannel::PercentMoveSpeed) / 100.0f);
    stats.cooldown_reduction = cooldown_reduction(channel(BonusChannel::PercentCDR), attrs.focus, tuning);
    stats.xp_multiplier = 1.0f + channel(BonusChannel::PercentXPGain) / 100.0f;
    stats.gold_multiplier = 1.0f + channel(BonusChannel::PercentGoldFind) / 100.0f;

    return stats;
}

// ============================================================================
// StatCache
// ============================================================================

StatCache::StatCache(InputSource source, const settings::CombatTuning& tuning)
    : m_source(std::move(source))
    , m_tuning(tuning)
{}

const FinalStats& StatCache::get() {
    if (m_dirty) {
        recalculate();
    }
    return m_stats;
}

const FinalStats& StatCache::recalculate() {
    m_stats = StatCalculator::calculate(m_source(), m_tuning);
    m_dirty = false;
    ++m_recompute_count;

    core::log(core::LogLevel::Trace, "[Stats] Recalculated: damage {} max_hp {} armor {} cdr {}",
              m_stats.damage, m_stats.max_hp, m_stats.armor, m_stats.cooldown_reduction);
    return m_stats;
}

// ============================================================================
// Health sync
// ============================================================================

void sync_player_health(affix::Health& health, const FinalStats& stats) {
    float gained = stats.max_hp - health.max;
    health.max = stats.max_hp;
    if (gained > 0.0f) {
        health.current += gained;
    }
    health.current = std::min(health.current, health.max);
}

} // namespace arpg::stats
