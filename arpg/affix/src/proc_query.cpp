#include <arpg/affix/proc_query.hpp>
#include <arpg/affix/conditional_routing.hpp>
#include <algorithm>

namespace arpg::affix {

float equipped_conditional_value(const items::Equipment& equipment, std::string_view stat_key) {
    float total = 0.0f;
    equipment.for_each_item([&](const items::Item& item) {
        for (const auto& affix : item.affixes) {
            if (affix.stat_key == stat_key) {
                total += core::finite_or(affix.rolled_value, 0.0f);
            }
        }
    });
    return total;
}

bool has_extra_projectile(const items::Equipment& equipment, const PlayerView* player,
                          const settings::CombatTuning& tuning) {
    if (equipped_conditional_value(equipment, stat_keys::HighDexProjectileCount) <= 0.0f) {
        return false;
    }
    if (!player) return false;
    return player->attributes().dexterity >= tuning.extra_projectile_dexterity;
}

// ============================================================================
// Status on target
// ============================================================================

namespace {

std::vector<StatusType> statuses_for(const AffixCatalog& catalog, std::string_view stat_key) {
    const AffixDefinition* def = catalog.find_by_stat(stat_key);
    if (!def || !def->condition || def->condition->type != ConditionType::StatusOnTarget) {
        return {};
    }
    return params_or_default<StatusOnTargetParams>(def->condition->type, def->condition->params).statuses;
}

} // anonymous namespace

float status_on_target_bonus(const items::Equipment& equipment, const AffixCatalog& catalog,
                             std::string_view stat_key, const EnemyInfo& enemy) {
    float value = equipped_conditional_value(equipment, stat_key);
    if (value <= 0.0f) return 0.0f;

    return enemy.has_any_status(statuses_for(catalog, stat_key)) ? value : 0.0f;
}

float status_on_target_damage_bonus(const items::Equipment& equipment, const AffixCatalog& catalog,
                                    const EnemyInfo& enemy) {
    return status_on_target_bonus(equipment, catalog, stat_keys::HitBurningDamage, enemy);
}

float status_on_target_attack_speed_bonus(const items::Equipment& equipment, const AffixCatalog& catalog,
                                          const EnemyInfo& enemy) {
    return status_on_target_bonus(equipment, catalog, stat_keys::HitSlowedAttackSpeed, enemy);
}

// ============================================================================
// On kill / on hit
// ============================================================================

float on_kill_heal_amount(const items::Equipment& equipment, float max_hp) {
    float pct = equipped_conditional_value(equipment, stat_keys::OnKillHeal);
    if (pct <= 0.0f || max_hp <= 0.0f) return 0.0f;
    return max_hp * pct / 100.0f;
}

float on_kill_cooldown_refund(const items::Equipment& equipment) {
    float pct = equipped_conditional_value(equipment, stat_keys::OnKillCooldownRefund);
    return std::clamp(pct / 100.0f, 0.0f, 1.0f);
}

float on_hit_slow_chance(const items::Equipment& equipment) {
    float pct = equipped_conditional_value(equipment, stat_keys::OnHitSlow);
    return std::clamp(pct / 100.0f, 0.0f, 1.0f);
}

float on_hit_slow_duration(const AffixCatalog& catalog) {
    const AffixDefinition* def = catalog.find_by_stat(stat_keys::OnHitSlow);
    if (!def || !def->condition) {
        return OnHitParams{}.duration;
    }
    return params_or_default<OnHitParams>(ConditionType::OnHit, def->condition->params).duration;
}

} // namespace arpg::affix
