#pragma once

#include <arpg/affix/affix.hpp>
#include <arpg/core/game_clock.hpp>
#include <arpg/items/equipment.hpp>
#include <arpg/settings/combat_tuning.hpp>
#include <arpg/stats/stat_calculator.hpp>
#include <string_view>

namespace arpg::session {

// ============================================================================
// CombatEngine - Session-scoped owner of all conditional affix and stat state
// ============================================================================

// One per play session. Gameplay code calls the track_* hooks as things
// happen, conditional_affix_system() once per fixed step, and reads stats
// through get_computed_stats().
class CombatEngine {
public:
    explicit CombatEngine(items::Equipment& equipment,
                          const affix::AffixCatalog& catalog = affix::builtin_affix_catalog(),
                          settings::CombatTuning tuning = {});
    ~CombatEngine();

    CombatEngine(const CombatEngine&) = delete;
    CombatEngine& operator=(const CombatEngine&) = delete;

    // ========================================================================
    // World wiring (non-owning, may be null)
    // ========================================================================

    void set_player(const affix::PlayerView* player);
    void set_enemies(const affix::EnemySource* enemies);

    // ========================================================================
    // Gameplay hooks
    // ========================================================================

    void track_movement(float speed) { m_tracker.track_movement(speed); }
    void track_damage_taken() { m_tracker.track_damage_taken(); }
    void track_kill() { m_tracker.track_kill(); }
    void track_skill_used() { m_tracker.track_skill_used(); }
    void track_movement_skill_used() { m_tracker.track_movement_skill_used(); }
    void track_multi_hit(int count) { m_tracker.track_multi_hit(count); }

    // ========================================================================
    // Per fixed step
    // ========================================================================

    // Advance time, tick buffs, start/refresh timed buffs and invalidate
    // stats if the active conditional bonuses changed
    void conditional_affix_system(double dt);

    // Feed variable frame time; runs as many fixed steps as are due
    int update(double frame_dt);

    // ========================================================================
    // Stats
    // ========================================================================

    const stats::FinalStats& get_computed_stats() { return m_cache.get(); }
    const stats::FinalStats& recalculate_stats() { return m_cache.recalculate(); }
    void mark_stats_dirty() { m_cache.mark_dirty(); }
    bool stats_dirty() const { return m_cache.is_dirty(); }
    size_t recompute_count() const { return m_cache.recompute_count(); }

    // Apply current max HP to the player's health pool
    void sync_player_health(affix::Health& health);

    // Passive totals from gear and gems
    affix::BonusTotals gear_totals() const { return affix::aggregate_gear(m_equipment); }

    // Conditional totals used by the last stat computation
    const affix::BonusTotals& conditional_totals() const { return m_conditional_totals; }

    // ========================================================================
    // Proc queries
    // ========================================================================

    float equipped_conditional_value(std::string_view stat_key) const;
    bool has_extra_projectile_conditional() const;
    float status_on_target_damage_bonus(const affix::EnemyInfo& enemy) const;
    float status_on_target_attack_speed_bonus(const affix::EnemyInfo& enemy) const;
    float on_kill_heal_amount();
    float on_kill_cooldown_refund() const;
    float on_hit_slow_chance() const;
    float on_hit_slow_duration() const;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Zone transition / class switch: clear history, buffs and the clock
    void reset_conditional_state();

    // ========================================================================
    // Read access
    // ========================================================================

    const affix::ConditionalStateTracker& tracker() const { return m_tracker; }
    const affix::BuffTimerManager& active_buffs() const { return m_buffs; }
    const core::SimulationClock& clock() const { return m_clock; }
    const settings::CombatTuning& tuning() const { return m_tuning; }

private:
    affix::EvaluationContext context() const;
    affix::BonusTotals collect_conditional() const;
    stats::StatInputs gather_inputs();

    items::Equipment& m_equipment;
    const affix::AffixCatalog& m_catalog;
    settings::CombatTuning m_tuning;

    core::GameClock m_frame_clock;
    core::SimulationClock m_clock;
    affix::ConditionalStateTracker m_tracker;
    affix::BuffTimerManager m_buffs;
    affix::BonusRouter m_router;
    stats::StatCache m_cache;

    const affix::PlayerView* m_player = nullptr;
    const affix::EnemySource* m_enemies = nullptr;

    affix::BonusTotals m_conditional_totals;
    affix::Attributes m_last_attributes;
};

} // namespace arpg::session
