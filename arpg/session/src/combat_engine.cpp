#include <arpg/session/combat_engine.hpp>
#include <arpg/core/log.hpp>

namespace arpg::session {

namespace {

settings::CombatTuning validated(settings::CombatTuning tuning) {
    tuning.validate();
    return tuning;
}

} // anonymous namespace

CombatEngine::CombatEngine(items::Equipment& equipment,
                           const affix::AffixCatalog& catalog,
                           settings::CombatTuning tuning)
    : m_equipment(equipment)
    , m_catalog(catalog)
    , m_tuning(validated(std::move(tuning)))
    , m_frame_clock(m_tuning.fixed_timestep)
    , m_tracker(m_clock, m_tuning)
    , m_router(m_catalog)
    , m_cache([this]() { return gather_inputs(); }, m_tuning)
{
    m_equipment.set_change_listener([this](items::EquipSlot slot) {
        core::log(core::LogLevel::Debug, "[Session] Equipment changed in {}", items::get_equip_slot_name(slot));
        m_cache.mark_dirty();
    });

    core::log(core::LogLevel::Debug, "[Session] Combat engine created ({} affix definitions)", m_catalog.size());
}

CombatEngine::~CombatEngine() {
    m_equipment.set_change_listener(nullptr);
}

// ============================================================================
// World wiring
// ============================================================================

void CombatEngine::set_player(const affix::PlayerView* player) {
    m_player = player;
    m_last_attributes = player ? player->attributes() : affix::Attributes{};
    m_cache.mark_dirty();
}

void CombatEngine::set_enemies(const affix::EnemySource* enemies) {
    m_enemies = enemies;
    m_cache.mark_dirty();
}

affix::EvaluationContext CombatEngine::context() const {
    return affix::EvaluationContext{m_tracker, m_player, m_enemies, m_tuning};
}

// ============================================================================
// Per fixed step
// ============================================================================

void CombatEngine::conditional_affix_system(double dt) {
    m_tracker.advance(dt);
    if (dt > 0.0) {
        m_buffs.tick(dt);
    }

    auto ctx = context();
    m_router.update(m_equipment, ctx, m_buffs);

    affix::BonusTotals totals = m_router.collect(m_equipment, ctx, m_buffs);
    if (totals != m_conditional_totals) {
        m_conditional_totals = totals;
        m_cache.mark_dirty();
    }

    // Stat point allocation shows up on the next step even without an explicit mark
    if (m_player) {
        affix::Attributes attributes = m_player->attributes();
        if (attributes != m_last_attributes) {
            m_last_attributes = attributes;
            m_cache.mark_dirty();
        }
    }
}

int CombatEngine::update(double frame_dt) {
    int steps = m_frame_clock.accumulate(frame_dt);
    for (int i = 0; i < steps; ++i) {
        conditional_affix_system(m_frame_clock.fixed_dt());
    }
    return steps;
}

// ============================================================================
// Stats
// ============================================================================

affix::BonusTotals CombatEngine::collect_conditional() const {
    return m_router.collect(m_equipment, context(), m_buffs);
}

stats::StatInputs CombatEngine::gather_inputs() {
    m_conditional_totals = collect_conditional();

    stats::StatInputs inputs;
    inputs.gear = affix::aggregate_gear(m_equipment);
    inputs.conditional = m_conditional_totals;
    inputs.weapon_base_damage = affix::weapon_base_damage(m_equipment);
    inputs.base_armor = affix::total_base_armor(m_equipment);
    if (m_player) {
        inputs.attributes = m_player->attributes();
        m_last_attributes = inputs.attributes;
    }
    return inputs;
}

void CombatEngine::sync_player_health(affix::Health& health) {
    stats::sync_player_health(health, get_computed_stats());
}

// ============================================================================
// Proc queries
// ============================================================================

float CombatEngine::equipped_conditional_value(std::string_view stat_key) const {
    return affix::equipped_conditional_value(m_equipment, stat_key);
}

bool CombatEngine::has_extra_projectile_conditional() const {
    return affix::has_extra_projectile(m_equipment, m_player, m_tuning);
}

float CombatEngine::status_on_target_damage_bonus(const affix::EnemyInfo& enemy) const {
    return affix::status_on_target_damage_bonus(m_equipment, m_catalog, enemy);
}

float CombatEngine::status_on_target_attack_speed_bonus(const affix::EnemyInfo& enemy) const {
    return affix::status_on_target_attack_speed_bonus(m_equipment, m_catalog, enemy);
}

float CombatEngine::on_kill_heal_amount() {
    return affix::on_kill_heal_amount(m_equipment, get_computed_stats().max_hp);
}

float CombatEngine::on_kill_cooldown_refund() const {
    return affix::on_kill_cooldown_refund(m_equipment);
}

float CombatEngine::on_hit_slow_chance() const {
    return affix::on_hit_slow_chance(m_equipment);
}

float CombatEngine::on_hit_slow_duration() const {
    return affix::on_hit_slow_duration(m_catalog);
}

// ============================================================================
// Lifecycle
// ============================================================================

void CombatEngine::reset_conditional_state() {
    m_tracker.reset();
    m_frame_clock.reset();
    m_buffs.clear();
    m_conditional_totals.clear();
    m_cache.mark_dirty();

    core::log(core::LogLevel::Info, "[Session] Conditional state reset");
}

} // namespace arpg::session
