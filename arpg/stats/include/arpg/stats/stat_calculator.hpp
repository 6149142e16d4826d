#pragma once

#include <arpg/affix/bonus_channel.hpp>
#include <arpg/affix/world_view.hpp>
#include <arpg/settings/combat_tuning.hpp>
#include <arpg/stats/final_stats.hpp>
#include <functional>
#include <optional>

namespace arpg::stats {

// ============================================================================
// StatInputs - Everything the derived stats are computed from
// ============================================================================

struct StatInputs {
    affix::BonusTotals gear;                    // Passive affixes and gems
    affix::BonusTotals conditional;             // Currently active conditional affixes
    std::optional<float> weapon_base_damage;    // nullopt when unarmed
    float base_armor = 0.0f;                    // Sum of item base armor
    affix::Attributes attributes;               // Zero without a player
};

// ============================================================================
// StatCalculator - Pure formulas
// ============================================================================

class StatCalculator {
public:
    static FinalStats calculate(const StatInputs& inputs, const settings::CombatTuning& tuning);

    // armor / (armor + constant), clamped to [0, 1). Negative armor gives 0.
    static float damage_reduction(float armor, const settings::CombatTuning& tuning);

    // Gear CDR plus focus CDR, clamped to [0, cap]
    static float cooldown_reduction(float percent_cdr, float focus, const settings::CombatTuning& tuning);
};

// ============================================================================
// StatCache - Recomputes only when marked dirty
// ============================================================================

class StatCache {
public:
    using InputSource = std::function<StatInputs()>;

    StatCache(InputSource source, const settings::CombatTuning& tuning);

    // Cached stats, recomputed first if dirty
    const FinalStats& get();

    // Force a recompute now
    const FinalStats& recalculate();

    void mark_dirty() { m_dirty = true; }
    bool is_dirty() const { return m_dirty; }

    // Number of recomputes so far
    size_t recompute_count() const { return m_recompute_count; }

private:
    InputSource m_source;
    const settings::CombatTuning& m_tuning;
    FinalStats m_stats;
    bool m_dirty = true;
    size_t m_recompute_count = 0;
};

// ============================================================================
// Health sync
// ============================================================================

// Apply a new max HP. Gaining max heals by the gain, losing it clamps current.
void sync_player_health(affix::Health& health, const FinalStats& stats);

} // namespace arpg::stats
