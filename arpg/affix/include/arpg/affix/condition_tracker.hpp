#pragma once

#include <arpg/core/game_clock.hpp>
#include <arpg/settings/combat_tuning.hpp>
#include <deque>

namespace arpg::affix {

// ============================================================================
// ConditionalStateTracker - Gameplay history read by conditional affixes
// ============================================================================

// Hooks are fire-and-forget calls from gameplay code. They only record; the
// tracker never evaluates anything. All timestamps come from the injected
// simulation clock.
class ConditionalStateTracker {
public:
    ConditionalStateTracker(core::SimulationClock& clock, const settings::CombatTuning& tuning);

    ConditionalStateTracker(const ConditionalStateTracker&) = delete;
    ConditionalStateTracker& operator=(const ConditionalStateTracker&) = delete;

    // ========================================================================
    // Hooks
    // ========================================================================

    // Current player velocity magnitude. Starting to move zeroes stationary time.
    void track_movement(float speed);
    void track_damage_taken();
    void track_kill();
    void track_skill_used();
    void track_movement_skill_used();

    // Number of enemies struck by a single attack
    void track_multi_hit(int count);

    // ========================================================================
    // Per tick
    // ========================================================================

    // Advance the clock, accumulate stationary time and prune old kills
    void advance(double dt);

    // Zone transition / class switch. Clears history and rewinds the clock.
    void reset();

    // ========================================================================
    // State
    // ========================================================================

    double now() const { return m_clock.now(); }
    bool is_moving() const { return m_moving; }
    float stationary_time_ms() const { return m_stationary_ms; }

    double last_damage_time() const { return m_last_damage; }
    double last_skill_time() const { return m_last_skill; }
    double last_movement_skill_time() const { return m_last_movement_skill; }
    int last_multi_hit_count() const { return m_last_multi_hit_count; }
    double last_multi_hit_time() const { return m_last_multi_hit; }

    const std::deque<double>& kill_timestamps() const { return m_kills; }
    double last_kill_time() const { return m_kills.empty() ? core::SimulationClock::Never : m_kills.back(); }

    // Kills with timestamp >= since
    int kills_since(double since) const;

    const settings::CombatTuning& tuning() const { return m_tuning; }

private:
    core::SimulationClock& m_clock;
    const settings::CombatTuning& m_tuning;

    bool m_moving = false;
    float m_stationary_ms = 0.0f;

    double m_last_damage = core::SimulationClock::Never;
    double m_last_skill = core::SimulationClock::Never;
    double m_last_movement_skill = core::SimulationClock::Never;

    int m_last_multi_hit_count = 0;
    double m_last_multi_hit = core::SimulationClock::Never;

    std::deque<double> m_kills;     // Ascending
};

} // namespace arpg::affix
