#include <arpg/affix/condition_tracker.hpp>
#include <algorithm>

namespace arpg::affix {

ConditionalStateTracker::ConditionalStateTracker(core::SimulationClock& clock,
                                                 const settings::CombatTuning& tuning)
    : m_clock(clock)
    , m_tuning(tuning)
{}

// ============================================================================
// Hooks
// ============================================================================

void ConditionalStateTracker::track_movement(float speed) {
    m_moving = speed > m_tuning.moving_speed_threshold;
    if (m_moving) {
        m_stationary_ms = 0.0f;
    }
}

void ConditionalStateTracker::track_damage_taken() {
    m_last_damage = m_clock.now();
}

void ConditionalStateTracker::track_kill() {
    m_kills.push_back(m_clock.now());
}

void ConditionalStateTracker::track_skill_used() {
    m_last_skill = m_clock.now();
}

void ConditionalStateTracker::track_movement_skill_used() {
    m_last_movement_skill = m_clock.now();
}

void ConditionalStateTracker::track_multi_hit(int count) {
    // A smaller follow-up hit inside the window doesn't overwrite the bigger one
    if (count > m_last_multi_hit_count || m_clock.since(m_last_multi_hit) > m_tuning.event_window) {
        m_last_multi_hit_count = count;
        m_last_multi_hit = m_clock.now();
    }
}

// ============================================================================
// Per tick
// ============================================================================

void ConditionalStateTracker::advance(double dt) {
    if (dt <= 0.0) return;

    m_clock.advance(dt);

    if (!m_moving) {
        m_stationary_ms += static_cast<float>(dt * 1000.0);
    }

    double cutoff = m_clock.now() - m_tuning.kill_history_seconds;
    while (!m_kills.empty() && m_kills.front() < cutoff) {
        m_kills.pop_front();
    }
}

void ConditionalStateTracker::reset() {
    m_clock.reset();

    m_moving = false;
    m_stationary_ms = 0.0f;
    m_last_damage = core::SimulationClock::Never;
    m_last_skill = core::SimulationClock::Never;
    m_last_movement_skill = core::SimulationClock::Never;
    m_last_multi_hit_count = 0;
    m_last_multi_hit = core::SimulationClock::Never;
    m_kills.clear();
}

int ConditionalStateTracker::kills_since(double since) const {
    auto first = std::lower_bound(m_kills.begin(), m_kills.end(), since);
    return static_cast<int>(std::distance(first, m_kills.end()));
}

} // namespace arpg::affix
