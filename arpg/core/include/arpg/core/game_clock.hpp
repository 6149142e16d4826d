#pragma once

#include <algorithm>
#include <limits>

namespace arpg::core {

// ============================================================================
// GameClock - Splits variable frame time into whole fixed steps
// ============================================================================

class GameClock {
public:
    explicit GameClock(double fixed_dt = 1.0 / 60.0, double max_backlog = 0.25)
        : m_fixed_dt(fixed_dt > 0.0 ? fixed_dt : 1.0 / 60.0)
        , m_max_backlog(max_backlog)
    {}

    // Add frame time and return how many fixed steps are due.
    // The backlog is capped so a long stall doesn't snowball.
    int accumulate(double frame_dt) {
        if (frame_dt > 0.0) {
            m_backlog = std::min(m_backlog + frame_dt, m_max_backlog);
        }

        int steps = 0;
        while (m_backlog >= m_fixed_dt) {
            m_backlog -= m_fixed_dt;
            ++steps;
        }
        return steps;
    }

    double fixed_dt() const { return m_fixed_dt; }

    // Leftover fraction of a step, for interpolation (0 to 1)
    double alpha() const { return m_backlog / m_fixed_dt; }

    void reset() { m_backlog = 0.0; }

private:
    double m_fixed_dt;
    double m_max_backlog;
    double m_backlog = 0.0;
};

// ============================================================================
// SimulationClock - Monotonic game time driven only by fixed steps
// ============================================================================

// Every time-windowed check (kill streaks, "recently hit", buff windows) reads
// this clock. It never looks at wall-clock time.
class SimulationClock {
public:
    // Sentinel for "event never happened"
    static constexpr double Never = -std::numeric_limits<double>::infinity();

    double now() const { return m_now; }

    // Negative steps are ignored, the clock is monotonic
    void advance(double dt) {
        if (dt > 0.0) m_now += dt;
    }

    // Seconds since a recorded timestamp (infinity if it never happened)
    double since(double timestamp) const { return m_now - timestamp; }

    void reset() { m_now = 0.0; }

private:
    double m_now = 0.0;
};

} // namespace arpg::core
