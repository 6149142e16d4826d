#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <cstdint>

namespace arpg::affix {

// ============================================================================
// ActiveBuff - A timed conditional bonus currently running
// ============================================================================

struct ActiveBuff {
    std::string stat_key;
    float value = 0.0f;
    double duration = 0.0;              // Nominal duration, restored on refresh
    double remaining_seconds = 0.0;

    bool is_expired() const { return remaining_seconds <= 0.0; }
};

enum class BuffActivation : uint8_t {
    Applied,        // New entry
    Refreshed,      // Existing entry, timer reset and value overwritten
    Ignored         // Non-positive duration, nothing stored
};

// ============================================================================
// BuffTimerManager - At most one buff per stat key, refresh-not-stack
// ============================================================================

class BuffTimerManager {
public:
    BuffActivation activate(std::string_view stat_key, float value, double duration);

    // Count down and drop buffs at or below zero. Returns how many expired.
    size_t tick(double dt);

    const ActiveBuff* get(std::string_view stat_key) const;
    bool is_active(std::string_view stat_key) const;

    size_t size() const { return m_buffs.size(); }
    bool empty() const { return m_buffs.empty(); }
    void clear() { m_buffs.clear(); }

    const std::map<std::string, ActiveBuff, std::less<>>& buffs() const { return m_buffs; }

private:
    std::map<std::string, ActiveBuff, std::less<>> m_buffs;
};

} // namespace arpg::affix
