#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace arpg::affix {

// ============================================================================
// BonusChannel - Canonical additive bonus channels
// ============================================================================

enum class BonusChannel : uint8_t {
    FlatDamage = 0,
    PercentDamage,
    PercentAttackSpeed,
    PercentProjectileSpeed,
    PercentCritChance,
    FlatHP,
    PercentHP,
    FlatArmor,
    HpRegen,
    PercentMoveSpeed,
    PercentXPGain,
    PercentGoldFind,
    PercentCDR,

    Count
};

inline constexpr size_t BonusChannelCount = static_cast<size_t>(BonusChannel::Count);

// Affix stat key for a channel ("flatDamage", "percentCDR", ...)
std::string_view get_channel_stat_key(BonusChannel channel);

// Passive channel named by an affix stat key. nullopt for conditional or unknown keys.
std::optional<BonusChannel> find_passive_channel(std::string_view stat_key);

// ============================================================================
// BonusTotals - One accumulated number per channel
// ============================================================================

struct BonusTotals {
    std::array<float, BonusChannelCount> values{};

    float get(BonusChannel channel) const {
        return values[static_cast<size_t>(channel)];
    }

    // Non-finite contributions are dropped so no channel ever holds NaN/inf
    void add(BonusChannel channel, float value);

    void clear() { values.fill(0.0f); }
    bool is_zero() const;

    BonusTotals& operator+=(const BonusTotals& other);
    bool operator==(const BonusTotals& other) const = default;
};

inline BonusTotals operator+(BonusTotals lhs, const BonusTotals& rhs) {
    lhs += rhs;
    return lhs;
}

} // namespace arpg::affix
