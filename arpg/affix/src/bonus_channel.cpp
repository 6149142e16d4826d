#include <arpg/affix/bonus_channel.hpp>
#include <cmath>

namespace arpg::affix {

namespace {

constexpr std::array<std::string_view, BonusChannelCount> k_channel_keys = {
    "flatDamage",
    "percentDamage",
    "percentAttackSpeed",
    "percentProjectileSpeed",
    "percentCritChance",
    "flatHP",
    "percentHP",
    "flatArmor",
    "hpRegen",
    "percentMoveSpeed",
    "percentXPGain",
    "percentGoldFind",
    "percentCDR",
};

} // anonymous namespace

std::string_view get_channel_stat_key(BonusChannel channel) {
    if (channel == BonusChannel::Count) return {};
    return k_channel_keys[static_cast<size_t>(channel)];
}

std::optional<BonusChannel> find_passive_channel(std::string_view stat_key) {
    for (size_t i = 0; i < BonusChannelCount; ++i) {
        if (k_channel_keys[i] == stat_key) {
            return static_cast<BonusChannel>(i);
        }
    }
    return std::nullopt;
}

// ============================================================================
// BonusTotals
// ============================================================================

void BonusTotals::add(BonusChannel channel, float value) {
    if (channel == BonusChannel::Count || !std::isfinite(value)) return;
    values[static_cast<size_t>(channel)] += value;
}

bool BonusTotals::is_zero() const {
    for (float v : values) {
        if (v != 0.0f) return false;
    }
    return true;
}

BonusTotals& BonusTotals::operator+=(const BonusTotals& other) {
    for (size_t i = 0; i < BonusChannelCount; ++i) {
        values[i] += other.values[i];
    }
    return *this;
}

} // namespace arpg::affix
