#pragma once

#include <arpg/affix/bonus_channel.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace arpg::affix {

// ============================================================================
// Conditional stat keys read directly by combat code
// ============================================================================

namespace stat_keys {

inline constexpr std::string_view OnKillHeal = "condOnKillHeal";
inline constexpr std::string_view OnKillCooldownRefund = "condOnKillCDR";
inline constexpr std::string_view OnHitSlow = "condOnHitSlow";
inline constexpr std::string_view HighDexProjectileCount = "condHighDexProjCount";
inline constexpr std::string_view HitBurningDamage = "condHitBurningDamage";
inline constexpr std::string_view HitSlowedAttackSpeed = "condHitSlowedAtkSpd";

} // namespace stat_keys

// ============================================================================
// ConditionalRoute - Where an active conditional affix's value goes
// ============================================================================

// Procs are instantaneous triggers queried by combat code, never folded into totals
enum class ProcKind : uint8_t {
    OnKillHeal,
    OnKillCooldownRefund,
    OnHitSlow,
    ExtraProjectile
};

struct ConditionalRoute {
    std::string_view stat_key;
    bool is_proc = false;
    BonusChannel channel = BonusChannel::Count;   // Valid when !is_proc
    ProcKind proc = ProcKind::OnKillHeal;         // Valid when is_proc
};

namespace detail {

constexpr ConditionalRoute channel_route(std::string_view key, BonusChannel channel) {
    return ConditionalRoute{key, false, channel, ProcKind::OnKillHeal};
}

constexpr ConditionalRoute proc_route(std::string_view key, ProcKind proc) {
    return ConditionalRoute{key, true, BonusChannel::Count, proc};
}

} // namespace detail

inline constexpr std::array<ConditionalRoute, 24> ConditionalRoutes = {{
    // Percent damage
    detail::channel_route("condMovingDamage",       BonusChannel::PercentDamage),
    detail::channel_route("condLowHPDamage",        BonusChannel::PercentDamage),
    detail::channel_route("condStationaryDamage",   BonusChannel::PercentDamage),
    detail::channel_route("condKillStreakDamage",   BonusChannel::PercentDamage),
    detail::channel_route("condAfterMoveDamage",    BonusChannel::PercentDamage),
    detail::channel_route("condMultiHitDamage",     BonusChannel::PercentDamage),
    detail::channel_route(stat_keys::HitBurningDamage, BonusChannel::PercentDamage),

    // Flat damage
    detail::channel_route("condFullHPFlatDamage",   BonusChannel::FlatDamage),

    // Attack speed
    detail::channel_route("condPostSkillAtkSpd",    BonusChannel::PercentAttackSpeed),
    detail::channel_route("condFullHPAtkSpd",       BonusChannel::PercentAttackSpeed),
    detail::channel_route(stat_keys::HitSlowedAttackSpeed, BonusChannel::PercentAttackSpeed),

    // Projectile speed
    detail::channel_route("condFarRangeProjSpeed",  BonusChannel::PercentProjectileSpeed),

    // Armor
    detail::channel_route("condCloseRangeArmor",    BonusChannel::FlatArmor),
    detail::channel_route("condAfterSkillArmor",    BonusChannel::FlatArmor),
    detail::channel_route("condRecentlyHitArmor",   BonusChannel::FlatArmor),

    // Regen
    detail::channel_route("condLowHPRegen",         BonusChannel::HpRegen),
    detail::channel_route("condHighVitRegen",       BonusChannel::HpRegen),

    // Movement speed
    detail::channel_route("condKillStreakSpeed",    BonusChannel::PercentMoveSpeed),
    detail::channel_route("condNoDamageTakenSpeed", BonusChannel::PercentMoveSpeed),

    // Cooldown reduction
    detail::channel_route("condHighFocusCDR",       BonusChannel::PercentCDR),

    // Procs
    detail::proc_route(stat_keys::OnKillHeal,             ProcKind::OnKillHeal),
    detail::proc_route(stat_keys::OnKillCooldownRefund,   ProcKind::OnKillCooldownRefund),
    detail::proc_route(stat_keys::OnHitSlow,              ProcKind::OnHitSlow),
    detail::proc_route(stat_keys::HighDexProjectileCount, ProcKind::ExtraProjectile),
}};

namespace detail {

template<size_t N>
constexpr bool routes_are_well_formed(const std::array<ConditionalRoute, N>& routes) {
    for (size_t i = 0; i < N; ++i) {
        if (routes[i].stat_key.empty()) return false;
        if (!routes[i].is_proc && routes[i].channel == BonusChannel::Count) return false;
        for (size_t j = i + 1; j < N; ++j) {
            if (routes[i].stat_key == routes[j].stat_key) return false;
        }
    }
    return true;
}

} // namespace detail

static_assert(detail::routes_are_well_formed(ConditionalRoutes),
              "Conditional routes must have unique keys and a valid target");

constexpr std::optional<ConditionalRoute> find_conditional_route(std::string_view stat_key) {
    for (const auto& route : ConditionalRoutes) {
        if (route.stat_key == stat_key) return route;
    }
    return std::nullopt;
}

} // namespace arpg::affix
