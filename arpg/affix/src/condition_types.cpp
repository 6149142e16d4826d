#include <arpg/affix/condition_types.hpp>
#include <array>

namespace arpg::affix {

namespace {

constexpr std::array<std::string_view, ConditionTypeCount> k_condition_names = {
    "while-moving",
    "while-stationary",
    "on-kill",
    "on-hit",
    "low-hp",
    "full-hp",
    "after-skill",
    "after-movement-skill",
    "distance-close",
    "distance-far",
    "stat-breakpoint",
    "kill-streak",
    "status-on-target",
    "multi-hit",
    "recently-hit",
    "no-damage-taken",
};

} // anonymous namespace

std::string_view get_condition_name(ConditionType type) {
    if (type == ConditionType::Count) return "unknown";
    return k_condition_names[static_cast<size_t>(type)];
}

std::optional<ConditionType> parse_condition_type(std::string_view name) {
    for (size_t i = 0; i < ConditionTypeCount; ++i) {
        if (k_condition_names[i] == name) {
            return static_cast<ConditionType>(i);
        }
    }
    return std::nullopt;
}

ConditionParams default_condition_params(ConditionType type) {
    switch (type) {
        case ConditionType::WhileStationary:
            return StationaryParams{};
        case ConditionType::LowHp:
            return HealthThresholdParams{};
        case ConditionType::DistanceClose:
            return DistanceParams{3.0f};
        case ConditionType::DistanceFar:
            return DistanceParams{5.0f};
        case ConditionType::StatBreakpoint:
            return StatBreakpointParams{};
        case ConditionType::KillStreak:
            return KillStreakParams{};
        case ConditionType::MultiHit:
            return MultiHitParams{};
        case ConditionType::NoDamageTaken:
            return NoDamageTakenParams{};
        case ConditionType::StatusOnTarget:
            return StatusOnTargetParams{};
        case ConditionType::OnHit:
            return OnHitParams{};
        case ConditionType::WhileMoving:
        case ConditionType::OnKill:
        case ConditionType::FullHp:
        case ConditionType::AfterSkill:
        case ConditionType::AfterMovementSkill:
        case ConditionType::RecentlyHit:
        case ConditionType::Count:
            break;
    }
    return NoParams{};
}

bool params_match_condition(ConditionType type, const ConditionParams& params) {
    return default_condition_params(type).index() == params.index();
}

} // namespace arpg::affix
