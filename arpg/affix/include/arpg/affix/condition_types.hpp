#pragma once

#include <arpg/affix/world_view.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace arpg::affix {

// ============================================================================
// ConditionType - Closed set of gameplay conditions
// ============================================================================

enum class ConditionType : uint8_t {
    WhileMoving,
    WhileStationary,
    OnKill,
    OnHit,                  // Evaluated at the point of impact, never globally
    LowHp,
    FullHp,
    AfterSkill,
    AfterMovementSkill,
    DistanceClose,
    DistanceFar,
    StatBreakpoint,
    KillStreak,
    StatusOnTarget,         // Evaluated at the point of impact, never globally
    MultiHit,
    RecentlyHit,
    NoDamageTaken,

    Count
};

inline constexpr size_t ConditionTypeCount = static_cast<size_t>(ConditionType::Count);

// "while-moving", "kill-streak", ...
std::string_view get_condition_name(ConditionType type);
std::optional<ConditionType> parse_condition_type(std::string_view name);

// ============================================================================
// Condition parameters - one struct per condition family
// ============================================================================

struct NoParams {
    bool operator==(const NoParams&) const = default;
};

struct StationaryParams {
    float min_stationary_ms = 500.0f;
    bool operator==(const StationaryParams&) const = default;
};

struct HealthThresholdParams {
    float threshold = 0.3f;                 // current / max at or below this
    bool operator==(const HealthThresholdParams&) const = default;
};

struct DistanceParams {
    float tile_radius = 3.0f;
    bool operator==(const DistanceParams&) const = default;
};

struct StatBreakpointParams {
    Attribute stat = Attribute::Dexterity;
    float threshold = 0.0f;
    bool operator==(const StatBreakpointParams&) const = default;
};

struct KillStreakParams {
    int kills_required = 3;
    double window_seconds = 4.0;
    bool operator==(const KillStreakParams&) const = default;
};

struct MultiHitParams {
    int hit_threshold = 3;
    bool operator==(const MultiHitParams&) const = default;
};

struct NoDamageTakenParams {
    double seconds = 5.0;
    bool operator==(const NoDamageTakenParams&) const = default;
};

struct StatusOnTargetParams {
    std::vector<StatusType> statuses;       // Any of these on the target
    bool operator==(const StatusOnTargetParams&) const = default;
};

struct OnHitParams {
    float duration = 2.0f;                  // Duration of the applied status
    bool operator==(const OnHitParams&) const = default;
};

using ConditionParams = std::variant<
    NoParams,
    StationaryParams,
    HealthThresholdParams,
    DistanceParams,
    StatBreakpointParams,
    KillStreakParams,
    MultiHitParams,
    NoDamageTakenParams,
    StatusOnTargetParams,
    OnHitParams
>;

// Parameters used when a definition doesn't supply any
ConditionParams default_condition_params(ConditionType type);

// Whether the params alternative is the one this condition reads
bool params_match_condition(ConditionType type, const ConditionParams& params);

// Typed access falling back to the condition's defaults on a mismatch
template<typename T>
T params_or_default(ConditionType type, const ConditionParams& params) {
    if (const T* p = std::get_if<T>(&params)) {
        return *p;
    }
    ConditionParams fallback = default_condition_params(type);
    if (const T* p = std::get_if<T>(&fallback)) {
        return *p;
    }
    return T{};
}

// ============================================================================
// Condition - Type plus parameters
// ============================================================================

struct Condition {
    ConditionType type = ConditionType::WhileMoving;
    ConditionParams params = NoParams{};

    bool operator==(const Condition&) const = default;
};

inline Condition make_condition(ConditionType type) {
    return Condition{type, default_condition_params(type)};
}

template<typename P>
Condition make_condition(ConditionType type, P params) {
    return Condition{type, ConditionParams{std::move(params)}};
}

} // namespace arpg::affix
