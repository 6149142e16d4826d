#pragma once

#include <arpg/affix/condition_tracker.hpp>
#include <arpg/affix/condition_types.hpp>
#include <arpg/affix/world_view.hpp>
#include <arpg/settings/combat_tuning.hpp>

namespace arpg::affix {

// Everything a predicate may read. player and enemies may be null.
struct EvaluationContext {
    const ConditionalStateTracker& tracker;
    const PlayerView* player = nullptr;
    const EnemySource* enemies = nullptr;
    const settings::CombatTuning& tuning;
};

// Pure predicate over the context. Missing player or unknown type -> false.
// On-hit and status-on-target are per-impact conditions and always false here.
bool evaluate_condition(ConditionType type, const ConditionParams& params, const EvaluationContext& ctx);

inline bool evaluate_condition(const Condition& condition, const EvaluationContext& ctx) {
    return evaluate_condition(condition.type, condition.params, ctx);
}

// Inclusive radius in pixels, linear scan. False with no enemy source.
bool has_enemy_within_radius(const EnemySource* enemies, const core::Vec2& position, float radius_px);

} // namespace arpg::affix
