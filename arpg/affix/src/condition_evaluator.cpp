#include <arpg/affix/condition_evaluator.hpp>

namespace arpg::affix {

bool has_enemy_within_radius(const EnemySource* enemies, const core::Vec2& position, float radius_px) {
    if (!enemies) return false;

    bool found = false;
    enemies->for_each_enemy([&](const EnemyInfo& enemy) {
        if (core::within_radius(position, enemy.position, radius_px)) {
            found = true;
            return false;
        }
        return true;
    });
    return found;
}

bool evaluate_condition(ConditionType type, const ConditionParams& params, const EvaluationContext& ctx) {
    if (!ctx.player) return false;

    const auto& tracker = ctx.tracker;
    const auto& tuning = ctx.tuning;
    const double now = tracker.now();

    switch (type) {
        case ConditionType::WhileMoving:
            return tracker.is_moving();

        case ConditionType::WhileStationary: {
            auto p = params_or_default<StationaryParams>(type, params);
            return tracker.stationary_time_ms() >= p.min_stationary_ms;
        }

        case ConditionType::OnKill:
            return !tracker.kill_timestamps().empty() &&
                   now - tracker.last_kill_time() < tuning.on_kill_window;

        case ConditionType::OnHit:
        case ConditionType::StatusOnTarget:
            return false;

        case ConditionType::LowHp: {
            auto p = params_or_default<HealthThresholdParams>(type, params);
            Health hp = ctx.player->health();
            return hp.max > 0.0f && hp.current / hp.max <= p.threshold;
        }

        case ConditionType::FullHp: {
            Health hp = ctx.player->health();
            return hp.current >= hp.max;
        }

        case ConditionType::AfterSkill:
            return now - tracker.last_skill_time() < tuning.event_window;

        case ConditionType::AfterMovementSkill:
            return now - tracker.last_movement_skill_time() < tuning.event_window;

        case ConditionType::DistanceClose: {
            auto p = params_or_default<DistanceParams>(type, params);
            return has_enemy_within_radius(ctx.enemies, ctx.player->position(), p.tile_radius * tuning.tile_size);
        }

        case ConditionType::DistanceFar: {
            auto p = params_or_default<DistanceParams>(type, params);
            return !has_enemy_within_radius(ctx.enemies, ctx.player->position(), p.tile_radius * tuning.tile_size);
        }

        case ConditionType::StatBreakpoint: {
            auto p = params_or_default<StatBreakpointParams>(type, params);
            return ctx.player->attributes().get(p.stat) >= p.threshold;
        }

        case ConditionType::KillStreak: {
            auto p = params_or_default<KillStreakParams>(type, params);
            return tracker.kills_since(now - p.window_seconds) >= p.kills_required;
        }

        case ConditionType::MultiHit: {
            auto p = params_or_default<MultiHitParams>(type, params);
            return tracker.last_multi_hit_count() >= p.hit_threshold &&
                   now - tracker.last_multi_hit_time() < tuning.event_window;
        }

        case ConditionType::RecentlyHit:
            return now - tracker.last_damage_time() < tuning.event_window;

        case ConditionType::NoDamageTaken: {
            auto p = params_or_default<NoDamageTakenParams>(type, params);
            return now - tracker.last_damage_time() >= p.seconds;
        }

        default:
            return false;
    }
}

} // namespace arpg::affix
