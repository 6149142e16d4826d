#pragma once

namespace arpg::stats {

// ============================================================================
// FinalStats - Derived player stats consumed by combat, movement and UI
// ============================================================================

struct FinalStats {
    // Offensive
    float damage = 10.0f;                   // Per hit, rounded
    float attack_speed = 1.0f;              // Multiplier on fire rate
    float projectile_speed = 1.0f;          // Multiplier on base projectile speed
    float crit_chance = 0.0f;               // [0, 1]
    float crit_multiplier = 1.5f;

    // Defensive
    float max_hp = 100.0f;                  // Rounded
    float armor = 0.0f;
    float damage_reduction = 0.0f;          // [0, 1)
    float hp_regen = 0.0f;                  // Per second

    // Utility
    float move_speed = 200.0f;              // Pixels per second
    float cooldown_reduction = 0.0f;        // [0, cap]
    float xp_multiplier = 1.0f;
    float gold_multiplier = 1.0f;

    bool operator==(const FinalStats& other) const = default;
};

} // namespace arpg::stats
