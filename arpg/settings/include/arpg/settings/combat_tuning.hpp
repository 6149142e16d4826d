#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace arpg::settings {

// ============================================================================
// CombatTuning - Designer-tunable constants of the stat engine
// ============================================================================

struct CombatTuning {
    // ========================================================================
    // Base values
    // ========================================================================

    float base_max_hp = 100.0f;
    float base_move_speed = 200.0f;         // Pixels per second
    float base_crit_multiplier = 1.5f;
    float unarmed_weapon_damage = 10.0f;    // Used when no weapon is equipped

    // ========================================================================
    // Attribute scaling (per allocated point)
    // ========================================================================

    float hp_per_vitality = 10.0f;
    float damage_per_intelligence = 0.08f;
    float attack_speed_per_dexterity = 0.03f;
    float projectile_speed_per_dexterity = 0.05f;
    float cooldown_per_focus = 0.05f;

    // ========================================================================
    // Caps and curves
    // ========================================================================

    float cooldown_reduction_cap = 0.4f;
    float armor_constant = 100.0f;          // armor / (armor + constant)

    // ========================================================================
    // Conditional tracking
    // ========================================================================

    double fixed_timestep = 1.0 / 60.0;     // Simulation step driven from frame time
    float tile_size = 32.0f;                // Pixels per tile for distance conditions
    float moving_speed_threshold = 0.1f;    // Velocity above this counts as moving
    double kill_history_seconds = 10.0;     // Kill timestamps older than this are pruned
    double on_kill_window = 0.02;           // "Kill happened this tick"
    double event_window = 0.1;              // after-skill, recently-hit, multi-hit
    float extra_projectile_dexterity = 25.0f;

    // ========================================================================
    // Methods
    // ========================================================================

    void validate();
    bool operator==(const CombatTuning& other) const = default;
};

// ============================================================================
// Serialization
// ============================================================================

// Missing keys keep their defaults; the result is validated
CombatTuning combat_tuning_from_json(const nlohmann::json& j);
nlohmann::json combat_tuning_to_json(const CombatTuning& tuning);

// Load from file, nullopt if the file is unreadable or malformed
std::optional<CombatTuning> load_combat_tuning(const std::string& path);

} // namespace arpg::settings
