#include <arpg/settings/combat_tuning.hpp>
#include <arpg/data/json_loader.hpp>
#include <arpg/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace arpg::settings {

// ============================================================================
// CombatTuning
// ============================================================================

void CombatTuning::validate() {
    base_max_hp = std::max(base_max_hp, 1.0f);
    base_move_speed = std::max(base_move_speed, 0.0f);
    base_crit_multiplier = std::max(base_crit_multiplier, 1.0f);
    unarmed_weapon_damage = std::max(unarmed_weapon_damage, 0.0f);

    hp_per_vitality = std::max(hp_per_vitality, 0.0f);
    damage_per_intelligence = std::max(damage_per_intelligence, 0.0f);
    attack_speed_per_dexterity = std::max(attack_speed_per_dexterity, 0.0f);
    projectile_speed_per_dexterity = std::max(projectile_speed_per_dexterity, 0.0f);
    cooldown_per_focus = std::max(cooldown_per_focus, 0.0f);

    cooldown_reduction_cap = std::clamp(cooldown_reduction_cap, 0.0f, 0.95f);
    armor_constant = std::max(armor_constant, 1.0f);

    fixed_timestep = std::clamp(fixed_timestep, 0.001, 0.25);
    tile_size = std::max(tile_size, 1.0f);
    moving_speed_threshold = std::max(moving_speed_threshold, 0.0f);
    kill_history_seconds = std::max(kill_history_seconds, 0.0);
    on_kill_window = std::max(on_kill_window, 0.0);
    event_window = std::max(event_window, 0.0);
    extra_projectile_dexterity = std::max(extra_projectile_dexterity, 0.0f);
}

// ============================================================================
// Serialization
// ============================================================================

CombatTuning combat_tuning_from_json(const nlohmann::json& j) {
    using namespace data::json_helpers;

    CombatTuning t;
    if (!j.is_object()) {
        core::log(core::LogLevel::Warn, "[Settings] Combat tuning is not an object, using defaults");
        return t;
    }

    t.base_max_hp = get_float(j, "base_max_hp", t.base_max_hp);
    t.base_move_speed = get_float(j, "base_move_speed", t.base_move_speed);
    t.base_crit_multiplier = get_float(j, "base_crit_multiplier", t.base_crit_multiplier);
    t.unarmed_weapon_damage = get_float(j, "unarmed_weapon_damage", t.unarmed_weapon_damage);

    t.hp_per_vitality = get_float(j, "hp_per_vitality", t.hp_per_vitality);
    t.damage_per_intelligence = get_float(j, "damage_per_intelligence", t.damage_per_intelligence);
    t.attack_speed_per_dexterity = get_float(j, "attack_speed_per_dexterity", t.attack_speed_per_dexterity);
    t.projectile_speed_per_dexterity = get_float(j, "projectile_speed_per_dexterity", t.projectile_speed_per_dexterity);
    t.cooldown_per_focus = get_float(j, "cooldown_per_focus", t.cooldown_per_focus);

    t.cooldown_reduction_cap = get_float(j, "cooldown_reduction_cap", t.cooldown_reduction_cap);
    t.armor_constant = get_float(j, "armor_constant", t.armor_constant);

    t.fixed_timestep = get_double(j, "fixed_timestep", t.fixed_timestep);
    t.tile_size = get_float(j, "tile_size", t.tile_size);
    t.moving_speed_threshold = get_float(j, "moving_speed_threshold", t.moving_speed_threshold);
    t.kill_history_seconds = get_double(j, "kill_history_seconds", t.kill_history_seconds);
    t.on_kill_window = get_double(j, "on_kill_window", t.on_kill_window);
    t.event_window = get_double(j, "event_window", t.event_window);
    t.extra_projectile_dexterity = get_float(j, "extra_projectile_dexterity", t.extra_projectile_dexterity);

    t.validate();
    return t;
}

nlohmann::json combat_tuning_to_json(const CombatTuning& t) {
    return nlohmann::json{
        {"base_max_hp", t.base_max_hp},
        {"base_move_speed", t.base_move_speed},
        {"base_crit_multiplier", t.base_crit_multiplier},
        {"unarmed_weapon_damage", t.unarmed_weapon_damage},
        {"hp_per_vitality", t.hp_per_vitality},
        {"damage_per_intelligence", t.damage_per_intelligence},
        {"attack_speed_per_dexterity", t.attack_speed_per_dexterity},
        {"projectile_speed_per_dexterity", t.projectile_speed_per_dexterity},
        {"cooldown_per_focus", t.cooldown_per_focus},
        {"cooldown_reduction_cap", t.cooldown_reduction_cap},
        {"armor_constant", t.armor_constant},
        {"fixed_timestep", t.fixed_timestep},
        {"tile_size", t.tile_size},
        {"moving_speed_threshold", t.moving_speed_threshold},
        {"kill_history_seconds", t.kill_history_seconds},
        {"on_kill_window", t.on_kill_window},
        {"event_window", t.event_window},
        {"extra_projectile_dexterity", t.extra_projectile_dexterity}
    };
}

std::optional<CombatTuning> load_combat_tuning(const std::string& path) {
    auto j = data::load_json_file(path);
    if (!j) {
        return std::nullopt;
    }

    // Accept either a bare object or {"combat": {...}}
    const nlohmann::json& section = (j->is_object() && j->contains("combat")) ? (*j)["combat"] : *j;
    CombatTuning tuning = combat_tuning_from_json(section);
    core::log(core::LogLevel::Info, "[Settings] Loaded combat tuning from {}", path);
    return tuning;
}

} // namespace arpg::settings
