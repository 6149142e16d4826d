#include <arpg/affix/affix_catalog.hpp>
#include <arpg/core/log.hpp>
#include <utility>

namespace arpg::affix {

// ============================================================================
// Registration
// ============================================================================

bool AffixCatalog::register_definition(AffixDefinition def, std::string* out_error) {
    if (def.min_value > def.max_value) {
        core::log(core::LogLevel::Warn, "[Catalog] Affix '{}' has min > max, swapping", def.id);
        std::swap(def.min_value, def.max_value);
    }

    auto errors = validate_affix_definition(def);
    if (!errors.empty()) {
        for (const auto& err : errors) {
            core::log(core::LogLevel::Error, "[Catalog] {}", err);
        }
        if (out_error) {
            *out_error = errors.front();
        }
        return false;
    }

    // One definition per stat key, equipped affixes resolve through it
    auto owner = m_stat_to_id.find(def.stat_key);
    if (owner != m_stat_to_id.end() && owner->second != def.id) {
        std::string error = "Affix '" + def.id + "' stat '" + def.stat_key +
                            "' is already used by affix '" + owner->second + "'";
        core::log(core::LogLevel::Error, "[Catalog] {}", error);
        if (out_error) {
            *out_error = error;
        }
        return false;
    }

    auto existing = m_definitions.find(def.id);
    if (existing != m_definitions.end()) {
        core::log(core::LogLevel::Warn, "[Catalog] Replacing affix '{}'", def.id);
        auto old_key = m_stat_to_id.find(existing->second.stat_key);
        if (old_key != m_stat_to_id.end() && old_key->second == def.id) {
            m_stat_to_id.erase(old_key);
        }
    }

    m_stat_to_id[def.stat_key] = def.id;
    std::string id = def.id;
    m_definitions[id] = std::move(def);
    return true;
}

void AffixCatalog::clear() {
    m_definitions.clear();
    m_stat_to_id.clear();
}

// ============================================================================
// Lookup
// ============================================================================

const AffixDefinition* AffixCatalog::get(std::string_view id) const {
    auto it = m_definitions.find(id);
    return it != m_definitions.end() ? &it->second : nullptr;
}

const AffixDefinition* AffixCatalog::find_by_stat(std::string_view stat_key) const {
    auto it = m_stat_to_id.find(stat_key);
    if (it == m_stat_to_id.end()) return nullptr;
    return get(it->second);
}

std::vector<const AffixDefinition*> AffixCatalog::get_by_category(items::AffixCategory category) const {
    std::vector<const AffixDefinition*> result;
    for (const auto& [id, def] : m_definitions) {
        if (def.category == category) {
            result.push_back(&def);
        }
    }
    return result;
}

std::vector<std::string> AffixCatalog::get_all_ids() const {
    std::vector<std::string> ids;
    ids.reserve(m_definitions.size());
    for (const auto& [id, def] : m_definitions) {
        ids.push_back(id);
    }
    return ids;
}

void AffixCatalog::each(const std::function<void(const AffixDefinition&)>& fn) const {
    for (const auto& [id, def] : m_definitions) {
        fn(def);
    }
}

// ============================================================================
// JSON Loading
// ============================================================================

data::LoadResult<std::string> AffixCatalog::load_from_json(const nlohmann::json& root) {
    std::string key = (root.is_object() && root.contains("affixes")) ? "affixes" : "";
    auto parsed = data::read_json_array<AffixDefinition>(root, deserialize_affix_definition, key);

    data::LoadResult<std::string> result;
    result.errors = std::move(parsed.errors);
    result.warnings = std::move(parsed.warnings);
    result.total_processed = parsed.total_processed;

    for (auto& def : parsed.items) {
        std::string id = def.id;
        std::string error;
        if (register_definition(std::move(def), &error)) {
            result.items.push_back(std::move(id));
        } else {
            result.errors.push_back(error);
        }
    }

    return result;
}

data::LoadResult<std::string> AffixCatalog::load_from_file(const std::string& path) {
    auto json_opt = data::load_json_file(path);
    if (!json_opt) {
        data::LoadResult<std::string> result;
        result.errors.push_back("Failed to load or parse file: " + path);
        return result;
    }

    auto result = load_from_json(*json_opt);
    data::log_load_result(result, path, "Catalog");
    return result;
}

// ============================================================================
// Built-in Content
// ============================================================================

namespace {

using items::AffixCategory;

AffixDefinition regular(const char* id, const char* name, const char* stat, AffixCategory category,
                        float min_value, float max_value, int weight) {
    AffixDefinition def;
    def.id = id;
    def.name = name;
    def.stat_key = stat;
    def.category = category;
    def.min_value = min_value;
    def.max_value = max_value;
    def.weight = weight;
    return def;
}

AffixDefinition conditional(const char* id, const char* name, const char* stat, Condition condition,
                            float min_value, float max_value, int weight, double buff_duration = 0.0) {
    AffixDefinition def = regular(id, name, stat, AffixCategory::Conditional, min_value, max_value, weight);
    def.condition = std::move(condition);
    def.buff_duration = buff_duration;
    return def;
}

} // anonymous namespace

void register_builtin_affixes(AffixCatalog& catalog) {
    using CT = ConditionType;
    std::vector<AffixDefinition> defs;

    // Offensive
    defs.push_back(regular("flat_damage", "Added Damage", "flatDamage", AffixCategory::Offensive, 5, 25, 100));
    defs.push_back(regular("pct_damage", "Increased Damage", "percentDamage", AffixCategory::Offensive, 5, 20, 80));
    defs.push_back(regular("pct_attack_speed", "Increased Attack Speed", "percentAttackSpeed", AffixCategory::Offensive, 3, 15, 70));
    defs.push_back(regular("pct_projectile_speed", "Increased Projectile Speed", "percentProjectileSpeed", AffixCategory::Offensive, 5, 20, 60));
    defs.push_back(regular("pct_crit_chance", "Increased Critical Chance", "percentCritChance", AffixCategory::Offensive, 2, 8, 50));

    // Defensive
    defs.push_back(regular("flat_hp", "Added Health", "flatHP", AffixCategory::Defensive, 10, 50, 100));
    defs.push_back(regular("pct_hp", "Increased Health", "percentHP", AffixCategory::Defensive, 5, 15, 80));
    defs.push_back(regular("flat_armor", "Added Armor", "flatArmor", AffixCategory::Defensive, 5, 20, 90));
    defs.push_back(regular("hp_regen", "Health Regeneration", "hpRegen", AffixCategory::Defensive, 1, 5, 60));

    // Utility
    defs.push_back(regular("pct_move_speed", "Increased Movement Speed", "percentMoveSpeed", AffixCategory::Utility, 3, 10, 70));
    defs.push_back(regular("pct_xp_gain", "Increased XP Gain", "percentXPGain", AffixCategory::Utility, 5, 15, 60));
    defs.push_back(regular("pct_gold_find", "Increased Gold Find", "percentGoldFind", AffixCategory::Utility, 10, 30, 80));
    defs.push_back(regular("pct_cdr", "Cooldown Reduction", "percentCDR", AffixCategory::Utility, 3, 10, 50));

    // Legacy conditionals
    defs.push_back(conditional("cond_moving_damage", "+{value}% Damage while moving", "condMovingDamage",
                               make_condition(CT::WhileMoving), 15, 15, 25));
    defs.push_back(conditional("cond_on_kill_heal", "Heal {value}% of max HP on kill", "condOnKillHeal",
                               make_condition(CT::OnKill), 2, 2, 25));
    defs.push_back(conditional("cond_low_hp_damage", "+{value}% Damage while below 30% HP", "condLowHPDamage",
                               make_condition(CT::LowHp, HealthThresholdParams{0.3f}), 25, 25, 25));
    defs.push_back(conditional("cond_post_skill_atkspd", "+{value}% Attack Speed after using a skill", "condPostSkillAtkSpd",
                               make_condition(CT::AfterSkill), 10, 10, 25, 3.0));

    // Movement and positioning
    defs.push_back(conditional("cond_stationary_damage", "+{value}% Damage while stationary", "condStationaryDamage",
                               make_condition(CT::WhileStationary, StationaryParams{500.0f}), 12, 20, 20));
    defs.push_back(conditional("cond_close_range_armor", "+{value} Armor with an enemy nearby", "condCloseRangeArmor",
                               make_condition(CT::DistanceClose, DistanceParams{3.0f}), 15, 35, 20));
    defs.push_back(conditional("cond_far_range_proj_speed", "+{value}% Projectile Speed at range", "condFarRangeProjSpeed",
                               make_condition(CT::DistanceFar, DistanceParams{5.0f}), 15, 30, 18));

    // Kill momentum
    defs.push_back(conditional("cond_kill_streak_speed", "+{value}% Movement Speed after 3 kills in 4s", "condKillStreakSpeed",
                               make_condition(CT::KillStreak, KillStreakParams{3, 4.0}), 15, 25, 15, 5.0));
    defs.push_back(conditional("cond_kill_streak_damage", "+{value}% Damage after 5 kills in 6s", "condKillStreakDamage",
                               make_condition(CT::KillStreak, KillStreakParams{5, 6.0}), 15, 25, 12, 4.0));
    defs.push_back(conditional("cond_on_kill_cdr", "Reduce cooldowns by {value}% on kill", "condOnKillCDR",
                               make_condition(CT::OnKill), 3, 8, 15));

    // Health state
    defs.push_back(conditional("cond_full_hp_attack_speed", "+{value}% Attack Speed at full health", "condFullHPAtkSpd",
                               make_condition(CT::FullHp), 8, 18, 20));
    defs.push_back(conditional("cond_low_hp_regen", "+{value} Health Regen below 30% HP", "condLowHPRegen",
                               make_condition(CT::LowHp, HealthThresholdParams{0.3f}), 8, 20, 20));
    defs.push_back(conditional("cond_full_hp_flat_damage", "+{value} Damage at full health", "condFullHPFlatDamage",
                               make_condition(CT::FullHp), 8, 20, 18));

    // Skill synergy
    defs.push_back(conditional("cond_after_movement_skill_damage", "+{value}% Damage after a movement skill", "condAfterMoveDamage",
                               make_condition(CT::AfterMovementSkill), 12, 22, 18, 3.0));
    defs.push_back(conditional("cond_multi_hit_bonus", "+{value}% Damage after hitting 3 enemies at once", "condMultiHitDamage",
                               make_condition(CT::MultiHit, MultiHitParams{3}), 10, 20, 15, 4.0));
    defs.push_back(conditional("cond_after_skill_armor", "+{value} Armor after using a skill", "condAfterSkillArmor",
                               make_condition(CT::AfterSkill), 15, 30, 20, 3.0));

    // Status synergy
    defs.push_back(conditional("cond_hit_burning_bonus", "+{value}% Damage against burning enemies", "condHitBurningDamage",
                               make_condition(CT::StatusOnTarget, StatusOnTargetParams{{StatusType::Burn}}), 12, 22, 15));
    defs.push_back(conditional("cond_hit_slowed_speed", "+{value}% Attack Speed against slowed enemies", "condHitSlowedAtkSpd",
                               make_condition(CT::StatusOnTarget, StatusOnTargetParams{{StatusType::Slow, StatusType::Chill}}),
                               8, 16, 15));
    defs.push_back(conditional("cond_on_hit_apply_slow", "{value}% chance to slow on hit", "condOnHitSlow",
                               make_condition(CT::OnHit, OnHitParams{2.0f}), 6, 14, 18));

    // Attribute breakpoints
    defs.push_back(conditional("cond_high_vit_regen", "+{value} Health Regen with 20+ Vitality", "condHighVitRegen",
                               make_condition(CT::StatBreakpoint, StatBreakpointParams{Attribute::Vitality, 20.0f}), 5, 12, 15));
    defs.push_back(conditional("cond_high_focus_cdr", "+{value}% Cooldown Reduction with 15+ Focus", "condHighFocusCDR",
                               make_condition(CT::StatBreakpoint, StatBreakpointParams{Attribute::Focus, 15.0f}), 5, 10, 12));
    defs.push_back(conditional("cond_high_dex_proj_count", "+1 Projectile with 25+ Dexterity", "condHighDexProjCount",
                               make_condition(CT::StatBreakpoint, StatBreakpointParams{Attribute::Dexterity, 25.0f}), 1, 1, 8));

    // Damage taken
    defs.push_back(conditional("cond_recently_hit_armor", "+{value} Armor when recently hit", "condRecentlyHitArmor",
                               make_condition(CT::RecentlyHit), 20, 40, 20, 4.0));
    defs.push_back(conditional("cond_no_damage_taken_speed", "+{value}% Movement Speed after 5s without damage", "condNoDamageTakenSpeed",
                               make_condition(CT::NoDamageTaken, NoDamageTakenParams{5.0}), 15, 25, 18));

    for (auto& def : defs) {
        catalog.register_definition(std::move(def));
    }
}

const AffixCatalog& builtin_affix_catalog() {
    static const AffixCatalog s_catalog = [] {
        AffixCatalog catalog;
        register_builtin_affixes(catalog);
        return catalog;
    }();
    return s_catalog;
}

} // namespace arpg::affix
