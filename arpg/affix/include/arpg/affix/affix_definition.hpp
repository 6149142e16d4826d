#pragma once

#include <arpg/affix/condition_types.hpp>
#include <arpg/items/item_types.hpp>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace arpg::affix {

// ============================================================================
// AffixDefinition - Static description of an affix, authored once at startup
// ============================================================================

struct AffixDefinition {
    std::string id;                         // "cond_kill_streak_speed"
    std::string name;                       // Tooltip text
    std::string stat_key;                   // "condKillStreakSpeed"
    items::AffixCategory category = items::AffixCategory::Offensive;

    float min_value = 0.0f;
    float max_value = 0.0f;
    int weight = 0;                         // Roll weight, lower is rarer

    // Conditional affixes only
    std::optional<Condition> condition;
    double buff_duration = 0.0;             // 0 = passive, evaluated live every tick

    bool is_conditional() const { return category == items::AffixCategory::Conditional; }
    bool is_timed() const { return buff_duration > 0.0; }
};

// Problems that prevent registration. Empty means the definition is usable.
std::vector<std::string> validate_affix_definition(const AffixDefinition& def);

// ============================================================================
// JSON
// ============================================================================

// {"id", "name", "stat", "category", "min_value", "max_value", "weight",
//  "condition": {"type": "kill-streak", "killsRequired": 3, ...}, "buff_duration"}
std::optional<AffixDefinition> deserialize_affix_definition(const nlohmann::json& j, std::string& error);

// Parse the parameter object of a condition. Missing keys fall back to defaults,
// except a stat breakpoint's stat and threshold, which are required.
std::optional<ConditionParams> parse_condition_params(ConditionType type, const nlohmann::json& j, std::string& error);

} // namespace arpg::affix
